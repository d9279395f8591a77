#pragma once

#include <string>

#include "agirace/core/entities.h"
#include "agirace/core/game_state.h"

namespace agirace {

// String <-> enum conversions shared by the content loader, saves and the CLI.
//
// The *_from_string parsers for catalog vocabulary throw std::invalid_argument
// on unknown input: a typo in content is a configuration error, not something
// to paper over with a default.

std::string faction_type_to_string(FactionType t);
FactionType faction_type_from_string(const std::string& s);

std::string branch_to_string(Branch b);
Branch branch_from_string(const std::string& s);

std::string openness_to_string(Openness o);
Openness openness_from_string(const std::string& s);

std::string resource_key_to_string(ResourceKey k);
ResourceKey resource_key_from_string(const std::string& s);

std::string stat_key_to_string(StatKey k);
StatKey stat_key_from_string(const std::string& s);

std::string tech_effect_type_to_string(TechEffectType t);
TechEffectType tech_effect_type_from_string(const std::string& s);

// Unknown strings map to None.
std::string victory_type_to_string(VictoryType v);
VictoryType victory_type_from_string(const std::string& s);

std::string loss_type_to_string(LossType l);
LossType loss_type_from_string(const std::string& s);

} // namespace agirace
