#pragma once

#include <string>
#include <vector>

#include "agirace/core/game_state.h"
#include "agirace/core/turn_log.h"

namespace agirace {

// True when every prerequisite of `tech` is already unlocked by `f`.
bool prereqs_met(const FactionState& f, const TechNode& tech);

// Applies a tech's effects to the faction, in declaration order.
void apply_tech_effects(FactionState& f, const TechNode& tech);

// Greedily unlocks affordable techs.
//
// Per branch, repeatedly picks the first node in catalog order that is not yet
// unlocked, has all prerequisites unlocked and costs no more than the branch's
// research pool; pays the cost, records the unlock, applies effects and logs
// it. Stops when nothing in the branch is affordable. Because unlocked techs
// are skipped before affordability is considered, no node is unlocked twice.
//
// Returns the ids unlocked by this call, in order.
std::vector<std::string> unlock_available_techs(const ContentDB& content, FactionState& f, TurnLog& log);

} // namespace agirace
