#pragma once

#include <string>
#include <vector>

#include "agirace/core/simulation.h"

namespace agirace {

// Deterministic rule-based action selection for non-player factions.
//
// Draws come from `rng`; the same state and draw sequence always yield the
// same choices. Returns at most cfg.max_actions_per_turn choices, and none
// for an unknown faction id.
//
// Throws std::runtime_error if the faction has no template (and hence no
// strategy profile) in the content.
std::vector<ActionChoice> decide_actions_heuristic(const GameState& state, const ContentDB& content,
                                                   const SimConfig& cfg, const std::string& faction_id,
                                                   const RandomSource& rng);

// Runs the heuristic for every faction in id order, skipping `skip_faction_id`
// (typically the player).
ChoiceMap decide_all_actions(const GameState& state, const ContentDB& content, const SimConfig& cfg,
                             const RandomSource& rng, const std::string& skip_faction_id = "");

} // namespace agirace
