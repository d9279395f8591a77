#pragma once

#include <string>

#include "agirace/core/game_state.h"
#include "agirace/core/sim_config.h"

namespace agirace {

// Builds the turn-0 state from the content's faction templates.
//
// Research pools, exposure and relationships start empty; public opinion
// defaults to 50 for governments and to trust for labs; security level to 3
// for governments and 2 for labs. Global safety is computed from the result.
//
// Throws std::runtime_error if player_faction_id is non-empty and unknown.
GameState make_initial_state(const ContentDB& content, const SimConfig& cfg,
                             const std::string& player_faction_id = "");

} // namespace agirace
