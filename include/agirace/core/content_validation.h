#pragma once

#include <string>
#include <vector>

#include "agirace/core/game_state.h"

namespace agirace {

// Validate a ContentDB for internal consistency.
//
// Returns a list of human-readable error strings. An empty list means "valid".
// Checks include duplicate ids, unknown prerequisites, prerequisite cycles,
// non-positive tech costs, actions nobody may take, faction-specific actions
// bound to unknown factions and out-of-range faction templates.
std::vector<std::string> validate_content_db(const ContentDB& db);

} // namespace agirace
