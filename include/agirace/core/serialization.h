#pragma once

#include <string>

#include "agirace/core/game_state.h"
#include "agirace/util/json.h"

namespace agirace {

// Saves keep only the most recent log entries.
inline constexpr std::size_t kMaxSavedLogEntries = 50;

// Serialize the game state into an in-memory JSON document.
//
// Set-like and map-like containers are flattened to arrays sorted by id so
// the same state always produces the same text.
json::Value serialize_game_to_json_value(const GameState& state);

// Serialize the game state into a JSON text document (pretty-printed).
std::string serialize_game_to_json(const GameState& state);

// Parse a saved game. Global safety is recomputed rather than trusted.
// Throws std::runtime_error on malformed input or an unsupported save_version.
GameState deserialize_game_from_json(const std::string& json_text);

} // namespace agirace
