#pragma once

#include <cstdint>
#include <string>

#include "agirace/core/game_state.h"

namespace agirace {

struct DigestOptions {
  // Include GameState::log. Off for "same gameplay" comparisons across
  // builds whose log wording differs.
  bool include_log{true};
};

// Stable 64-bit digest of a game state.
//
// Independent of unordered_map iteration order and insensitive to the order
// of set-like vectors (alliances, treaties); sensitive to unlocked tech order
// and log order.
std::uint64_t digest_game_state64(const GameState& state, const DigestOptions& opt = {});

// Digest of the loaded catalogs, for identifying content sets in bug reports.
std::uint64_t digest_content_db64(const ContentDB& content);

// Fixed-width lowercase hex.
std::string digest64_to_hex(std::uint64_t v);

} // namespace agirace
