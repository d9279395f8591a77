#pragma once

#include <map>
#include <string>
#include <vector>

#include "agirace/core/espionage.h"
#include "agirace/core/game_state.h"
#include "agirace/core/sim_config.h"

namespace agirace {

// Faction id -> ordered choices for this turn. Ordered by id so that
// resolution (and every RNG draw it makes) follows a fixed sequence.
using ChoiceMap = std::map<std::string, std::vector<ActionChoice>>;

// Resolves one quarter in place and returns the log entries it produced
// (also appended to state.log).
//
// Order: calendar, income, actions, ambient detection, tech unlocks, global
// safety, deployment outcomes, standing victory/loss, turn-limit fallback.
// Global safety is recomputed after every mutation round.
//
// A state that is already game over is returned untouched with no entries.
// Choices are untrusted: unknown factions or action ids, disallowed actions
// and missing targets are logged and skipped rather than thrown.
std::vector<std::string> resolve_turn(GameState& state, const ContentDB& content, const SimConfig& cfg,
                                      const ChoiceMap& choices, const RandomSource& rng);

class Simulation {
 public:
  // Throws std::runtime_error when the content fails validation.
  Simulation(ContentDB content, SimConfig cfg);

  const ContentDB& content() const { return content_; }
  const SimConfig& cfg() const { return cfg_; }

  GameState& state() { return state_; }
  const GameState& state() const { return state_; }

  // Fresh state from the faction templates. An empty id tracks no player.
  // Throws std::runtime_error for a player id that is not a template.
  void new_game(const std::string& player_faction_id = "");
  void load_game(GameState loaded);

  std::vector<std::string> advance_turn(const ChoiceMap& choices, const RandomSource& rng);

 private:
  ContentDB content_;
  SimConfig cfg_;
  GameState state_;
};

} // namespace agirace
