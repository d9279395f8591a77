#pragma once

#include <string>
#include <vector>

#include "agirace/core/game_state.h"
#include "agirace/core/sim_config.h"
#include "agirace/core/turn_log.h"

namespace agirace {

// Deployment-triggered outcomes, one attempt at a time in submission order.
//
// Safe AGI fires first (victory, game over). Otherwise an unsafe deployment
// is a catastrophe: the game ends with no winner and the deployer as loser.
// A deployment that meets neither bar is held back and only logged.
// Safe AGI respects the minimum-turn gate; catastrophe does not.
void evaluate_deployments(GameState& state, const std::vector<std::string>& deployers, const SimConfig& cfg,
                          TurnLog& log);

// Standing victory and loss conditions, per faction in sorted id order.
//
// A faction's victory is checked before its losses and the first victory ends
// the game. A standing loss ends the game only for the player faction;
// other factions' losses are logged as warnings. Before cfg.min_victory_turn
// only regulatory victory and government losses (collapse, coup) can fire.
void evaluate_standing_conditions(GameState& state, const SimConfig& cfg, TurnLog& log);

// At cfg.max_turn with no resolution: a fixed-horizon government victory if
// every lab is at or above cfg.fallback_lab_safety and global safety is at or
// above cfg.fallback_global_safety (winner: the government with the most
// influence, then trust, then lowest id), otherwise an explicit stalemate.
void evaluate_turn_limit(GameState& state, const SimConfig& cfg, TurnLog& log);

// Game over with neither winner nor loser.
bool is_stalemate(const GameState& state);

struct VictoryProgress {
  VictoryType victory{VictoryType::None};
  LossType loss{LossType::None};  // Set for warnings.
  std::string label;
  double progress{0.0};           // 0..100
  bool is_warning{false};
};

// Progress toward each victory path available to the faction, plus loss
// warnings once a loss is more than half way to triggering. Empty for an
// unknown faction.
std::vector<VictoryProgress> calculate_victory_progress(const GameState& state, const std::string& faction_id,
                                                        const SimConfig& cfg);

} // namespace agirace
