#pragma once

#include <functional>

#include "agirace/core/game_state.h"
#include "agirace/core/sim_config.h"
#include "agirace/core/turn_log.h"

namespace agirace {

// Source of uniform draws in [0,1). Each call consumes one draw.
using RandomSource = std::function<double()>;

struct EspionageOutcome {
  double success_chance{0.0};
  bool success{false};
  Branch branch{Branch::Capabilities};
  double stolen{0.0};
  bool detected{false};
};

double espionage_success_chance(const FactionState& attacker, const FactionState& target, const SimConfig& cfg);

// Consumes exactly two draws: the success roll, then the detection roll.
//
// On success, min(cfg.espionage_steal_cap, largest pool) research moves from
// the target's largest branch (ties go to the earlier branch) to the same
// branch of the attacker. Nothing is moved or logged when the target has no
// research. Detection is rolled independently of success.
EspionageOutcome resolve_espionage(FactionState& attacker, FactionState& target, const SimConfig& cfg,
                                   const RandomSource& rng, TurnLog& log);

double detection_chance(const FactionState& f, const SimConfig& cfg);

// Ambient detection roll for accumulated exposure. Factions with no exposure
// are skipped without consuming a draw. Returns true if detected.
bool roll_detection(FactionState& f, const SimConfig& cfg, const RandomSource& rng, TurnLog& log);

} // namespace agirace
