#pragma once

#include <string>

#include "agirace/core/espionage.h"
#include "agirace/core/game_state.h"
#include "agirace/core/sim_config.h"
#include "agirace/core/turn_log.h"

namespace agirace {

struct ActionResult {
  // False when the faction may not take the action at all (wrong faction
  // type or a faction-specific action). Such rejections have no effect.
  bool applied{false};

  // A lab holding the AGI unlock chose deploy_agi this turn.
  bool deploy_attempt{false};
};

// Checks whether `f` may take `def` at all (type and faction-specific gating).
// On failure, writes a reason to *why when provided.
bool action_allowed(const ActionDefinition& def, const FactionState& f, std::string* why = nullptr);

// Resolves one chosen action for faction `actor_id`.
//
// Generic effects are applied in this order: base resource delta, openness
// modifier, research grants (scaled by resources and the openness research
// multiplier), score effects, security level delta, then exposure when the
// action was secret. Kind-specific effects follow (targets, espionage, AGI
// deployment); a missing target or AGI unlock skips only those. Never throws
// for bad choices; it logs them.
ActionResult resolve_action(GameState& state, const std::string& actor_id, const ActionDefinition& def,
                            const ActionChoice& choice, const SimConfig& cfg, const RandomSource& rng,
                            TurnLog& log);

} // namespace agirace
