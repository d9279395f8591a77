#pragma once

#include <string>

#include "agirace/core/entities.h"

namespace agirace {

// Per-openness modifiers applied to every action taken with that openness.
struct OpennessModifiers {
  double research_multiplier{1.0};
  double trust_delta{0.0};
  double safety_delta{0.0};
  double capability_delta{0.0};
};

// Tunable rules of the race. Defaults reproduce the shipped balance.
struct SimConfig {
  // Choices beyond this many per faction per turn are ignored.
  int max_actions_per_turn{2};

  // Calendar at turn 0.
  int start_year{2026};
  int start_quarter{1};

  // No victory other than regulatory, and no lab loss, fires before this
  // turn. Government losses and deployment catastrophe are never gated.
  int min_victory_turn{24};

  // Turn at which the regulatory check opens and the fixed-horizon
  // government victory / stalemate fallback runs.
  int max_turn{32};

  OpennessModifiers open{0.9, 2.0, 1.0, 0.0};
  OpennessModifiers secret{1.1, -3.0, -2.0, 1.0};

  // --- Ambient detection ---
  //
  // chance = clamp(base + exposure * per_exposure - opsec * opsec_factor, 0, max)
  double detection_base_chance{0.1};
  double detection_per_exposure{0.08};
  double detection_opsec_factor{0.003};
  double detection_max_chance{0.65};

  double detection_trust_penalty{8.0};
  double detection_influence_penalty{5.0};
  double detection_safety_penalty{5.0};
  double detection_opinion_penalty{5.0};

  // --- Espionage ---
  //
  // success = clamp(base + attacker_opsec * a - target_opsec * t, min, max)
  double espionage_base_chance{0.35};
  double espionage_attacker_opsec_factor{0.002};
  double espionage_target_opsec_factor{0.004};
  double espionage_min_chance{0.05};
  double espionage_max_chance{0.85};

  // Upper bound on research points stolen per success.
  double espionage_steal_cap{12.0};

  // Independent of success.
  double espionage_detection_chance{0.25};
  double espionage_caught_trust_penalty{6.0};
  double espionage_caught_influence_penalty{4.0};
  double espionage_victim_trust_bonus{2.0};
  double espionage_tension_increase{10.0};

  // --- Victory and loss thresholds ---
  double safe_agi_faction_safety{80.0};
  double safe_agi_global_safety{70.0};

  double catastrophe_faction_safety{70.0};
  double catastrophe_global_safety{60.0};

  double dominant_min_capability{90.0};
  // Lead over the strongest rival lab, as a percentage of that rival's capability.
  double dominant_lead_percent{100.0};

  double public_trust_min_trust{97.0};
  double public_trust_min_capability{80.0};

  double regulatory_lab_safety{65.0};
  double regulatory_global_safety{60.0};

  double alliance_min_influence{120.0};
  int alliance_min_supporters{4};
  double alliance_supporter_trust{93.0};

  double control_min_influence{120.0};
  double control_max_lab_capability{15.0};

  double collapse_trust{20.0};
  double obsolescence_gap{50.0};

  double coup_max_influence{30.0};
  double coup_lab_capability{70.0};

  // Fixed-horizon government victory at max_turn.
  double fallback_lab_safety{60.0};
  double fallback_global_safety{60.0};
};

const OpennessModifiers& openness_modifiers(const SimConfig& cfg, Openness o);

// Reads overrides from a JSON object; keys absent from the file keep their defaults.
// Throws std::runtime_error on I/O or parse errors.
SimConfig load_sim_config_from_file(const std::string& path);

} // namespace agirace
