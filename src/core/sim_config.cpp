#include "agirace/core/sim_config.h"

#include <stdexcept>
#include <utility>
#include <vector>

#include "agirace/util/file_io.h"
#include "agirace/util/json.h"

namespace agirace {
namespace {

void read_number(const json::Object& o, const char* key, double* out) {
  if (const auto* v = json::find_key(o, key)) {
    if (!v->is_number()) throw std::runtime_error(std::string("Config key '") + key + "' must be a number");
    *out = v->number_value(*out);
  }
}

void read_int(const json::Object& o, const char* key, int* out) {
  if (const auto* v = json::find_key(o, key)) {
    if (!v->is_number()) throw std::runtime_error(std::string("Config key '") + key + "' must be a number");
    *out = static_cast<int>(v->int_value(*out));
  }
}

void read_openness(const json::Object& root, const char* key, OpennessModifiers* out) {
  const auto* v = json::find_key(root, key);
  if (!v) return;
  const auto& o = v->object();
  read_number(o, "research_multiplier", &out->research_multiplier);
  read_number(o, "trust_delta", &out->trust_delta);
  read_number(o, "safety_delta", &out->safety_delta);
  read_number(o, "capability_delta", &out->capability_delta);
}

} // namespace

const OpennessModifiers& openness_modifiers(const SimConfig& cfg, Openness o) {
  return o == Openness::Secret ? cfg.secret : cfg.open;
}

SimConfig load_sim_config_from_file(const std::string& path) {
  const auto root = json::parse(read_text_file(path));
  const auto& o = root.object();

  SimConfig cfg;
  read_int(o, "max_actions_per_turn", &cfg.max_actions_per_turn);
  read_int(o, "start_year", &cfg.start_year);
  read_int(o, "start_quarter", &cfg.start_quarter);
  read_int(o, "min_victory_turn", &cfg.min_victory_turn);
  read_int(o, "max_turn", &cfg.max_turn);

  read_openness(o, "open", &cfg.open);
  read_openness(o, "secret", &cfg.secret);

  const std::vector<std::pair<const char*, double*>> numbers = {
      {"detection_base_chance", &cfg.detection_base_chance},
      {"detection_per_exposure", &cfg.detection_per_exposure},
      {"detection_opsec_factor", &cfg.detection_opsec_factor},
      {"detection_max_chance", &cfg.detection_max_chance},
      {"detection_trust_penalty", &cfg.detection_trust_penalty},
      {"detection_influence_penalty", &cfg.detection_influence_penalty},
      {"detection_safety_penalty", &cfg.detection_safety_penalty},
      {"detection_opinion_penalty", &cfg.detection_opinion_penalty},
      {"espionage_base_chance", &cfg.espionage_base_chance},
      {"espionage_attacker_opsec_factor", &cfg.espionage_attacker_opsec_factor},
      {"espionage_target_opsec_factor", &cfg.espionage_target_opsec_factor},
      {"espionage_min_chance", &cfg.espionage_min_chance},
      {"espionage_max_chance", &cfg.espionage_max_chance},
      {"espionage_steal_cap", &cfg.espionage_steal_cap},
      {"espionage_detection_chance", &cfg.espionage_detection_chance},
      {"espionage_caught_trust_penalty", &cfg.espionage_caught_trust_penalty},
      {"espionage_caught_influence_penalty", &cfg.espionage_caught_influence_penalty},
      {"espionage_victim_trust_bonus", &cfg.espionage_victim_trust_bonus},
      {"espionage_tension_increase", &cfg.espionage_tension_increase},
      {"safe_agi_faction_safety", &cfg.safe_agi_faction_safety},
      {"safe_agi_global_safety", &cfg.safe_agi_global_safety},
      {"catastrophe_faction_safety", &cfg.catastrophe_faction_safety},
      {"catastrophe_global_safety", &cfg.catastrophe_global_safety},
      {"dominant_min_capability", &cfg.dominant_min_capability},
      {"dominant_lead_percent", &cfg.dominant_lead_percent},
      {"public_trust_min_trust", &cfg.public_trust_min_trust},
      {"public_trust_min_capability", &cfg.public_trust_min_capability},
      {"regulatory_lab_safety", &cfg.regulatory_lab_safety},
      {"regulatory_global_safety", &cfg.regulatory_global_safety},
      {"alliance_min_influence", &cfg.alliance_min_influence},
      {"alliance_supporter_trust", &cfg.alliance_supporter_trust},
      {"control_min_influence", &cfg.control_min_influence},
      {"control_max_lab_capability", &cfg.control_max_lab_capability},
      {"collapse_trust", &cfg.collapse_trust},
      {"obsolescence_gap", &cfg.obsolescence_gap},
      {"coup_max_influence", &cfg.coup_max_influence},
      {"coup_lab_capability", &cfg.coup_lab_capability},
      {"fallback_lab_safety", &cfg.fallback_lab_safety},
      {"fallback_global_safety", &cfg.fallback_global_safety},
  };
  for (const auto& [key, field] : numbers) read_number(o, key, field);
  read_int(o, "alliance_min_supporters", &cfg.alliance_min_supporters);

  if (cfg.max_actions_per_turn < 0) throw std::runtime_error("max_actions_per_turn must be >= 0");
  if (cfg.start_quarter < 1 || cfg.start_quarter > 4) throw std::runtime_error("start_quarter must be in 1..4");
  if (cfg.max_turn < 1) throw std::runtime_error("max_turn must be >= 1");

  return cfg;
}

} // namespace agirace
