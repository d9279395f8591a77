#include "agirace/core/faction_rules.h"

#include <algorithm>

#include "agirace/core/stats.h"
#include "agirace/util/strings.h"

namespace agirace {

// --- Income ---
//
// Labs turn compute and data into research, split between capabilities and
// safety by their current score balance. Governments convert influence into
// policy research and collect a larger fixed capital stipend.

void LabRules::apply_income(FactionState& f) const {
  const Resources& r = f.resources;
  apply_resource(f, ResourceKey::Capital, 4.0 + r.trust * 0.04 + r.influence * 0.02);

  const double base = 8.0 + r.compute * 0.08 + r.data * 0.05;
  const double total_score = f.capability_score + f.safety_score;
  const double cap_ratio = total_score > 0.0 ? f.capability_score / total_score : 0.5;

  add_research(f, Branch::Capabilities, base * 0.6 * cap_ratio);
  add_research(f, Branch::Safety, base * 0.4 * (1.0 - cap_ratio) + 2.0);
  add_research(f, Branch::Ops, base * 0.25);
}

void GovernmentRules::apply_income(FactionState& f) const {
  const Resources& r = f.resources;
  apply_resource(f, ResourceKey::Capital, 5.0 + r.influence * 0.03 + r.trust * 0.02);
  add_research(f, Branch::Policy, 5.0 + r.influence * 0.05);
}

// --- Standing victory / loss ---

std::optional<VictoryCheck> LabRules::evaluate_victory(const GameState& state, const FactionState& f,
                                                       const SimConfig& cfg) const {
  if (f.capability_score >= cfg.dominant_min_capability) {
    const double rival = strongest_rival_lab_capability(state, f.id);
    if (rival <= 0.0) {
      return VictoryCheck{VictoryType::Dominant, f.name + " achieved total technological dominance!"};
    }
    const double lead_pct = (f.capability_score - rival) / rival * 100.0;
    if (lead_pct >= cfg.dominant_lead_percent) {
      return VictoryCheck{VictoryType::Dominant, f.name + " achieved technological dominance with a " +
                                                     format_amount(lead_pct) + "% lead!"};
    }
  }

  if (f.resources.trust >= cfg.public_trust_min_trust && f.capability_score >= cfg.public_trust_min_capability) {
    return VictoryCheck{VictoryType::PublicTrust,
                        f.name + " won through public trust and successful product deployment!"};
  }

  return std::nullopt;
}

std::optional<LossCheck> LabRules::evaluate_loss(const GameState& state, const FactionState& f,
                                                 const SimConfig& cfg) const {
  if (f.resources.trust < cfg.collapse_trust) {
    return LossCheck{LossType::Collapse, f.name + " collapsed due to loss of public trust."};
  }

  if (has_rival_lab(state, f.id)) {
    const double gap = strongest_rival_lab_capability(state, f.id) - f.capability_score;
    if (gap >= cfg.obsolescence_gap) {
      return LossCheck{LossType::Obsolescence,
                       f.name + " became obsolete, falling " + format_amount(gap) + " points behind."};
    }
  }

  return std::nullopt;
}

std::optional<VictoryCheck> GovernmentRules::evaluate_victory(const GameState& state, const FactionState& f,
                                                              const SimConfig& cfg) const {
  if (state.turn >= cfg.max_turn &&
      every_lab(state, [&](const FactionState& lab) { return lab.safety_score >= cfg.regulatory_lab_safety; }) &&
      state.global_safety >= cfg.regulatory_global_safety) {
    return VictoryCheck{VictoryType::Regulatory, f.name + " achieved regulatory victory! All labs maintained safe "
                                                          "practices through " +
                                                     std::to_string(state.year) + "."};
  }

  if (f.resources.influence >= cfg.alliance_min_influence) {
    int supporters = 0;
    for (const auto& [id, other] : state.factions) {
      if (id != f.id && other.resources.trust >= cfg.alliance_supporter_trust) ++supporters;
    }
    if (supporters >= cfg.alliance_min_supporters) {
      return VictoryCheck{VictoryType::Alliance, f.name + " formed a global AI safety treaty with " +
                                                     std::to_string(supporters) + " factions!"};
    }
  }

  if (f.resources.influence >= cfg.control_min_influence &&
      every_lab(state, [&](const FactionState& lab) {
        return lab.capability_score <= cfg.control_max_lab_capability;
      })) {
    return VictoryCheck{VictoryType::Control, f.name + " achieved total control over AI development!"};
  }

  return std::nullopt;
}

std::optional<LossCheck> GovernmentRules::evaluate_loss(const GameState& state, const FactionState& f,
                                                        const SimConfig& cfg) const {
  if (f.resources.trust < cfg.collapse_trust) {
    return LossCheck{LossType::Collapse, f.name + " collapsed due to loss of public trust."};
  }

  if (f.resources.influence < cfg.coup_max_influence &&
      !every_lab(state, [&](const FactionState& lab) { return lab.capability_score < cfg.coup_lab_capability; })) {
    return LossCheck{LossType::Coup, f.name + " lost control as AI labs became too powerful."};
  }

  return std::nullopt;
}

const FactionRules& rules_for(FactionType type) {
  static const LabRules kLab;
  static const GovernmentRules kGovernment;
  if (type == FactionType::Government) return kGovernment;
  return kLab;
}

double strongest_rival_lab_capability(const GameState& state, const std::string& exclude_id) {
  double best = 0.0;
  for (const auto& [id, f] : state.factions) {
    if (f.is_lab() && id != exclude_id) best = std::max(best, f.capability_score);
  }
  return best;
}

bool has_rival_lab(const GameState& state, const std::string& exclude_id) {
  for (const auto& [id, f] : state.factions) {
    if (f.is_lab() && id != exclude_id) return true;
  }
  return false;
}

} // namespace agirace
