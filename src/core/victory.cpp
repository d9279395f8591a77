#include "agirace/core/victory.h"

#include <algorithm>
#include <cmath>

#include "agirace/core/faction_rules.h"
#include "agirace/util/log.h"
#include "agirace/util/sorted_keys.h"
#include "agirace/util/strings.h"

namespace agirace {
namespace {

void declare_victory(GameState& state, const FactionState& f, VictoryType type, const std::string& message,
                     TurnLog& log) {
  state.game_over = true;
  state.winner_id = f.id;
  state.victory_type = type;
  log.add(message);
  log::info(message);
}

void declare_loss(GameState& state, const FactionState& f, LossType type, const std::string& message,
                  TurnLog& log) {
  state.game_over = true;
  state.loser_id = f.id;
  state.loss_type = type;
  log.add(message);
  log::info(message);
}

double pct(double value, double threshold) {
  if (threshold <= 0.0) return 100.0;
  return std::clamp(value / threshold * 100.0, 0.0, 100.0);
}

template <typename Pred>
double lab_share(const GameState& state, Pred pred) {
  int total = 0;
  int ok = 0;
  for (const auto& [id, f] : state.factions) {
    if (!f.is_lab()) continue;
    ++total;
    if (pred(f)) ++ok;
  }
  return total == 0 ? 100.0 : static_cast<double>(ok) / total * 100.0;
}

} // namespace

void evaluate_deployments(GameState& state, const std::vector<std::string>& deployers, const SimConfig& cfg,
                          TurnLog& log) {
  for (const auto& id : deployers) {
    if (state.game_over) return;
    const FactionState* f = find_ptr(state.factions, id);
    if (!f || !f->can_deploy_agi) continue;

    const bool safe =
        f->safety_score >= cfg.safe_agi_faction_safety && state.global_safety >= cfg.safe_agi_global_safety;
    const bool unsafe =
        f->safety_score < cfg.catastrophe_faction_safety || state.global_safety < cfg.catastrophe_global_safety;

    if (safe && state.turn >= cfg.min_victory_turn) {
      declare_victory(state, *f, VictoryType::SafeAgi, f->name + " deployed safe AGI and wins the race!", log);
    } else if (unsafe) {
      declare_loss(state, *f, LossType::Catastrophe, f->name + " deployed unsafe AGI. Global catastrophe ensues.",
                   log);
    } else if (safe) {
      log.add(f->name + " held back AGI deployment: too early (turn " + std::to_string(state.turn) + "/" +
              std::to_string(cfg.min_victory_turn) + ").");
    } else {
      log.add(f->name + " held back AGI deployment: safety margins insufficient.");
    }
  }
}

void evaluate_standing_conditions(GameState& state, const SimConfig& cfg, TurnLog& log) {
  const bool gate_open = state.turn >= cfg.min_victory_turn;

  for (const auto& id : util::sorted_keys(state.factions)) {
    if (state.game_over) return;
    const FactionState& f = state.factions.at(id);
    const FactionRules& rules = rules_for(f.type);

    if (auto v = rules.evaluate_victory(state, f, cfg)) {
      if (gate_open || v->type == VictoryType::Regulatory) {
        declare_victory(state, f, v->type, v->message, log);
        return;
      }
    }

    // Lab losses wait for the gate; government losses do not.
    if (!gate_open && f.is_lab()) continue;
    if (auto l = rules.evaluate_loss(state, f, cfg)) {
      if (id == state.player_faction_id) {
        declare_loss(state, f, l->type, l->message, log);
        return;
      }
      log.warn(l->message);
    }
  }
}

void evaluate_turn_limit(GameState& state, const SimConfig& cfg, TurnLog& log) {
  if (state.game_over || state.turn < cfg.max_turn) return;

  const bool labs_safe =
      every_lab(state, [&](const FactionState& lab) { return lab.safety_score >= cfg.fallback_lab_safety; });

  const FactionState* best = nullptr;
  if (labs_safe && state.global_safety >= cfg.fallback_global_safety) {
    for (const auto& id : util::sorted_keys(state.factions)) {
      const FactionState& f = state.factions.at(id);
      if (!f.is_government()) continue;
      if (!best || f.resources.influence > best->resources.influence ||
          (f.resources.influence == best->resources.influence && f.resources.trust > best->resources.trust)) {
        best = &f;
      }
    }
  }

  if (best) {
    declare_victory(state, *best, VictoryType::Regulatory,
                    best->name + " secured a regulatory victory as the race reached its deadline in " +
                        std::to_string(state.year) + ".",
                    log);
    return;
  }

  state.game_over = true;
  state.winner_id.clear();
  state.loser_id.clear();
  state.victory_type = VictoryType::None;
  state.loss_type = LossType::None;
  log.add("The race ended in a stalemate: no faction prevailed by " + std::to_string(state.year) + " Q" +
          std::to_string(state.quarter) + ".");
  log::info("stalemate at turn " + std::to_string(state.turn));
}

bool is_stalemate(const GameState& state) {
  return state.game_over && state.winner_id.empty() && state.loser_id.empty();
}

std::vector<VictoryProgress> calculate_victory_progress(const GameState& state, const std::string& faction_id,
                                                        const SimConfig& cfg) {
  std::vector<VictoryProgress> out;
  const FactionState* f = find_ptr(state.factions, faction_id);
  if (!f) return out;

  const auto add = [&](VictoryType v, const char* label, double p) {
    VictoryProgress vp;
    vp.victory = v;
    vp.label = label;
    vp.progress = std::round(std::clamp(p, 0.0, 100.0));
    out.push_back(vp);
  };
  const auto warn = [&](LossType l, const char* label, double p) {
    VictoryProgress vp;
    vp.loss = l;
    vp.label = label;
    vp.progress = std::round(std::clamp(p, 0.0, 100.0));
    vp.is_warning = true;
    out.push_back(vp);
  };

  const double trust = f->resources.trust;
  const double influence = f->resources.influence;

  // Trust within 30 points of the collapse line counts as half way.
  const double collapse = 100.0 - (trust - cfg.collapse_trust) / 30.0 * 100.0;

  if (f->is_lab()) {
    add(VictoryType::SafeAgi, "Safe AGI Victory",
        (pct(f->safety_score, cfg.safe_agi_faction_safety) + pct(state.global_safety, cfg.safe_agi_global_safety) +
         (f->can_deploy_agi ? 100.0 : 0.0)) /
            3.0);

    const double rival = strongest_rival_lab_capability(state, f->id);
    const double lead = rival > 0.0 ? (f->capability_score - rival) / rival * 100.0 : 100.0;
    add(VictoryType::Dominant, "Dominant Victory",
        (pct(lead, cfg.dominant_lead_percent) + pct(f->capability_score, cfg.dominant_min_capability)) / 2.0);

    add(VictoryType::PublicTrust, "Public Trust Victory",
        (pct(trust, cfg.public_trust_min_trust) + pct(f->capability_score, cfg.public_trust_min_capability)) / 2.0);

    if (collapse > 50.0) warn(LossType::Collapse, "Trust Collapse Warning", collapse);

    if (has_rival_lab(state, f->id)) {
      const double obsolete = pct(rival - f->capability_score, cfg.obsolescence_gap);
      if (obsolete > 40.0) warn(LossType::Obsolescence, "Obsolescence Warning", obsolete);
    }
  } else {
    const double compliance =
        lab_share(state, [&](const FactionState& lab) { return lab.safety_score >= cfg.regulatory_lab_safety; });
    add(VictoryType::Regulatory, "Regulatory Victory",
        (compliance + pct(state.global_safety, cfg.regulatory_global_safety) + pct(state.turn, cfg.max_turn)) /
            3.0);

    int supporters = 0;
    for (const auto& [id, other] : state.factions) {
      if (id != f->id && other.resources.trust >= cfg.alliance_supporter_trust) ++supporters;
    }
    add(VictoryType::Alliance, "Alliance Victory",
        (pct(supporters, cfg.alliance_min_supporters) + pct(influence, cfg.alliance_min_influence)) / 2.0);

    const double controlled = lab_share(
        state, [&](const FactionState& lab) { return lab.capability_score <= cfg.control_max_lab_capability; });
    add(VictoryType::Control, "Control Victory", (controlled + pct(influence, cfg.control_min_influence)) / 2.0);

    if (collapse > 50.0) warn(LossType::Collapse, "Trust Collapse Warning", collapse);

    const bool dangerous_lab = !every_lab(state, [&](const FactionState& lab) {
      return lab.capability_score < cfg.coup_lab_capability - 10.0;
    });
    if (dangerous_lab && influence < cfg.coup_max_influence + 20.0) {
      warn(LossType::Coup, "Coup Risk Warning", 100.0 - (influence - cfg.coup_max_influence) / 20.0 * 100.0);
    }
  }

  return out;
}

} // namespace agirace
