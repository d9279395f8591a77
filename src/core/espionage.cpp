#include "agirace/core/espionage.h"

#include <algorithm>

#include "agirace/core/stats.h"
#include "agirace/util/strings.h"

namespace agirace {

double espionage_success_chance(const FactionState& attacker, const FactionState& target, const SimConfig& cfg) {
  const double raw = cfg.espionage_base_chance + attacker.opsec * cfg.espionage_attacker_opsec_factor -
                     target.opsec * cfg.espionage_target_opsec_factor;
  return std::clamp(raw, cfg.espionage_min_chance, cfg.espionage_max_chance);
}

EspionageOutcome resolve_espionage(FactionState& attacker, FactionState& target, const SimConfig& cfg,
                                   const RandomSource& rng, TurnLog& log) {
  EspionageOutcome out;
  out.success_chance = espionage_success_chance(attacker, target, cfg);
  out.success = rng() < out.success_chance;

  if (out.success) {
    Branch top = Branch::Capabilities;
    double top_value = -1.0;
    for (Branch b : kAllBranches) {
      const double v = target.research.get(b);
      if (v > top_value) {
        top = b;
        top_value = v;
      }
    }
    out.branch = top;
    out.stolen = std::min(cfg.espionage_steal_cap, std::max(0.0, top_value));
    // An empty target yields nothing to move or report.
    if (out.stolen > 0.0) {
      add_research(target, top, -out.stolen);
      add_research(attacker, top, out.stolen);
      log.add(attacker.name + " stole " + format_amount(out.stolen) + " research from " + target.name + ".");
    }
  }

  out.detected = rng() < cfg.espionage_detection_chance;
  if (out.detected) {
    apply_resource(attacker, ResourceKey::Trust, -cfg.espionage_caught_trust_penalty);
    apply_resource(attacker, ResourceKey::Influence, -cfg.espionage_caught_influence_penalty);
    apply_resource(target, ResourceKey::Trust, cfg.espionage_victim_trust_bonus);
    log.add(attacker.name + " was caught conducting espionage against " + target.name + ".");
  }

  return out;
}

double detection_chance(const FactionState& f, const SimConfig& cfg) {
  const double raw =
      cfg.detection_base_chance + f.exposure * cfg.detection_per_exposure - f.opsec * cfg.detection_opsec_factor;
  return std::clamp(raw, 0.0, cfg.detection_max_chance);
}

bool roll_detection(FactionState& f, const SimConfig& cfg, const RandomSource& rng, TurnLog& log) {
  if (f.exposure <= 0.0) return false;
  if (!(rng() < detection_chance(f, cfg))) return false;

  apply_resource(f, ResourceKey::Trust, -cfg.detection_trust_penalty);
  apply_resource(f, ResourceKey::Influence, -cfg.detection_influence_penalty);
  apply_score_delta(f, ScoreEffects{0.0, -cfg.detection_safety_penalty});
  apply_public_opinion_delta(f, -cfg.detection_opinion_penalty);
  f.exposure = 0.0;
  log.add(f.name + " was exposed for secret activity.");
  return true;
}

} // namespace agirace
