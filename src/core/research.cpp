#include "agirace/core/research.h"

#include "agirace/core/stats.h"

namespace agirace {

bool prereqs_met(const FactionState& f, const TechNode& tech) {
  for (const auto& p : tech.prereqs) {
    if (!f.has_tech(p)) return false;
  }
  return true;
}

void apply_tech_effects(FactionState& f, const TechNode& tech) {
  for (const auto& e : tech.effects) {
    switch (e.type) {
      case TechEffectType::Capability: apply_score_delta(f, ScoreEffects{e.value, 0.0}); break;
      case TechEffectType::Safety: apply_score_delta(f, ScoreEffects{0.0, e.value}); break;
      case TechEffectType::Resource: apply_resource(f, e.resource, e.value); break;
      case TechEffectType::Stat: apply_stat(f, e.stat, e.value); break;
      case TechEffectType::UnlockAgi: f.can_deploy_agi = true; break;
    }
  }
}

std::vector<std::string> unlock_available_techs(const ContentDB& content, FactionState& f, TurnLog& log) {
  std::vector<std::string> unlocked;

  for (Branch branch : kAllBranches) {
    for (;;) {
      const TechNode* pick = nullptr;
      const double pool = f.research.get(branch);
      for (const auto& tech : content.techs) {
        if (tech.branch != branch) continue;
        if (f.has_tech(tech.id)) continue;
        if (!prereqs_met(f, tech)) continue;
        if (tech.cost <= pool) {
          pick = &tech;
          break;
        }
      }
      if (!pick) break;

      add_research(f, branch, -pick->cost);
      f.unlocked_techs.push_back(pick->id);
      apply_tech_effects(f, *pick);
      unlocked.push_back(pick->id);
      log.add(f.name + " unlocked " + pick->name + ".");
    }
  }

  return unlocked;
}

} // namespace agirace
