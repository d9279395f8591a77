#include "agirace/core/stats.h"

#include <algorithm>
#include <cmath>

#include "agirace/util/sorted_keys.h"

namespace agirace {

double clamp_stat(double v) { return std::clamp(v, kMinStat, kMaxStat); }

double round1(double v) { return std::round(v * 10.0) / 10.0; }

void apply_resource(FactionState& f, ResourceKey key, double delta) {
  double& r = f.resources.ref(key);
  r = clamp_stat(r + delta);
}

void apply_resource_delta(FactionState& f, const ResourceDelta& delta) {
  for (const auto& [key, value] : delta) apply_resource(f, key, value);
}

void apply_stat(FactionState& f, StatKey key, double delta) {
  double& s = (key == StatKey::Opsec) ? f.opsec : f.safety_culture;
  s = clamp_stat(s + delta);
}

void apply_stat_delta(FactionState& f, const StatDelta& delta) {
  for (const auto& [key, value] : delta) apply_stat(f, key, value);
}

void apply_score_delta(FactionState& f, const ScoreEffects& delta) {
  f.capability_score = clamp_stat(f.capability_score + delta.capability);
  f.safety_score = clamp_stat(f.safety_score + delta.safety);
}

void apply_security_level_delta(FactionState& f, int delta) {
  f.security_level = std::clamp(f.security_level + delta, kMinSecurityLevel, kMaxSecurityLevel);
}

void apply_public_opinion_delta(FactionState& f, double delta) {
  f.public_opinion = clamp_stat(f.public_opinion + delta);
}

void add_research(FactionState& f, Branch branch, double amount) {
  double& pool = f.research.ref(branch);
  pool = std::max(0.0, pool + amount);
}

double compute_global_safety(const GameState& state) {
  if (state.factions.empty()) return 0.0;
  double weighted = 0.0;
  double total = 0.0;
  for (const auto& id : util::sorted_keys(state.factions)) {
    const FactionState& f = state.factions.at(id);
    const double w = std::max(10.0, f.capability_score);
    weighted += f.safety_score * w;
    total += w;
  }
  return round1(weighted / total);
}

double compute_research_gain(const FactionState& f, Branch branch, double base) {
  const Resources& r = f.resources;
  switch (branch) {
    case Branch::Capabilities: return base + r.compute * 0.15 + r.talent * 0.12 + r.data * 0.10;
    case Branch::Safety: return base + r.talent * 0.10 + f.safety_culture * 0.15 + r.trust * 0.05;
    case Branch::Ops: return base + r.capital * 0.10 + r.compute * 0.05 + r.talent * 0.05;
    case Branch::Policy: return base + r.influence * 0.10 + r.trust * 0.05;
  }
  return base;
}

} // namespace agirace
