#pragma once

#include "agirace/core/entities.h"
#include "agirace/core/game_state.h"

namespace agirace {

// Sanctioned mutation paths for bounded faction fields. Every delta is added
// and the result clamped, so no sequence of calls can leave a field outside
// its range.

double clamp_stat(double v);

// Rounds to one decimal place (half away from zero).
double round1(double v);

void apply_resource_delta(FactionState& f, const ResourceDelta& delta);
void apply_resource(FactionState& f, ResourceKey key, double delta);

void apply_stat_delta(FactionState& f, const StatDelta& delta);
void apply_stat(FactionState& f, StatKey key, double delta);

void apply_score_delta(FactionState& f, const ScoreEffects& delta);

// Clamped to [kMinSecurityLevel, kMaxSecurityLevel].
void apply_security_level_delta(FactionState& f, int delta);

void apply_public_opinion_delta(FactionState& f, double delta);

// Adds to a research pool, flooring at zero.
void add_research(FactionState& f, Branch branch, double amount);

// Capability-weighted mean safety: weights are max(10, capability_score),
// rounded to one decimal. 0 when there are no factions.
double compute_global_safety(const GameState& state);

// Research points a grant of `base` yields for this faction before the
// openness multiplier: base plus a resource-weighted bonus for the branch.
//
//   capabilities: 0.15 compute + 0.12 talent + 0.10 data
//   safety:       0.10 talent  + 0.15 safety_culture + 0.05 trust
//   ops:          0.10 capital + 0.05 compute + 0.05 talent
//   policy:       0.10 influence + 0.05 trust
double compute_research_gain(const FactionState& f, Branch branch, double base);

} // namespace agirace
