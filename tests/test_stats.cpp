#include <cmath>
#include <iostream>

#include "agirace/core/scenario.h"
#include "agirace/core/stats.h"
#include "agirace/core/tech.h"
#include "test.h"

#define AGR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {
bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }
} // namespace

int test_stats() {
  using namespace agirace;

  AGR_ASSERT(clamp_stat(-4.0) == 0.0);
  AGR_ASSERT(clamp_stat(140.0) == 100.0);
  AGR_ASSERT(round1(23.75) == 23.8);
  AGR_ASSERT(round1(-1.25) == -1.3);

  // Every sanctioned mutation clamps.
  {
    FactionState f = test::make_lab("lab", 95.0, 3.0);
    apply_resource(f, ResourceKey::Trust, 80.0);
    AGR_ASSERT(f.resources.trust == 100.0);
    apply_resource_delta(f, {{ResourceKey::Capital, -500.0}, {ResourceKey::Compute, 7.0}});
    AGR_ASSERT(f.resources.capital == 0.0);
    AGR_ASSERT(f.resources.compute == 57.0);

    apply_score_delta(f, ScoreEffects{10.0, -10.0});
    AGR_ASSERT(f.capability_score == 100.0);
    AGR_ASSERT(f.safety_score == 0.0);

    apply_stat_delta(f, {{StatKey::Opsec, 70.0}, {StatKey::SafetyCulture, -60.0}});
    AGR_ASSERT(f.opsec == 100.0);
    AGR_ASSERT(f.safety_culture == 0.0);

    apply_security_level_delta(f, 9);
    AGR_ASSERT(f.security_level == kMaxSecurityLevel);
    apply_security_level_delta(f, -9);
    AGR_ASSERT(f.security_level == kMinSecurityLevel);

    apply_public_opinion_delta(f, -80.0);
    AGR_ASSERT(f.public_opinion == 0.0);
  }

  // Research pools never go negative.
  {
    FactionState f = test::make_lab("lab", 10.0, 10.0);
    add_research(f, Branch::Ops, 4.0);
    add_research(f, Branch::Ops, -10.0);
    AGR_ASSERT(f.research.ops == 0.0);
  }

  // Capability-weighted safety, with a floor weight of 10.
  {
    GameState s;
    AGR_ASSERT(compute_global_safety(s) == 0.0);

    test::put(s, test::make_lab("a", 50.0, 80.0));
    test::put(s, test::make_lab("b", 0.0, 20.0));
    // (80*50 + 20*10) / 60 = 70
    AGR_ASSERT(s.global_safety == 70.0);
  }

  // Shipped roster at turn 0.
  {
    const ContentDB content = load_default_content();
    const GameState s = make_initial_state(content, SimConfig{});
    AGR_ASSERT(s.global_safety == 23.8);
  }

  {
    FactionState f = test::make_lab("lab", 10.0, 10.0);
    // 12 + 50*0.15 + 50*0.12 + 50*0.10
    AGR_ASSERT(approx(compute_research_gain(f, Branch::Capabilities, 12.0), 30.5));
    // 12 + 50*0.10 + 50*0.15 + 50*0.05
    AGR_ASSERT(approx(compute_research_gain(f, Branch::Safety, 12.0), 27.0));
    // 10 + 40*0.10 + 50*0.05
    AGR_ASSERT(approx(compute_research_gain(f, Branch::Policy, 10.0), 16.5));
  }

  return 0;
}
