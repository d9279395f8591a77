#include <functional>
#include <iostream>
#include <stdexcept>

#include "agirace/core/ai_policy.h"
#include "agirace/core/scenario.h"
#include "agirace/core/tech.h"
#include "test.h"

#define AGR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_ai_policy() {
  using namespace agirace;

  const ContentDB content = load_default_content();
  const SimConfig cfg;
  const GameState initial = make_initial_state(content, cfg);

  {
    test::ScriptedRng scripted{{0.0}};
    AGR_ASSERT(decide_actions_heuristic(initial, content, cfg, "nobody", std::ref(scripted)).empty());
    AGR_ASSERT(scripted.calls == 0);
  }

  // A faction without a template has no strategy.
  {
    GameState s = initial;
    s.factions["rogue"] = test::make_lab("rogue", 10.0, 10.0);
    bool threw = false;
    try {
      (void)decide_actions_heuristic(s, content, cfg, "rogue", test::ScriptedRng{{0.0}});
    } catch (const std::runtime_error&) {
      threw = true;
    }
    AGR_ASSERT(threw);
  }

  // Ready and safe: deploy and nothing else.
  {
    GameState s = initial;
    auto& lab = s.factions.at("us_lab_a");
    lab.can_deploy_agi = true;
    lab.safety_score = 85.0;
    s.global_safety = 75.0;
    const auto choices = decide_actions_heuristic(s, content, cfg, "us_lab_a", test::ScriptedRng{{0.5}});
    AGR_ASSERT(choices.size() == 1);
    AGR_ASSERT(choices[0].action_id == "deploy_agi");
  }

  // Behind on safety and short of capital.
  {
    GameState s = initial;
    s.factions.at("us_lab_a").resources.capital = 30.0;
    const auto choices = decide_actions_heuristic(s, content, cfg, "us_lab_a", test::ScriptedRng{{0.0}});
    AGR_ASSERT(choices.size() == 2);
    AGR_ASSERT(choices[0].action_id == "research_safety");
    AGR_ASSERT(choices[0].openness == Openness::Open);
    AGR_ASSERT(choices[1].action_id == "deploy_products");
  }

  // Risk-tolerant lab with a safety margin pushes capabilities, in secret on a high roll.
  {
    GameState s = initial;
    s.factions.at("cn_lab").safety_score = 75.0;
    const auto choices = decide_actions_heuristic(s, content, cfg, "cn_lab", test::ScriptedRng{{0.99, 0.0}});
    AGR_ASSERT(choices.size() == 2);
    AGR_ASSERT(choices[0].action_id == "research_capabilities");
    AGR_ASSERT(choices[0].openness == Openness::Secret);
    AGR_ASSERT(choices[1].action_id == "policy");
  }

  // Governments regulate the leader while global safety is low, then back their own bloc.
  {
    const auto choices = decide_actions_heuristic(initial, content, cfg, "us_gov", test::ScriptedRng{{0.0}});
    AGR_ASSERT(choices.size() == 2);
    AGR_ASSERT(choices[0].action_id == "regulate");
    AGR_ASSERT(choices[0].target_faction_id == "cn_lab");
    AGR_ASSERT(choices[1].action_id == "subsidize");
    AGR_ASSERT(choices[1].target_faction_id == "us_lab_a");
  }

  {
    GameState s = initial;
    s.global_safety = 70.0;
    const auto choices = decide_actions_heuristic(s, content, cfg, "cn_gov", test::ScriptedRng{{0.0}});
    AGR_ASSERT(choices.size() == 2);
    AGR_ASSERT(choices[0].action_id == "subsidize");
    AGR_ASSERT(choices[0].target_faction_id == "cn_lab");
    AGR_ASSERT(choices[1].action_id == "counterintel");
  }

  {
    SimConfig one = cfg;
    one.max_actions_per_turn = 1;
    const auto choices = decide_actions_heuristic(initial, content, one, "us_gov", test::ScriptedRng{{0.0}});
    AGR_ASSERT(choices.size() == 1);
  }

  {
    test::ScriptedRng scripted{{0.3}};
    const ChoiceMap all = decide_all_actions(initial, content, cfg, std::ref(scripted), "us_lab_b");
    AGR_ASSERT(all.size() == 4);
    AGR_ASSERT(all.count("us_lab_b") == 0);
    for (const auto& [id, list] : all) {
      AGR_ASSERT(!list.empty());
      AGR_ASSERT(list.size() <= 2);
    }
  }

  return 0;
}
