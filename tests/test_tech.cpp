#include <iostream>
#include <stdexcept>

#include "agirace/core/research.h"
#include "agirace/core/tech.h"
#include "test.h"

#define AGR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_tech() {
  using namespace agirace;

  {
    const ContentDB content = load_default_content();
    AGR_ASSERT(content.actions.size() == 24);
    AGR_ASSERT(content.techs.size() == 24);
    AGR_ASSERT(content.factions.size() == 5);

    AGR_ASSERT(content.action("deploy_products").base_resource_delta.at(ResourceKey::Capital) == 12.0);
    AGR_ASSERT(content.action("move_fast").faction_specific == "us_lab_b");
    AGR_ASSERT(content.find_tech("cap_agi_breakthrough") != nullptr);
    AGR_ASSERT(content.find_tech("nope") == nullptr);
    AGR_ASSERT(content.find_template("cn_gov")->bloc == "cn");

    bool threw = false;
    try {
      (void)content.action("teleport");
    } catch (const std::out_of_range&) {
      threw = true;
    }
    AGR_ASSERT(threw);
  }

  // 25 research against costs 20 then 30: one unlock, 5 left over.
  {
    ContentDB content;
    TechNode a;
    a.id = "a";
    a.name = "Alpha";
    a.branch = Branch::Capabilities;
    a.cost = 20.0;
    a.effects.push_back(TechEffect{TechEffectType::Capability, ResourceKey::Compute, StatKey::SafetyCulture, 6.0});
    TechNode b;
    b.id = "b";
    b.name = "Beta";
    b.branch = Branch::Capabilities;
    b.cost = 30.0;
    b.prereqs = {"a"};
    b.effects.push_back(TechEffect{TechEffectType::UnlockAgi, ResourceKey::Compute, StatKey::SafetyCulture, 0.0});
    content.techs = {a, b};

    FactionState f = test::make_lab("lab", 10.0, 10.0);
    f.research.capabilities = 25.0;

    TurnLog log;
    const auto unlocked = unlock_available_techs(content, f, log);
    AGR_ASSERT(unlocked.size() == 1);
    AGR_ASSERT(unlocked[0] == "a");
    AGR_ASSERT(f.research.capabilities == 5.0);
    AGR_ASSERT(f.capability_score == 16.0);
    AGR_ASSERT(!f.can_deploy_agi);
    AGR_ASSERT(log.entries().size() == 1);
    AGR_ASSERT(log.entries()[0] == "lab unlocked Alpha.");

    // Enough for the rest of the chain; nothing is unlocked twice.
    f.research.capabilities = 100.0;
    const auto more = unlock_available_techs(content, f, log);
    AGR_ASSERT(more.size() == 1);
    AGR_ASSERT(more[0] == "b");
    AGR_ASSERT(f.unlocked_techs.size() == 2);
    AGR_ASSERT(f.research.capabilities == 70.0);
    AGR_ASSERT(f.can_deploy_agi);

    AGR_ASSERT(unlock_available_techs(content, f, log).empty());
  }

  // Pools feed only their own branch.
  {
    const ContentDB content = load_default_content();
    FactionState f = test::make_lab("lab", 10.0, 10.0);
    f.research.policy = 16.0;
    TurnLog log;
    const auto unlocked = unlock_available_techs(content, f, log);
    AGR_ASSERT(unlocked.size() == 1);
    AGR_ASSERT(unlocked[0] == "pol_audit_standards");
    AGR_ASSERT(f.research.policy == 0.0);
    AGR_ASSERT(f.resources.trust == 54.0);
  }

  return 0;
}
