#include <iostream>
#include <string>
#include <vector>

#include "agirace/core/content_validation.h"
#include "agirace/core/tech.h"

#define AGR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool has_error(const std::vector<std::string>& errors, const std::string& needle) {
  for (const auto& e : errors) {
    if (e.find(needle) != std::string::npos) return true;
  }
  return false;
}

agirace::TechNode make_tech(const std::string& id, std::vector<std::string> prereqs) {
  agirace::TechNode t;
  t.id = id;
  t.name = id;
  t.branch = agirace::Branch::Safety;
  t.cost = 10.0;
  t.prereqs = std::move(prereqs);
  return t;
}

} // namespace

int test_content_validation() {
  const auto content = agirace::load_default_content();

  {
    const auto errors = agirace::validate_content_db(content);
    if (!errors.empty()) {
      std::cerr << "Content validation failed:\n";
      for (const auto& e : errors) std::cerr << "  - " << e << "\n";
      return 1;
    }
  }

  // Sanity: prereq cycles should be detected (they deadlock research).
  {
    auto bad = content;
    bad.techs.push_back(make_tech("cycle_a", {"cycle_b"}));
    bad.techs.push_back(make_tech("cycle_b", {"cycle_a"}));
    AGR_ASSERT(has_error(agirace::validate_content_db(bad), "cycle"));
  }

  {
    auto bad = content;
    bad.techs.push_back(make_tech("orphan", {"does_not_exist"}));
    AGR_ASSERT(has_error(agirace::validate_content_db(bad), "has unknown prereq"));
  }

  {
    auto bad = content;
    bad.techs.push_back(make_tech("safe_alignment_benchmarks", {}));
    AGR_ASSERT(has_error(agirace::validate_content_db(bad), "Duplicate tech id"));
  }

  {
    auto bad = content;
    auto t = make_tech("free_lunch", {});
    t.cost = 0.0;
    bad.techs.push_back(t);
    AGR_ASSERT(has_error(agirace::validate_content_db(bad), "non-positive cost"));
  }

  {
    auto bad = content;
    bad.actions.at("move_fast").faction_specific = "nobody";
    AGR_ASSERT(has_error(agirace::validate_content_db(bad), "unknown faction"));
  }

  {
    auto bad = content;
    bad.actions.at("executive_order").faction_specific = "us_lab_a";
    AGR_ASSERT(has_error(agirace::validate_content_db(bad), "may not take it"));
  }

  {
    auto bad = content;
    bad.factions[0].resources.trust = 120.0;
    AGR_ASSERT(has_error(agirace::validate_content_db(bad), "out of range"));
  }

  return 0;
}
