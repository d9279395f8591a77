#include "agirace/core/content_validation.h"

#include <algorithm>
#include <functional>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "agirace/core/enum_strings.h"
#include "agirace/util/sorted_keys.h"

namespace agirace {
namespace {

template <typename... Args>
std::string join(Args&&... args) {
  std::ostringstream ss;
  (ss << ... << std::forward<Args>(args));
  return ss.str();
}

bool in_stat_range(double v) { return v >= kMinStat && v <= kMaxStat; }

void validate_techs(const ContentDB& db, std::vector<std::string>& errors) {
  std::unordered_map<std::string, const TechNode*> by_id;
  for (const auto& t : db.techs) {
    if (t.id.empty()) {
      errors.push_back("Tech with empty id");
      continue;
    }
    if (!by_id.emplace(t.id, &t).second) errors.push_back(join("Duplicate tech id '", t.id, "'"));
    if (!(t.cost > 0.0)) errors.push_back(join("Tech '", t.id, "' has non-positive cost"));
  }

  for (const auto& t : db.techs) {
    for (const auto& p : t.prereqs) {
      if (by_id.find(p) == by_id.end()) {
        errors.push_back(join("Tech '", t.id, "' has unknown prereq '", p, "'"));
      } else if (p == t.id) {
        errors.push_back(join("Tech '", t.id, "' lists itself as a prereq"));
      }
    }
  }

  // Prerequisite cycles would leave nodes permanently locked.
  // 0 = unvisited, 1 = on stack, 2 = done.
  std::unordered_map<std::string, int> visit;
  std::vector<std::string> stack;
  std::unordered_set<std::string> reported;

  std::function<void(const std::string&)> dfs = [&](const std::string& id) {
    visit[id] = 1;
    stack.push_back(id);
    const TechNode* t = by_id.at(id);
    std::vector<std::string> prereqs = t->prereqs;
    std::sort(prereqs.begin(), prereqs.end());
    for (const auto& p : prereqs) {
      if (by_id.find(p) == by_id.end() || p == id) continue;
      const int st = visit[p];
      if (st == 0) {
        dfs(p);
      } else if (st == 1) {
        auto start = std::find(stack.begin(), stack.end(), p);
        std::vector<std::string> cycle(start, stack.end());
        std::sort(cycle.begin(), cycle.end());
        std::string key;
        for (const auto& c : cycle) key += (key.empty() ? "" : "|") + c;
        if (reported.insert(key).second) errors.push_back("Tech prerequisite cycle detected: " + key);
      }
    }
    stack.pop_back();
    visit[id] = 2;
  };

  for (const auto& id : util::sorted_keys(by_id)) {
    if (visit[id] == 0) dfs(id);
  }
}

void validate_factions(const ContentDB& db, std::vector<std::string>& errors) {
  std::unordered_set<std::string> ids;
  for (const auto& f : db.factions) {
    if (f.id.empty()) {
      errors.push_back("Faction template with empty id");
      continue;
    }
    if (!ids.insert(f.id).second) errors.push_back(join("Duplicate faction id '", f.id, "'"));

    for (ResourceKey k : kAllResources) {
      if (!in_stat_range(f.resources.get(k))) {
        errors.push_back(join("Faction '", f.id, "' resource ", resource_key_to_string(k), " out of range"));
      }
    }
    if (!in_stat_range(f.safety_culture) || !in_stat_range(f.opsec)) {
      errors.push_back(join("Faction '", f.id, "' stats out of range"));
    }
    if (!in_stat_range(f.capability_score) || !in_stat_range(f.safety_score)) {
      errors.push_back(join("Faction '", f.id, "' scores out of range"));
    }
    if (f.public_opinion && !in_stat_range(*f.public_opinion)) {
      errors.push_back(join("Faction '", f.id, "' public_opinion out of range"));
    }
    if (f.security_level && (*f.security_level < kMinSecurityLevel || *f.security_level > kMaxSecurityLevel)) {
      errors.push_back(join("Faction '", f.id, "' security_level out of range"));
    }
  }
}

void validate_actions(const ContentDB& db, std::vector<std::string>& errors) {
  for (const auto& id : util::sorted_keys(db.actions)) {
    const auto& a = db.actions.at(id);
    if (a.id != id) errors.push_back(join("Action key '", id, "' does not match id '", a.id, "'"));
    if (a.kind.empty()) errors.push_back(join("Action '", id, "' has an empty kind"));
    if (a.allowed_for.empty()) errors.push_back(join("Action '", id, "' is not allowed for any faction type"));
    if (a.exposure < 0.0) errors.push_back(join("Action '", id, "' has negative exposure"));

    if (!a.faction_specific.empty()) {
      const FactionTemplate* owner = db.find_template(a.faction_specific);
      if (!owner) {
        errors.push_back(join("Action '", id, "' is specific to unknown faction '", a.faction_specific, "'"));
      } else if (!a.allows(owner->type)) {
        errors.push_back(join("Action '", id, "' is specific to '", a.faction_specific, "' whose type (",
                              faction_type_to_string(owner->type), ") may not take it"));
      }
    }
  }
}

} // namespace

std::vector<std::string> validate_content_db(const ContentDB& db) {
  std::vector<std::string> errors;
  validate_techs(db, errors);
  validate_factions(db, errors);
  validate_actions(db, errors);
  return errors;
}

} // namespace agirace
