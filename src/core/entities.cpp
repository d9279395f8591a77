#include "agirace/core/game_state.h"

#include <algorithm>
#include <stdexcept>

namespace agirace {

double Resources::get(ResourceKey k) const {
  switch (k) {
    case ResourceKey::Compute: return compute;
    case ResourceKey::Talent: return talent;
    case ResourceKey::Capital: return capital;
    case ResourceKey::Data: return data;
    case ResourceKey::Influence: return influence;
    case ResourceKey::Trust: return trust;
  }
  return 0.0;
}

double& Resources::ref(ResourceKey k) {
  switch (k) {
    case ResourceKey::Compute: return compute;
    case ResourceKey::Talent: return talent;
    case ResourceKey::Capital: return capital;
    case ResourceKey::Data: return data;
    case ResourceKey::Influence: return influence;
    case ResourceKey::Trust: return trust;
  }
  return trust;
}

double ResearchPools::get(Branch b) const {
  switch (b) {
    case Branch::Capabilities: return capabilities;
    case Branch::Safety: return safety;
    case Branch::Ops: return ops;
    case Branch::Policy: return policy;
  }
  return 0.0;
}

double& ResearchPools::ref(Branch b) {
  switch (b) {
    case Branch::Capabilities: return capabilities;
    case Branch::Safety: return safety;
    case Branch::Ops: return ops;
    case Branch::Policy: return policy;
  }
  return policy;
}

bool FactionState::has_tech(const std::string& tech_id) const {
  return std::find(unlocked_techs.begin(), unlocked_techs.end(), tech_id) != unlocked_techs.end();
}

bool ActionDefinition::allows(FactionType t) const {
  return std::find(allowed_for.begin(), allowed_for.end(), t) != allowed_for.end();
}

const ActionDefinition& ContentDB::action(const std::string& id) const {
  auto it = actions.find(id);
  if (it == actions.end()) throw std::out_of_range("Unknown action id: " + id);
  return it->second;
}

const TechNode* ContentDB::find_tech(const std::string& id) const {
  for (const auto& t : techs) {
    if (t.id == id) return &t;
  }
  return nullptr;
}

const FactionTemplate* ContentDB::find_template(const std::string& id) const {
  for (const auto& f : factions) {
    if (f.id == id) return &f;
  }
  return nullptr;
}

std::string tension_key(const std::string& a, const std::string& b) {
  return a < b ? a + "|" + b : b + "|" + a;
}

} // namespace agirace
