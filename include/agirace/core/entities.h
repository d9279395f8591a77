#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agirace {

// Bounded fields (resources, culture stats, scores) live in [kMinStat, kMaxStat].
inline constexpr double kMinStat = 0.0;
inline constexpr double kMaxStat = 100.0;

inline constexpr int kMinSecurityLevel = 1;
inline constexpr int kMaxSecurityLevel = 5;

enum class FactionType { Lab, Government };

enum class Branch { Capabilities, Safety, Ops, Policy };

// All branches in canonical order. Ties between branches resolve to the earlier entry.
inline constexpr Branch kAllBranches[] = {Branch::Capabilities, Branch::Safety, Branch::Ops, Branch::Policy};

enum class Openness { Open, Secret };

enum class ResourceKey { Compute, Talent, Capital, Data, Influence, Trust };

inline constexpr ResourceKey kAllResources[] = {ResourceKey::Compute, ResourceKey::Talent,
                                                ResourceKey::Capital, ResourceKey::Data,
                                                ResourceKey::Influence, ResourceKey::Trust};

enum class StatKey { SafetyCulture, Opsec };

struct Resources {
  double compute{0.0};
  double talent{0.0};
  double capital{0.0};
  double data{0.0};
  double influence{0.0};
  double trust{0.0};

  double get(ResourceKey k) const;
  double& ref(ResourceKey k);
};

struct ResearchPools {
  double capabilities{0.0};
  double safety{0.0};
  double ops{0.0};
  double policy{0.0};

  double get(Branch b) const;
  double& ref(Branch b);
};

// Partial deltas: absent keys leave the field untouched.
using ResourceDelta = std::map<ResourceKey, double>;
using StatDelta = std::map<StatKey, double>;
using ResearchGrant = std::map<Branch, double>;

struct ScoreEffects {
  double capability{0.0};
  double safety{0.0};
};

struct FactionState {
  std::string id;
  std::string name;
  FactionType type{FactionType::Lab};

  Resources resources;

  double safety_culture{0.0};
  double opsec{0.0};

  double capability_score{0.0};
  double safety_score{0.0};

  // Accumulated detection risk from secret activity. Reset to 0 when detected.
  double exposure{0.0};

  ResearchPools research;

  // Append-only, kept in unlock order.
  std::vector<std::string> unlocked_techs;

  // Set by a tech effect; never cleared.
  bool can_deploy_agi{false};

  double public_opinion{50.0};
  int security_level{2};

  bool is_lab() const { return type == FactionType::Lab; }
  bool is_government() const { return type == FactionType::Government; }
  bool has_tech(const std::string& tech_id) const;
};

// Inputs to the heuristic decision policy (each 0..100).
struct StrategyProfile {
  double risk_tolerance{50.0};
  double safety_focus{50.0};
  double openness_preference{50.0};
  double espionage_focus{25.0};
};

// Starting configuration for one faction in a new game.
struct FactionTemplate {
  std::string id;
  std::string name;
  FactionType type{FactionType::Lab};

  // Geopolitical bloc; governments sponsor the labs that share it.
  std::string bloc;

  Resources resources;
  double safety_culture{0.0};
  double opsec{0.0};
  double capability_score{0.0};
  double safety_score{0.0};

  // Defaults depend on faction type when absent (see make_initial_state).
  std::optional<double> public_opinion;
  std::optional<int> security_level;

  StrategyProfile strategy;
};

// Static action catalog entry.
struct ActionDefinition {
  std::string id;
  std::string name;

  // Discriminator for kind-specific resolution. Equal to the id for the built-in catalog.
  std::string kind;

  std::vector<FactionType> allowed_for;

  // Non-empty: only this faction may select the action.
  std::string faction_specific;

  ResearchGrant base_research;
  ResourceDelta base_resource_delta;

  // Added to the actor's exposure when the action is taken in secret.
  double exposure{0.0};

  std::optional<ScoreEffects> score_effects;
  int security_level_delta{0};

  bool allows(FactionType t) const;
};

enum class TechEffectType { Capability, Safety, Resource, Stat, UnlockAgi };

struct TechEffect {
  TechEffectType type{TechEffectType::Capability};
  ResourceKey resource{ResourceKey::Compute};  // Resource effects only.
  StatKey stat{StatKey::SafetyCulture};         // Stat effects only.
  double value{0.0};
};

struct TechNode {
  std::string id;
  std::string name;
  Branch branch{Branch::Capabilities};
  double cost{0.0};
  std::vector<std::string> prereqs;
  std::vector<TechEffect> effects;
};

// One selected action for a turn, produced by an external policy.
struct ActionChoice {
  std::string action_id;
  Openness openness{Openness::Open};
  // Empty when the action has no target.
  std::string target_faction_id;
};

} // namespace agirace
