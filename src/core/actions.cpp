#include "agirace/core/actions.h"

#include <algorithm>

#include "agirace/core/enum_strings.h"
#include "agirace/core/stats.h"
#include "agirace/util/log.h"
#include "agirace/util/sorted_keys.h"

namespace agirace {
namespace {

constexpr double kSubsidyCapital = 6.0;

constexpr double kRegulateCompute = 6.0;
constexpr double kRegulateInfluence = 2.0;
constexpr double kRegulateCapability = 4.0;

constexpr double kExecutiveOrderCompute = 8.0;
constexpr double kExecutiveOrderInfluence = 3.0;
constexpr double kExecutiveOrderCapability = 6.0;
constexpr double kExecutiveOrderActorSafety = 3.0;

constexpr double kInitiativeCompute = 8.0;
constexpr double kInitiativeData = 4.0;

constexpr double kCounterintelOpsec = 6.0;
constexpr double kDefensiveMeasuresOpsec = 4.0;

constexpr double kOpenSourceRivalCapability = 2.0;

constexpr double kAllianceTensionRelief = 5.0;

void apply_generic_effects(FactionState& actor, const ActionDefinition& def, Openness openness,
                           const SimConfig& cfg) {
  apply_resource_delta(actor, def.base_resource_delta);

  const OpennessModifiers& mod = openness_modifiers(cfg, openness);
  apply_resource(actor, ResourceKey::Trust, mod.trust_delta);
  apply_score_delta(actor, ScoreEffects{mod.capability_delta, mod.safety_delta});

  for (const auto& [branch, base] : def.base_research) {
    if (base > 0.0) {
      add_research(actor, branch, compute_research_gain(actor, branch, base) * mod.research_multiplier);
    } else {
      // Negative grants (e.g. giving work away) drain the pool directly.
      add_research(actor, branch, base);
    }
  }

  if (def.score_effects) apply_score_delta(actor, *def.score_effects);
  if (def.security_level_delta != 0) apply_security_level_delta(actor, def.security_level_delta);
  if (openness == Openness::Secret) actor.exposure += def.exposure;
}

enum class TargetRule { None, AnyOther, Lab };

TargetRule target_rule(const std::string& kind) {
  if (kind == "espionage" || kind == "form_alliance") return TargetRule::AnyOther;
  if (kind == "subsidize" || kind == "strategic_initiative" || kind == "regulate" || kind == "executive_order") {
    return TargetRule::Lab;
  }
  return TargetRule::None;
}

// Resolves and checks the choice's target. Returns false (after logging) if a
// targeted kind has no usable target.
bool resolve_target(GameState& state, const FactionState& actor, const ActionDefinition& def,
                    const ActionChoice& choice, TurnLog& log, FactionState** out) {
  *out = nullptr;
  const TargetRule rule = target_rule(def.kind);
  if (rule == TargetRule::None) return true;

  FactionState* target = find_ptr(state.factions, choice.target_faction_id);
  if (!target || target->id == actor.id) {
    log.warn(actor.name + " chose " + def.name + " without a valid target.");
    return false;
  }
  if (rule == TargetRule::Lab && !target->is_lab()) {
    log.warn(actor.name + " chose " + def.name + " against " + target->name + ", which is not a lab.");
    return false;
  }
  *out = target;
  return true;
}

void form_alliance(GameState& state, const FactionState& actor, const FactionState& target, TurnLog& log) {
  const bool added = util::push_unique(state.alliances[actor.id], target.id);
  util::push_unique(state.alliances[target.id], actor.id);

  const std::string key = tension_key(actor.id, target.id);
  if (auto* t = find_ptr(state.tensions, key)) *t = std::max(0.0, *t - kAllianceTensionRelief);

  if (actor.is_government() && target.is_government()) util::push_unique(state.treaties, "alliance:" + key);

  if (added) {
    log.add(actor.name + " formed an alliance with " + target.name + ".");
  } else {
    log.add(actor.name + " reaffirmed its alliance with " + target.name + ".");
  }
}

} // namespace

bool action_allowed(const ActionDefinition& def, const FactionState& f, std::string* why) {
  if (!def.allows(f.type)) {
    if (why) *why = def.name + " is not available to a " + faction_type_to_string(f.type);
    return false;
  }
  if (!def.faction_specific.empty() && def.faction_specific != f.id) {
    if (why) *why = def.name + " is reserved for " + def.faction_specific;
    return false;
  }
  return true;
}

ActionResult resolve_action(GameState& state, const std::string& actor_id, const ActionDefinition& def,
                            const ActionChoice& choice, const SimConfig& cfg, const RandomSource& rng,
                            TurnLog& log) {
  ActionResult res;
  FactionState* actor_ptr = find_ptr(state.factions, actor_id);
  if (!actor_ptr) {
    log.warn("Choices submitted for unknown faction " + actor_id + ".");
    return res;
  }
  FactionState& actor = *actor_ptr;

  std::string why;
  if (!action_allowed(def, actor, &why)) {
    log.add(actor.name + " attempted invalid action " + def.name + ".");
    log::debug(why);
    return res;
  }

  apply_generic_effects(actor, def, choice.openness, cfg);
  res.applied = true;

  // Past this point a missing unlock or a bad target only skips the kind effect.
  if (def.kind == "deploy_agi" && !(actor.is_lab() && actor.can_deploy_agi)) {
    log.add(actor.name + " attempted AGI deployment without the breakthrough.");
    return res;
  }

  FactionState* target = nullptr;
  if (!resolve_target(state, actor, def, choice, log, &target)) return res;

  const std::string& kind = def.kind;
  if (kind == "deploy_agi") {
    res.deploy_attempt = true;
    log.add(actor.name + " is attempting to deploy AGI.");
  } else if (kind == "espionage") {
    const EspionageOutcome out = resolve_espionage(actor, *target, cfg, rng, log);
    if (out.detected) state.tensions[tension_key(actor.id, target->id)] += cfg.espionage_tension_increase;
  } else if (kind == "subsidize") {
    apply_resource(*target, ResourceKey::Capital, kSubsidyCapital);
    log.add(actor.name + " subsidized " + target->name + ".");
  } else if (kind == "strategic_initiative") {
    apply_resource_delta(*target, {{ResourceKey::Compute, kInitiativeCompute}, {ResourceKey::Data, kInitiativeData}});
    log.add(actor.name + " launched a strategic initiative backing " + target->name + ".");
  } else if (kind == "regulate") {
    apply_resource_delta(*target,
                         {{ResourceKey::Compute, -kRegulateCompute}, {ResourceKey::Influence, -kRegulateInfluence}});
    apply_score_delta(*target, ScoreEffects{-kRegulateCapability, 0.0});
    log.add(actor.name + " imposed regulations on " + target->name + ".");
  } else if (kind == "executive_order") {
    apply_resource_delta(*target, {{ResourceKey::Compute, -kExecutiveOrderCompute},
                                   {ResourceKey::Influence, -kExecutiveOrderInfluence}});
    apply_score_delta(*target, ScoreEffects{-kExecutiveOrderCapability, 0.0});
    apply_score_delta(actor, ScoreEffects{0.0, kExecutiveOrderActorSafety});
    log.add(actor.name + " issued an executive order restricting " + target->name + ".");
  } else if (kind == "counterintel") {
    apply_stat(actor, StatKey::Opsec, kCounterintelOpsec);
    log.add(actor.name + " strengthened counter-intelligence.");
  } else if (kind == "defensive_measures") {
    apply_stat(actor, StatKey::Opsec, kDefensiveMeasuresOpsec);
    log.add(actor.name + " hardened its security (level " + std::to_string(actor.security_level) + ").");
  } else if (kind == "form_alliance") {
    form_alliance(state, actor, *target, log);
  } else if (kind == "open_source_release") {
    for (const auto& id : util::sorted_keys(state.factions)) {
      FactionState& other = state.factions.at(id);
      if (other.is_lab() && other.id != actor.id) {
        apply_score_delta(other, ScoreEffects{kOpenSourceRivalCapability, 0.0});
      }
    }
    log.add(actor.name + " released model weights as open source.");
  } else {
    log.add(actor.name + " executed " + def.name +
            (choice.openness == Openness::Secret ? " in secret." : "."));
  }

  return res;
}

} // namespace agirace
