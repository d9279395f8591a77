#include "agirace/core/enum_strings.h"

#include <stdexcept>

namespace agirace {

std::string faction_type_to_string(FactionType t) {
  switch (t) {
    case FactionType::Lab: return "lab";
    case FactionType::Government: return "government";
  }
  return "lab";
}

FactionType faction_type_from_string(const std::string& s) {
  if (s == "lab") return FactionType::Lab;
  if (s == "government" || s == "gov") return FactionType::Government;
  throw std::invalid_argument("Unknown faction type: " + s);
}

std::string branch_to_string(Branch b) {
  switch (b) {
    case Branch::Capabilities: return "capabilities";
    case Branch::Safety: return "safety";
    case Branch::Ops: return "ops";
    case Branch::Policy: return "policy";
  }
  return "capabilities";
}

Branch branch_from_string(const std::string& s) {
  if (s == "capabilities") return Branch::Capabilities;
  if (s == "safety") return Branch::Safety;
  if (s == "ops") return Branch::Ops;
  if (s == "policy") return Branch::Policy;
  throw std::invalid_argument("Unknown research branch: " + s);
}

std::string openness_to_string(Openness o) {
  return o == Openness::Secret ? "secret" : "open";
}

Openness openness_from_string(const std::string& s) {
  if (s == "open") return Openness::Open;
  if (s == "secret") return Openness::Secret;
  throw std::invalid_argument("Unknown openness: " + s);
}

std::string resource_key_to_string(ResourceKey k) {
  switch (k) {
    case ResourceKey::Compute: return "compute";
    case ResourceKey::Talent: return "talent";
    case ResourceKey::Capital: return "capital";
    case ResourceKey::Data: return "data";
    case ResourceKey::Influence: return "influence";
    case ResourceKey::Trust: return "trust";
  }
  return "compute";
}

ResourceKey resource_key_from_string(const std::string& s) {
  if (s == "compute") return ResourceKey::Compute;
  if (s == "talent") return ResourceKey::Talent;
  if (s == "capital") return ResourceKey::Capital;
  if (s == "data") return ResourceKey::Data;
  if (s == "influence") return ResourceKey::Influence;
  if (s == "trust") return ResourceKey::Trust;
  throw std::invalid_argument("Unknown resource: " + s);
}

std::string stat_key_to_string(StatKey k) {
  return k == StatKey::Opsec ? "opsec" : "safety_culture";
}

StatKey stat_key_from_string(const std::string& s) {
  if (s == "safety_culture") return StatKey::SafetyCulture;
  if (s == "opsec") return StatKey::Opsec;
  throw std::invalid_argument("Unknown stat: " + s);
}

std::string tech_effect_type_to_string(TechEffectType t) {
  switch (t) {
    case TechEffectType::Capability: return "capability";
    case TechEffectType::Safety: return "safety";
    case TechEffectType::Resource: return "resource";
    case TechEffectType::Stat: return "stat";
    case TechEffectType::UnlockAgi: return "unlock_agi";
  }
  return "capability";
}

TechEffectType tech_effect_type_from_string(const std::string& s) {
  if (s == "capability") return TechEffectType::Capability;
  if (s == "safety") return TechEffectType::Safety;
  if (s == "resource") return TechEffectType::Resource;
  if (s == "stat") return TechEffectType::Stat;
  if (s == "unlock_agi") return TechEffectType::UnlockAgi;
  throw std::invalid_argument("Unknown tech effect type: " + s);
}

std::string victory_type_to_string(VictoryType v) {
  switch (v) {
    case VictoryType::None: return "none";
    case VictoryType::SafeAgi: return "safe_agi";
    case VictoryType::Dominant: return "dominant";
    case VictoryType::PublicTrust: return "public_trust";
    case VictoryType::Regulatory: return "regulatory";
    case VictoryType::Alliance: return "alliance";
    case VictoryType::Control: return "control";
  }
  return "none";
}

VictoryType victory_type_from_string(const std::string& s) {
  if (s == "safe_agi") return VictoryType::SafeAgi;
  if (s == "dominant") return VictoryType::Dominant;
  if (s == "public_trust") return VictoryType::PublicTrust;
  if (s == "regulatory") return VictoryType::Regulatory;
  if (s == "alliance") return VictoryType::Alliance;
  if (s == "control") return VictoryType::Control;
  return VictoryType::None;
}

std::string loss_type_to_string(LossType l) {
  switch (l) {
    case LossType::None: return "none";
    case LossType::Catastrophe: return "catastrophe";
    case LossType::Collapse: return "collapse";
    case LossType::Obsolescence: return "obsolescence";
    case LossType::Coup: return "coup";
  }
  return "none";
}

LossType loss_type_from_string(const std::string& s) {
  if (s == "catastrophe") return LossType::Catastrophe;
  if (s == "collapse") return LossType::Collapse;
  if (s == "obsolescence") return LossType::Obsolescence;
  if (s == "coup") return LossType::Coup;
  return LossType::None;
}

} // namespace agirace
