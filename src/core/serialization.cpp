#include "agirace/core/serialization.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "agirace/core/enum_strings.h"
#include "agirace/core/stats.h"
#include "agirace/util/sorted_keys.h"

namespace agirace {
namespace {

using json::Array;
using json::Object;
using json::Value;
using json::find_key;

Value resources_to_json(const Resources& r) {
  Object o;
  for (ResourceKey k : kAllResources) o[resource_key_to_string(k)] = r.get(k);
  return o;
}

Resources resources_from_json(const Value& v) {
  Resources r;
  for (const auto& [k, x] : v.object()) r.ref(resource_key_from_string(k)) = x.number_value(0.0);
  return r;
}

Value research_to_json(const ResearchPools& p) {
  Object o;
  for (Branch b : kAllBranches) o[branch_to_string(b)] = p.get(b);
  return o;
}

ResearchPools research_from_json(const Value& v) {
  ResearchPools p;
  for (const auto& [k, x] : v.object()) p.ref(branch_from_string(k)) = std::max(0.0, x.number_value(0.0));
  return p;
}

Value faction_to_json(const FactionState& f) {
  Object o;
  o["id"] = f.id;
  o["name"] = f.name;
  o["type"] = faction_type_to_string(f.type);
  o["resources"] = resources_to_json(f.resources);
  o["safety_culture"] = f.safety_culture;
  o["opsec"] = f.opsec;
  o["capability_score"] = f.capability_score;
  o["safety_score"] = f.safety_score;
  o["exposure"] = f.exposure;
  o["research"] = research_to_json(f.research);
  Array techs;
  for (const auto& t : f.unlocked_techs) techs.push_back(t);
  o["unlocked_techs"] = techs;
  o["can_deploy_agi"] = f.can_deploy_agi;
  o["public_opinion"] = f.public_opinion;
  o["security_level"] = static_cast<double>(f.security_level);
  return o;
}

double bounded(const Object& o, const char* key, double def) {
  const auto* v = find_key(o, key);
  return clamp_stat(v ? v->number_value(def) : def);
}

FactionState faction_from_json(const Value& v) {
  const auto& o = v.object();
  FactionState f;
  f.id = o.at("id").string_value();
  if (f.id.empty()) throw std::runtime_error("Save contains a faction with an empty id");
  f.name = find_key(o, "name") ? o.at("name").string_value(f.id) : f.id;
  f.type = faction_type_from_string(o.at("type").string_value());
  if (const auto* r = find_key(o, "resources")) {
    f.resources = resources_from_json(*r);
    for (ResourceKey k : kAllResources) f.resources.ref(k) = clamp_stat(f.resources.get(k));
  }
  f.safety_culture = bounded(o, "safety_culture", 0.0);
  f.opsec = bounded(o, "opsec", 0.0);
  f.capability_score = bounded(o, "capability_score", 0.0);
  f.safety_score = bounded(o, "safety_score", 0.0);
  if (const auto* e = find_key(o, "exposure")) f.exposure = std::max(0.0, e->number_value(0.0));
  if (const auto* r = find_key(o, "research")) f.research = research_from_json(*r);
  if (const auto* t = find_key(o, "unlocked_techs")) {
    for (const auto& id : t->array()) util::push_unique(f.unlocked_techs, id.string_value());
  }
  if (const auto* d = find_key(o, "can_deploy_agi")) f.can_deploy_agi = d->bool_value(false);
  f.public_opinion = bounded(o, "public_opinion", f.is_government() ? 50.0 : f.resources.trust);
  if (const auto* s = find_key(o, "security_level")) {
    f.security_level = std::clamp(static_cast<int>(s->int_value(2)), kMinSecurityLevel, kMaxSecurityLevel);
  } else {
    f.security_level = f.is_government() ? 3 : 2;
  }
  return f;
}

} // namespace

json::Value serialize_game_to_json_value(const GameState& s) {
  Object root;
  root["save_version"] = static_cast<double>(s.save_version);
  root["turn"] = static_cast<double>(s.turn);
  root["year"] = static_cast<double>(s.year);
  root["quarter"] = static_cast<double>(s.quarter);
  root["global_safety"] = s.global_safety;
  root["game_over"] = s.game_over;
  root["winner_id"] = s.winner_id;
  root["loser_id"] = s.loser_id;
  root["victory_type"] = victory_type_to_string(s.victory_type);
  root["loss_type"] = loss_type_to_string(s.loss_type);
  root["player_faction_id"] = s.player_faction_id;

  Array factions;
  for (const auto& id : util::sorted_keys(s.factions)) factions.push_back(faction_to_json(s.factions.at(id)));
  root["factions"] = factions;

  Array alliances;
  for (const auto& id : util::sorted_keys(s.alliances)) {
    const auto& allies = s.alliances.at(id);
    if (allies.empty()) continue;
    Object o;
    o["faction"] = id;
    Array a;
    for (const auto& ally : allies) a.push_back(ally);
    o["allies"] = a;
    alliances.push_back(o);
  }
  root["alliances"] = alliances;

  Array tensions;
  for (const auto& key : util::sorted_keys(s.tensions)) {
    Object o;
    o["pair"] = key;
    o["value"] = s.tensions.at(key);
    tensions.push_back(o);
  }
  root["tensions"] = tensions;

  Array treaties;
  for (const auto& t : s.treaties) treaties.push_back(t);
  root["treaties"] = treaties;

  Array log;
  const std::size_t first = s.log.size() > kMaxSavedLogEntries ? s.log.size() - kMaxSavedLogEntries : 0;
  for (std::size_t i = first; i < s.log.size(); ++i) log.push_back(s.log[i]);
  root["log"] = log;

  return root;
}

std::string serialize_game_to_json(const GameState& s) { return json::stringify(serialize_game_to_json_value(s), 2); }

GameState deserialize_game_from_json(const std::string& json_text) {
  const auto doc = json::parse(json_text);
  const auto& root = doc.object();

  GameState s;
  const int version = static_cast<int>(root.at("save_version").int_value(0));
  if (version < 1 || version > kCurrentSaveVersion) {
    throw std::runtime_error("Unsupported save_version: " + std::to_string(version));
  }
  s.save_version = kCurrentSaveVersion;

  s.turn = static_cast<int>(root.at("turn").int_value(0));
  s.year = static_cast<int>(root.at("year").int_value(2026));
  s.quarter = static_cast<int>(root.at("quarter").int_value(1));
  if (s.turn < 0) throw std::runtime_error("Save has a negative turn");
  if (s.quarter < 1 || s.quarter > 4) throw std::runtime_error("Save has an invalid quarter");

  if (const auto* v = find_key(root, "game_over")) s.game_over = v->bool_value(false);
  if (const auto* v = find_key(root, "winner_id")) s.winner_id = v->string_value();
  if (const auto* v = find_key(root, "loser_id")) s.loser_id = v->string_value();
  if (const auto* v = find_key(root, "victory_type")) s.victory_type = victory_type_from_string(v->string_value());
  if (const auto* v = find_key(root, "loss_type")) s.loss_type = loss_type_from_string(v->string_value());
  if (const auto* v = find_key(root, "player_faction_id")) s.player_faction_id = v->string_value();

  for (const auto& fv : root.at("factions").array()) {
    FactionState f = faction_from_json(fv);
    const std::string id = f.id;
    if (!s.factions.emplace(id, std::move(f)).second) throw std::runtime_error("Duplicate faction in save: " + id);
  }

  const auto known = [&](const std::string& id) { return find_ptr(s.factions, id) != nullptr; };

  if (!s.player_faction_id.empty() && !known(s.player_faction_id)) {
    throw std::runtime_error("Save references unknown player faction: " + s.player_faction_id);
  }

  if (const auto* v = find_key(root, "alliances")) {
    for (const auto& av : v->array()) {
      const auto& o = av.object();
      const std::string id = o.at("faction").string_value();
      if (!known(id)) continue;
      for (const auto& ally : o.at("allies").array()) {
        const std::string other = ally.string_value();
        if (!known(other) || other == id) continue;
        util::push_unique(s.alliances[id], other);
        util::push_unique(s.alliances[other], id);
      }
    }
  }

  if (const auto* v = find_key(root, "tensions")) {
    for (const auto& tv : v->array()) {
      const auto& o = tv.object();
      s.tensions[o.at("pair").string_value()] = o.at("value").number_value(0.0);
    }
  }

  if (const auto* v = find_key(root, "treaties")) {
    for (const auto& t : v->array()) util::push_unique(s.treaties, t.string_value());
  }

  if (const auto* v = find_key(root, "log")) {
    for (const auto& e : v->array()) s.log.push_back(e.string_value());
  }

  s.global_safety = compute_global_safety(s);
  return s;
}

} // namespace agirace
