#include "agirace/core/tech.h"

#include <stdexcept>
#include <utility>

#include "agirace/core/enum_strings.h"
#include "agirace/util/file_io.h"
#include "agirace/util/json.h"

namespace agirace {
namespace {

using json::find_key;

constexpr const char* kDefaultCatalogPath = "data/content/catalog.json";
constexpr const char* kDefaultTechTreePath = "data/content/tech_tree.json";

std::string get_string(const json::Object& o, const std::string& key, const std::string& def) {
  const auto* v = find_key(o, key);
  return v ? v->string_value(def) : def;
}

double get_number(const json::Object& o, const std::string& key, double def) {
  const auto* v = find_key(o, key);
  return v ? v->number_value(def) : def;
}

Resources parse_resources(const json::Object& o) {
  Resources r;
  for (const auto& [k, v] : o) r.ref(resource_key_from_string(k)) = v.number_value(0.0);
  return r;
}

ResourceDelta parse_resource_delta(const json::Object& o) {
  ResourceDelta d;
  for (const auto& [k, v] : o) d[resource_key_from_string(k)] = v.number_value(0.0);
  return d;
}

ResearchGrant parse_research_grant(const json::Object& o) {
  ResearchGrant g;
  for (const auto& [k, v] : o) g[branch_from_string(k)] = v.number_value(0.0);
  return g;
}

ActionDefinition parse_action(const std::string& id, const json::Object& o) {
  ActionDefinition a;
  a.id = id;
  a.name = get_string(o, "name", id);
  a.kind = get_string(o, "kind", id);
  a.faction_specific = get_string(o, "faction_specific", "");
  a.exposure = get_number(o, "exposure", 0.0);
  a.security_level_delta = static_cast<int>(get_number(o, "security_level_delta", 0.0));

  if (const auto* v = find_key(o, "allowed_for")) {
    for (const auto& t : v->array()) a.allowed_for.push_back(faction_type_from_string(t.string_value()));
  }
  if (a.allowed_for.empty()) throw std::runtime_error("Action '" + id + "' has no allowed_for");

  if (const auto* v = find_key(o, "base_research")) a.base_research = parse_research_grant(v->object());
  if (const auto* v = find_key(o, "base_resource_delta")) a.base_resource_delta = parse_resource_delta(v->object());
  if (const auto* v = find_key(o, "score_effects")) {
    const auto& so = v->object();
    ScoreEffects se;
    se.capability = get_number(so, "capability", 0.0);
    se.safety = get_number(so, "safety", 0.0);
    a.score_effects = se;
  }
  return a;
}

FactionTemplate parse_faction_template(const json::Object& o) {
  FactionTemplate t;
  t.id = o.at("id").string_value();
  if (t.id.empty()) throw std::runtime_error("Faction template with empty id");
  t.name = get_string(o, "name", t.id);
  t.type = faction_type_from_string(o.at("type").string_value());
  t.bloc = get_string(o, "bloc", "");
  if (const auto* v = find_key(o, "resources")) t.resources = parse_resources(v->object());
  t.safety_culture = get_number(o, "safety_culture", 0.0);
  t.opsec = get_number(o, "opsec", 0.0);
  t.capability_score = get_number(o, "capability_score", 0.0);
  t.safety_score = get_number(o, "safety_score", 0.0);
  if (const auto* v = find_key(o, "public_opinion")) t.public_opinion = v->number_value(50.0);
  if (const auto* v = find_key(o, "security_level")) t.security_level = static_cast<int>(v->int_value(2));

  const auto& so = o.at("strategy").object();
  t.strategy.risk_tolerance = get_number(so, "risk_tolerance", t.strategy.risk_tolerance);
  t.strategy.safety_focus = get_number(so, "safety_focus", t.strategy.safety_focus);
  t.strategy.openness_preference = get_number(so, "openness_preference", t.strategy.openness_preference);
  t.strategy.espionage_focus = get_number(so, "espionage_focus", t.strategy.espionage_focus);
  return t;
}

TechEffect parse_tech_effect(const json::Object& o) {
  TechEffect e;
  e.type = tech_effect_type_from_string(o.at("type").string_value());
  e.value = get_number(o, "value", 0.0);
  if (e.type == TechEffectType::Resource) e.resource = resource_key_from_string(o.at("key").string_value());
  if (e.type == TechEffectType::Stat) e.stat = stat_key_from_string(o.at("key").string_value());
  return e;
}

} // namespace

ContentDB load_content_db_from_file(const std::string& path) {
  const auto root = json::parse(read_text_file(path));
  const auto& o = root.object();

  ContentDB db;
  if (const auto* acts = find_key(o, "actions")) {
    for (const auto& [id, v] : acts->object()) db.actions[id] = parse_action(id, v.object());
  }
  if (const auto* facs = find_key(o, "factions")) {
    for (const auto& v : facs->array()) db.factions.push_back(parse_faction_template(v.object()));
  }
  return db;
}

std::vector<TechNode> load_tech_db_from_file(const std::string& path) {
  const auto root = json::parse(read_text_file(path));

  std::vector<TechNode> out;
  for (const auto& v : root.at("techs").array()) {
    const auto& o = v.object();
    TechNode t;
    t.id = o.at("id").string_value();
    t.name = get_string(o, "name", t.id);
    t.branch = branch_from_string(o.at("branch").string_value());
    t.cost = o.at("cost").number_value();
    if (const auto* p = find_key(o, "prereqs")) {
      for (const auto& id : p->array()) t.prereqs.push_back(id.string_value());
    }
    if (const auto* e = find_key(o, "effects")) {
      for (const auto& ev : e->array()) t.effects.push_back(parse_tech_effect(ev.object()));
    }
    out.push_back(std::move(t));
  }
  return out;
}

ContentDB load_default_content() {
  ContentDB db = load_content_db_from_file(kDefaultCatalogPath);
  db.techs = load_tech_db_from_file(kDefaultTechTreePath);
  return db;
}

} // namespace agirace
