#include "agirace/core/ai_policy.h"

#include <algorithm>
#include <stdexcept>

#include "agirace/util/sorted_keys.h"

namespace agirace {
namespace {

const StrategyProfile& strategy_for(const ContentDB& content, const std::string& faction_id) {
  const FactionTemplate* t = content.find_template(faction_id);
  if (!t) throw std::runtime_error("Missing strategy for " + faction_id);
  return t->strategy;
}

Openness roll_openness(double preference, const RandomSource& rng) {
  return rng() * 100.0 < preference ? Openness::Open : Openness::Secret;
}

ActionChoice make_choice(const std::string& action_id, Openness o, const std::string& target = "") {
  ActionChoice c;
  c.action_id = action_id;
  c.openness = o;
  c.target_faction_id = target;
  return c;
}

// Highest capability first; ties by id.
const FactionState* top_capability_lab(const GameState& state) {
  const FactionState* best = nullptr;
  for (const auto& id : util::sorted_keys(state.factions)) {
    const FactionState& f = state.factions.at(id);
    if (!f.is_lab()) continue;
    if (!best || f.capability_score > best->capability_score) best = &f;
  }
  return best;
}

// Weakest lab sharing the government's bloc; ties by id.
const FactionState* weakest_sponsored_lab(const GameState& state, const ContentDB& content,
                                          const std::string& bloc) {
  if (bloc.empty()) return nullptr;
  const FactionState* best = nullptr;
  for (const auto& id : util::sorted_keys(state.factions)) {
    const FactionState& f = state.factions.at(id);
    if (!f.is_lab()) continue;
    const FactionTemplate* t = content.find_template(id);
    if (!t || t->bloc != bloc) continue;
    if (!best || f.capability_score < best->capability_score) best = &f;
  }
  return best;
}

void decide_lab(const GameState& state, const ContentDB& content, const SimConfig& cfg, const FactionState& f,
                const StrategyProfile& strategy, Openness openness, const RandomSource& rng,
                std::vector<ActionChoice>& out) {
  if (f.can_deploy_agi && f.safety_score >= cfg.safe_agi_faction_safety &&
      state.global_safety >= cfg.safe_agi_global_safety) {
    out.push_back(make_choice("deploy_agi", Openness::Open));
    return;
  }

  const double safety_gap = cfg.catastrophe_faction_safety - f.safety_score;
  const bool prioritize_safety = safety_gap > 0.0 || strategy.safety_focus > strategy.risk_tolerance;
  out.push_back(make_choice(prioritize_safety ? "research_safety" : "research_capabilities", openness));

  if (f.resources.capital < 40.0) {
    out.push_back(make_choice("deploy_products", Openness::Open));
  } else if (f.resources.compute < 60.0) {
    out.push_back(make_choice("build_compute", Openness::Open));
  } else {
    std::vector<std::string> options;
    for (const char* id : {"policy", "deploy_products", "build_compute"}) {
      if (content.actions.count(id)) options.push_back(id);
    }
    if (!options.empty()) {
      const double u = rng();
      const std::size_t idx = std::min(options.size() - 1, static_cast<std::size_t>(u * options.size()));
      out.push_back(make_choice(options[idx], Openness::Open));
    }
  }
}

void decide_government(const GameState& state, const ContentDB& content, const SimConfig& cfg,
                       const FactionState& f, const StrategyProfile& strategy, std::vector<ActionChoice>& out) {
  const FactionState* top = top_capability_lab(state);

  if (top && state.global_safety < cfg.catastrophe_global_safety) {
    out.push_back(make_choice("regulate", Openness::Open, top->id));
  }

  const FactionTemplate* t = content.find_template(f.id);
  const FactionState* ally = weakest_sponsored_lab(state, content, t ? t->bloc : std::string());
  if (ally && f.resources.capital > 30.0) {
    out.push_back(make_choice("subsidize", Openness::Open, ally->id));
  } else {
    out.push_back(make_choice("policy", Openness::Open));
  }

  if (strategy.espionage_focus > 35.0) {
    if (top && top->id != f.id) out.push_back(make_choice("espionage", Openness::Secret, top->id));
  } else {
    out.push_back(make_choice("counterintel", Openness::Open));
  }
}

} // namespace

std::vector<ActionChoice> decide_actions_heuristic(const GameState& state, const ContentDB& content,
                                                   const SimConfig& cfg, const std::string& faction_id,
                                                   const RandomSource& rng) {
  std::vector<ActionChoice> out;
  const FactionState* f = find_ptr(state.factions, faction_id);
  if (!f) return out;

  const StrategyProfile& strategy = strategy_for(content, faction_id);
  const Openness openness = roll_openness(strategy.openness_preference, rng);

  if (f->is_lab()) {
    decide_lab(state, content, cfg, *f, strategy, openness, rng, out);
  } else {
    decide_government(state, content, cfg, *f, strategy, out);
  }

  const std::size_t cap = static_cast<std::size_t>(std::max(0, cfg.max_actions_per_turn));
  if (out.size() > cap) out.resize(cap);
  return out;
}

ChoiceMap decide_all_actions(const GameState& state, const ContentDB& content, const SimConfig& cfg,
                             const RandomSource& rng, const std::string& skip_faction_id) {
  ChoiceMap choices;
  for (const auto& id : util::sorted_keys(state.factions)) {
    if (id == skip_faction_id) continue;
    choices[id] = decide_actions_heuristic(state, content, cfg, id, rng);
  }
  return choices;
}

} // namespace agirace
