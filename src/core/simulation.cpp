#include "agirace/core/simulation.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "agirace/core/actions.h"
#include "agirace/core/content_validation.h"
#include "agirace/core/date.h"
#include "agirace/core/faction_rules.h"
#include "agirace/core/research.h"
#include "agirace/core/scenario.h"
#include "agirace/core/stats.h"
#include "agirace/core/turn_log.h"
#include "agirace/core/victory.h"
#include "agirace/util/log.h"
#include "agirace/util/sorted_keys.h"

namespace agirace {
namespace {

void refresh_global_safety(GameState& state) { state.global_safety = compute_global_safety(state); }

void advance_calendar(GameState& state, TurnLog& log) {
  const QuarterDate next = QuarterDate(state.year, state.quarter).next();
  state.turn += 1;
  state.year = next.year();
  state.quarter = next.quarter();
  log.add("--- " + next.to_string() + " ---");
}

void apply_income(GameState& state) {
  for (const auto& id : util::sorted_keys(state.factions)) {
    FactionState& f = state.factions.at(id);
    rules_for(f.type).apply_income(f);
  }
}

std::vector<std::string> apply_choices(GameState& state, const ContentDB& content, const SimConfig& cfg,
                                       const ChoiceMap& choices, const RandomSource& rng, TurnLog& log) {
  std::vector<std::string> deployers;

  for (const auto& [faction_id, list] : choices) {
    const FactionState* f = find_ptr(state.factions, faction_id);
    if (!f) {
      log.warn("Ignored choices for unknown faction '" + faction_id + "'.");
      continue;
    }

    const std::size_t limit = static_cast<std::size_t>(std::max(0, cfg.max_actions_per_turn));
    if (list.size() > limit) {
      log::debug(f->name + ": ignoring " + std::to_string(list.size() - limit) + " choice(s) over the per-turn limit");
    }

    for (std::size_t i = 0; i < list.size() && i < limit; ++i) {
      const ActionChoice& choice = list[i];
      const ActionDefinition* def = find_ptr(content.actions, choice.action_id);
      if (!def) {
        log.warn(f->name + " chose unknown action '" + choice.action_id + "'.");
        continue;
      }
      const ActionResult res = resolve_action(state, faction_id, *def, choice, cfg, rng, log);
      if (res.deploy_attempt) deployers.push_back(faction_id);
    }
  }

  return deployers;
}

} // namespace

std::vector<std::string> resolve_turn(GameState& state, const ContentDB& content, const SimConfig& cfg,
                                      const ChoiceMap& choices, const RandomSource& rng) {
  if (state.game_over) return {};

  TurnLog log;
  advance_calendar(state, log);

  apply_income(state);
  refresh_global_safety(state);

  const std::vector<std::string> deployers = apply_choices(state, content, cfg, choices, rng, log);
  refresh_global_safety(state);

  for (const auto& id : util::sorted_keys(state.factions)) {
    roll_detection(state.factions.at(id), cfg, rng, log);
  }
  refresh_global_safety(state);

  for (const auto& id : util::sorted_keys(state.factions)) {
    unlock_available_techs(content, state.factions.at(id), log);
  }
  refresh_global_safety(state);

  evaluate_deployments(state, deployers, cfg, log);
  evaluate_standing_conditions(state, cfg, log);
  evaluate_turn_limit(state, cfg, log);

  log::debug("resolved turn " + std::to_string(state.turn) + " (" + std::to_string(log.entries().size()) +
             " log entries, global safety " + std::to_string(state.global_safety) + ")");

  state.log.insert(state.log.end(), log.entries().begin(), log.entries().end());
  return log.entries();
}

Simulation::Simulation(ContentDB content, SimConfig cfg) : content_(std::move(content)), cfg_(std::move(cfg)) {
  const auto errors = validate_content_db(content_);
  if (!errors.empty()) {
    std::string msg = "Invalid content (" + std::to_string(errors.size()) + " error(s)):";
    for (const auto& e : errors) msg += "\n  - " + e;
    throw std::runtime_error(msg);
  }
  new_game();
}

void Simulation::new_game(const std::string& player_faction_id) {
  state_ = make_initial_state(content_, cfg_, player_faction_id);
}

void Simulation::load_game(GameState loaded) { state_ = std::move(loaded); }

std::vector<std::string> Simulation::advance_turn(const ChoiceMap& choices, const RandomSource& rng) {
  return resolve_turn(state_, content_, cfg_, choices, rng);
}

} // namespace agirace
