#include <iostream>
#include <string>

#include "agirace/core/victory.h"
#include "test.h"

#define AGR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool log_contains(const agirace::TurnLog& log, const std::string& needle) {
  for (const auto& e : log.entries()) {
    if (e.find(needle) != std::string::npos) return true;
  }
  return false;
}

} // namespace

int test_victory() {
  using namespace agirace;
  const SimConfig cfg;

  // Control: influence 125 with every lab at or below 15 capability.
  {
    GameState s;
    s.turn = cfg.min_victory_turn;
    test::put(s, test::make_government("gov", 125.0, 60.0));
    test::put(s, test::make_lab("lab_a", 15.0, 30.0));
    test::put(s, test::make_lab("lab_b", 8.0, 30.0));

    TurnLog log;
    evaluate_standing_conditions(s, cfg, log);
    AGR_ASSERT(s.game_over);
    AGR_ASSERT(s.winner_id == "gov");
    AGR_ASSERT(s.victory_type == VictoryType::Control);
    AGR_ASSERT(log_contains(log, "gov achieved total control over AI development!"));

    // Terminal states are not re-evaluated.
    TurnLog again;
    evaluate_standing_conditions(s, cfg, again);
    evaluate_turn_limit(s, cfg, again);
    AGR_ASSERT(again.empty());
  }

  // The same position before the minimum turn does nothing.
  {
    GameState s;
    s.turn = cfg.min_victory_turn - 1;
    test::put(s, test::make_government("gov", 125.0, 60.0));
    test::put(s, test::make_lab("lab_a", 15.0, 30.0));
    TurnLog log;
    evaluate_standing_conditions(s, cfg, log);
    AGR_ASSERT(!s.game_over);
    AGR_ASSERT(log.empty());
  }

  // A government coup ends the game before the minimum turn.
  {
    GameState s;
    s.turn = 10;
    s.player_faction_id = "gov";
    test::put(s, test::make_government("gov", 20.0, 60.0));
    test::put(s, test::make_lab("lab", 80.0, 30.0));
    TurnLog log;
    evaluate_standing_conditions(s, cfg, log);
    AGR_ASSERT(s.game_over);
    AGR_ASSERT(s.loser_id == "gov");
    AGR_ASSERT(s.loss_type == LossType::Coup);
    AGR_ASSERT(s.winner_id.empty());
    AGR_ASSERT(log_contains(log, "gov lost control as AI labs became too powerful."));
  }

  // A lab's collapse still waits for the minimum turn.
  {
    GameState s;
    s.turn = 10;
    s.player_faction_id = "lab";
    test::put(s, test::make_government("gov", 60.0, 60.0));
    auto lab = test::make_lab("lab", 30.0, 30.0);
    lab.resources.trust = 10.0;
    test::put(s, lab);
    TurnLog log;
    evaluate_standing_conditions(s, cfg, log);
    AGR_ASSERT(!s.game_over);

    s.turn = cfg.min_victory_turn;
    evaluate_standing_conditions(s, cfg, log);
    AGR_ASSERT(s.game_over);
    AGR_ASSERT(s.loser_id == "lab");
    AGR_ASSERT(s.loss_type == LossType::Collapse);
  }

  // Dominance needs a lead over the strongest rival.
  {
    GameState s;
    s.turn = 30;
    test::put(s, test::make_lab("a", 92.0, 30.0));
    test::put(s, test::make_lab("b", 50.0, 30.0));
    TurnLog log;
    evaluate_standing_conditions(s, cfg, log);
    AGR_ASSERT(!s.game_over);

    s.factions.at("b").capability_score = 40.0;
    evaluate_standing_conditions(s, cfg, log);
    AGR_ASSERT(s.game_over);
    AGR_ASSERT(s.winner_id == "a");
    AGR_ASSERT(s.victory_type == VictoryType::Dominant);
    AGR_ASSERT(log_contains(log, "a achieved technological dominance with a 130% lead!"));
  }

  // Only the player's standing loss ends the game.
  {
    GameState s;
    s.turn = 25;
    FactionState weak = test::make_lab("weak", 20.0, 30.0);
    weak.resources.trust = 10.0;
    test::put(s, weak);
    test::put(s, test::make_lab("other", 20.0, 30.0));

    TurnLog log;
    evaluate_standing_conditions(s, cfg, log);
    AGR_ASSERT(!s.game_over);
    AGR_ASSERT(log_contains(log, "Warning: weak collapsed due to loss of public trust."));

    s.player_faction_id = "weak";
    TurnLog log2;
    evaluate_standing_conditions(s, cfg, log2);
    AGR_ASSERT(s.game_over);
    AGR_ASSERT(s.loser_id == "weak");
    AGR_ASSERT(s.loss_type == LossType::Collapse);
    AGR_ASSERT(s.winner_id.empty());
  }

  // Coup: a weak government facing a strong lab.
  {
    GameState s;
    s.turn = 25;
    s.player_faction_id = "gov";
    test::put(s, test::make_government("gov", 20.0, 60.0));
    test::put(s, test::make_lab("lab", 75.0, 30.0));
    TurnLog log;
    evaluate_standing_conditions(s, cfg, log);
    AGR_ASSERT(s.game_over);
    AGR_ASSERT(s.loss_type == LossType::Coup);
  }

  // Deployment: safe after the gate wins.
  {
    GameState s;
    s.turn = 24;
    FactionState lab = test::make_lab("lab", 60.0, 90.0);
    lab.can_deploy_agi = true;
    test::put(s, lab);
    AGR_ASSERT(s.global_safety == 90.0);

    TurnLog log;
    evaluate_deployments(s, {"lab"}, cfg, log);
    AGR_ASSERT(s.game_over);
    AGR_ASSERT(s.winner_id == "lab");
    AGR_ASSERT(s.victory_type == VictoryType::SafeAgi);
  }

  // Safe but too early: held back, game continues.
  {
    GameState s;
    s.turn = 10;
    FactionState lab = test::make_lab("lab", 60.0, 90.0);
    lab.can_deploy_agi = true;
    test::put(s, lab);
    TurnLog log;
    evaluate_deployments(s, {"lab"}, cfg, log);
    AGR_ASSERT(!s.game_over);
    AGR_ASSERT(log_contains(log, "held back AGI deployment: too early"));
  }

  // Unsafe deployment is a catastrophe at any turn.
  {
    GameState s;
    s.turn = 3;
    FactionState lab = test::make_lab("lab", 60.0, 50.0);
    lab.can_deploy_agi = true;
    test::put(s, lab);
    TurnLog log;
    evaluate_deployments(s, {"lab"}, cfg, log);
    AGR_ASSERT(s.game_over);
    AGR_ASSERT(s.winner_id.empty());
    AGR_ASSERT(s.loser_id == "lab");
    AGR_ASSERT(s.loss_type == LossType::Catastrophe);
    AGR_ASSERT(log_contains(log, "lab deployed unsafe AGI. Global catastrophe ensues."));
  }

  // Between the bars: held back.
  {
    GameState s;
    s.turn = 28;
    FactionState lab = test::make_lab("lab", 60.0, 75.0);
    lab.can_deploy_agi = true;
    test::put(s, lab);
    TurnLog log;
    evaluate_deployments(s, {"lab"}, cfg, log);
    AGR_ASSERT(!s.game_over);
    AGR_ASSERT(log_contains(log, "safety margins insufficient"));
  }

  // Turn limit: safe labs hand the race to the strongest government.
  {
    GameState s;
    s.turn = cfg.max_turn;
    s.year = 2034;
    test::put(s, test::make_government("cn", 70.0, 50.0));
    test::put(s, test::make_government("us", 70.0, 65.0));
    FactionState lab = test::make_lab("lab", 30.0, 62.0);
    test::put(s, lab);
    s.factions.at("cn").safety_score = 62.0;
    s.factions.at("us").safety_score = 62.0;
    s.global_safety = 62.0;

    TurnLog log;
    evaluate_turn_limit(s, cfg, log);
    AGR_ASSERT(s.game_over);
    AGR_ASSERT(s.winner_id == "us");
    AGR_ASSERT(s.victory_type == VictoryType::Regulatory);
    AGR_ASSERT(log_contains(log, "deadline in 2034"));
  }

  // Otherwise a stalemate.
  {
    GameState s;
    s.turn = cfg.max_turn;
    test::put(s, test::make_government("us", 70.0, 65.0));
    test::put(s, test::make_lab("lab", 30.0, 20.0));
    TurnLog log;
    evaluate_turn_limit(s, cfg, log);
    AGR_ASSERT(is_stalemate(s));
    AGR_ASSERT(log_contains(log, "stalemate"));
  }

  // Before the limit nothing happens.
  {
    GameState s;
    s.turn = cfg.max_turn - 1;
    test::put(s, test::make_lab("lab", 30.0, 20.0));
    TurnLog log;
    evaluate_turn_limit(s, cfg, log);
    AGR_ASSERT(!s.game_over);
  }

  // Progress report.
  {
    GameState s;
    FactionState lab = test::make_lab("lab", 45.0, 40.0);
    lab.resources.trust = 30.0;
    test::put(s, lab);
    test::put(s, test::make_lab("rival", 90.0, 40.0));
    test::put(s, test::make_government("gov", 60.0, 60.0));

    const auto lab_progress = calculate_victory_progress(s, "lab", cfg);
    bool saw_safe = false;
    bool saw_collapse = false;
    bool saw_obsolete = false;
    for (const auto& p : lab_progress) {
      AGR_ASSERT(p.progress >= 0.0 && p.progress <= 100.0);
      if (p.victory == VictoryType::SafeAgi) saw_safe = true;
      if (p.is_warning && p.loss == LossType::Collapse) saw_collapse = true;
      if (p.is_warning && p.loss == LossType::Obsolescence) saw_obsolete = true;
    }
    AGR_ASSERT(saw_safe);
    AGR_ASSERT(saw_collapse);
    AGR_ASSERT(saw_obsolete);

    const auto gov_progress = calculate_victory_progress(s, "gov", cfg);
    bool saw_control = false;
    for (const auto& p : gov_progress) {
      if (p.victory == VictoryType::Control) saw_control = true;
      AGR_ASSERT(p.victory != VictoryType::SafeAgi);
    }
    AGR_ASSERT(saw_control);

    AGR_ASSERT(calculate_victory_progress(s, "nobody", cfg).empty());
  }

  return 0;
}
