#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "agirace/core/ai_policy.h"
#include "agirace/core/serialization.h"
#include "agirace/core/simulation.h"
#include "agirace/core/stats.h"
#include "agirace/core/tech.h"
#include "agirace/util/digest.h"
#include "agirace/util/hash_rng.h"
#include "agirace/util/json.h"

#define AGR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool load_throws(const std::string& text) {
  try {
    (void)agirace::deserialize_game_from_json(text);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int test_serialization() {
  using namespace agirace;

  Simulation sim(load_default_content(), SimConfig{});
  sim.new_game("us_lab_b");
  const RandomSource rng = util::make_u01_source(11);
  for (int i = 0; i < 10 && !sim.state().game_over; ++i) {
    (void)sim.advance_turn(decide_all_actions(sim.state(), sim.content(), sim.cfg(), rng), rng);
  }
  // Give the relationship containers something to carry.
  sim.state().alliances["us_gov"] = {"us_lab_a"};
  sim.state().alliances["us_lab_a"] = {"us_gov"};
  sim.state().tensions[tension_key("us_gov", "cn_gov")] = 14.5;
  sim.state().treaties.push_back("alliance:cn_gov|us_gov");

  const GameState& original = sim.state();
  const std::string text = serialize_game_to_json(original);
  const GameState loaded = deserialize_game_from_json(text);

  {
    DigestOptions opt;
    opt.include_log = false;
    AGR_ASSERT(digest_game_state64(loaded, opt) == digest_game_state64(original, opt));
    AGR_ASSERT(loaded.player_faction_id == "us_lab_b");
    AGR_ASSERT(loaded.turn == original.turn);
    AGR_ASSERT(loaded.tensions.at("cn_gov|us_gov") == 14.5);
    AGR_ASSERT(serialize_game_to_json(deserialize_game_from_json(serialize_game_to_json(loaded))) ==
               serialize_game_to_json(loaded));
  }

  // Only the most recent log entries are kept.
  {
    GameState s = original;
    s.log.clear();
    for (int i = 0; i < 60; ++i) s.log.push_back("entry " + std::to_string(i));
    const GameState back = deserialize_game_from_json(serialize_game_to_json(s));
    AGR_ASSERT(back.log.size() == kMaxSavedLogEntries);
    AGR_ASSERT(back.log.front() == "entry 10");
    AGR_ASSERT(back.log.back() == "entry 59");
  }

  // Global safety is recomputed rather than trusted.
  {
    auto v = serialize_game_to_json_value(original);
    std::get<json::Object>(v)["global_safety"] = 99.0;
    const GameState back = deserialize_game_from_json(json::stringify(v));
    AGR_ASSERT(back.global_safety == compute_global_safety(back));
    AGR_ASSERT(back.global_safety == original.global_safety);
  }

  // Terminal outcome survives a round trip.
  {
    GameState s = original;
    s.game_over = true;
    s.winner_id = "us_gov";
    s.victory_type = VictoryType::Regulatory;
    const GameState back = deserialize_game_from_json(serialize_game_to_json(s));
    AGR_ASSERT(back.game_over);
    AGR_ASSERT(back.winner_id == "us_gov");
    AGR_ASSERT(back.victory_type == VictoryType::Regulatory);
    AGR_ASSERT(back.loss_type == LossType::None);
  }

  // Malformed saves.
  {
    auto bump = [&](const char* key, json::Value value) {
      auto v = serialize_game_to_json_value(original);
      std::get<json::Object>(v)[key] = std::move(value);
      return json::stringify(v);
    };
    AGR_ASSERT(load_throws(bump("save_version", 99.0)));
    AGR_ASSERT(load_throws(bump("quarter", 5.0)));
    AGR_ASSERT(load_throws(bump("turn", -1.0)));
    AGR_ASSERT(load_throws(bump("player_faction_id", std::string("martians"))));
    AGR_ASSERT(load_throws("{\"save_version\": 1"));
  }

  return 0;
}
