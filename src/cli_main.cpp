#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "agirace/core/ai_policy.h"
#include "agirace/core/content_validation.h"
#include "agirace/core/date.h"
#include "agirace/core/enum_strings.h"
#include "agirace/core/serialization.h"
#include "agirace/core/sim_config.h"
#include "agirace/core/simulation.h"
#include "agirace/core/stats.h"
#include "agirace/core/tech.h"
#include "agirace/core/victory.h"
#include "agirace/util/digest.h"
#include "agirace/util/file_io.h"
#include "agirace/util/hash_rng.h"
#include "agirace/util/log.h"
#include "agirace/util/sorted_keys.h"
#include "agirace/util/strings.h"

namespace {

#ifndef AGIRACE_VERSION
#define AGIRACE_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "AGI Race CLI v" << AGIRACE_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "agirace_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --turns N           Resolve up to N quarters (default: 32)\n";
  std::cout << "  --seed N            RNG seed for policy and turn resolution (default: 42)\n";
  std::cout << "  --player ID         Faction whose standing losses end the game\n";
  std::cout << "  --content PATH      Action/faction catalog JSON (default: data/content/catalog.json)\n";
  std::cout << "  --tech PATH         Tech tree JSON (default: data/content/tech_tree.json)\n";
  std::cout << "  --config PATH       Simulation tuning overrides JSON\n";
  std::cout << "  --load PATH         Load a save JSON before advancing\n";
  std::cout << "  --save PATH         Save state JSON after advancing\n";
  std::cout << "  --validate-content  Validate content + tech files and exit\n";
  std::cout << "  --digest            Print the final state digest\n";
  std::cout << "  --log               Print each turn's log entries\n";
  std::cout << "  --log-level LEVEL   Diagnostic level (debug|info|warn|error|off, default: warn)\n";
  std::cout << "  --quiet             Suppress the summary (useful for scripts)\n";
  std::cout << "  -h, --help          Show this help\n";
  std::cout << "  --version           Print version and exit\n";
}

void print_summary(const agirace::Simulation& sim) {
  const auto& s = sim.state();
  std::cout << "--- Summary (" << agirace::QuarterDate(s.year, s.quarter).to_string() << ", turn " << s.turn
            << ") ---\n";
  for (const auto& id : agirace::util::sorted_keys(s.factions)) {
    const auto& f = s.factions.at(id);
    std::cout << f.name << ": cap " << agirace::format_amount(agirace::round1(f.capability_score)) << " / safety "
              << agirace::format_amount(agirace::round1(f.safety_score)) << " / trust "
              << agirace::format_amount(agirace::round1(f.resources.trust)) << " / compute "
              << agirace::format_amount(agirace::round1(f.resources.compute)) << "\n";
  }
  std::cout << "Global Safety: " << agirace::format_amount(agirace::round1(s.global_safety)) << "\n";

  if (s.game_over) {
    if (!s.winner_id.empty()) {
      const auto* w = agirace::find_ptr(s.factions, s.winner_id);
      std::cout << "Winner: " << (w ? w->name : s.winner_id) << " ("
                << agirace::victory_type_to_string(s.victory_type) << ")\n";
    } else if (agirace::is_stalemate(s)) {
      std::cout << "Outcome: Stalemate\n";
    } else {
      const auto* l = agirace::find_ptr(s.factions, s.loser_id);
      std::cout << "Outcome: " << agirace::loss_type_to_string(s.loss_type) << " ("
                << (l ? l->name : s.loser_id) << ")\n";
    }
  } else {
    std::cout << "Outcome: No resolution yet\n";
  }

  if (!s.player_faction_id.empty()) {
    const auto progress = agirace::calculate_victory_progress(s, s.player_faction_id, sim.cfg());
    const agirace::VictoryProgress* best = nullptr;
    for (const auto& p : progress) {
      if (p.is_warning) {
        std::cout << "Warning: " << p.label << " " << agirace::format_amount(agirace::round1(p.progress)) << "%\n";
        continue;
      }
      if (!best || p.progress > best->progress) best = &p;
    }
    if (best) {
      std::cout << "Closest path: " << best->label << " " << agirace::format_amount(agirace::round1(best->progress))
                << "%\n";
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << AGIRACE_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string log_level = get_str_arg(argc, argv, "--log-level", "warn");
    agirace::log::Level lvl = agirace::log::Level::Warn;
    if (!agirace::log::parse_level(log_level, &lvl)) {
      std::cerr << "Unknown --log-level: '" << log_level << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    agirace::log::set_level(lvl);

    const int turns = get_int_arg(argc, argv, "--turns", 32);
    const int seed = get_int_arg(argc, argv, "--seed", 42);
    const std::string player = get_str_arg(argc, argv, "--player", "");
    const std::string content_path = get_str_arg(argc, argv, "--content", "data/content/catalog.json");
    const std::string tech_path = get_str_arg(argc, argv, "--tech", "data/content/tech_tree.json");
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const std::string load_path = get_str_arg(argc, argv, "--load", "");
    const std::string save_path = get_str_arg(argc, argv, "--save", "");

    const bool quiet = has_flag(argc, argv, "--quiet");
    const bool show_log = has_flag(argc, argv, "--log");

    if (turns < 0) {
      std::cerr << "--turns must be non-negative\n";
      return 2;
    }

    auto content = agirace::load_content_db_from_file(content_path);
    content.techs = agirace::load_tech_db_from_file(tech_path);

    if (has_flag(argc, argv, "--validate-content")) {
      const auto errors = agirace::validate_content_db(content);
      if (!errors.empty()) {
        std::cerr << "Content validation failed:\n";
        for (const auto& e : errors) std::cerr << "  - " << e << "\n";
        return 1;
      }
      if (!quiet) {
        std::cout << "Content OK (" << content.actions.size() << " actions, " << content.techs.size() << " techs, "
                  << content.factions.size() << " factions, digest "
                  << agirace::digest64_to_hex(agirace::digest_content_db64(content)) << ")\n";
      }
      return 0;
    }

    agirace::SimConfig cfg;
    if (!config_path.empty()) cfg = agirace::load_sim_config_from_file(config_path);

    agirace::Simulation sim(std::move(content), cfg);
    if (!load_path.empty()) {
      sim.load_game(agirace::deserialize_game_from_json(agirace::read_text_file(load_path)));
    } else {
      sim.new_game(player);
    }

    // One stream feeds both the policy and the engine so a seed reproduces a run.
    const agirace::RandomSource rng = agirace::util::make_u01_source(static_cast<std::uint64_t>(seed));

    for (int i = 0; i < turns && !sim.state().game_over; ++i) {
      const auto choices = agirace::decide_all_actions(sim.state(), sim.content(), sim.cfg(), rng);
      const auto entries = sim.advance_turn(choices, rng);
      if (show_log) {
        for (const auto& e : entries) std::cout << e << "\n";
      }
    }

    if (!quiet) print_summary(sim);

    if (has_flag(argc, argv, "--digest")) {
      std::cout << "Digest: " << agirace::digest64_to_hex(agirace::digest_game_state64(sim.state())) << "\n";
    }

    if (!save_path.empty()) {
      agirace::write_text_file(save_path, agirace::serialize_game_to_json(sim.state()));
      if (!quiet) std::cout << "Saved to " << save_path << "\n";
    }

    return 0;
  } catch (const std::exception& e) {
    agirace::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
