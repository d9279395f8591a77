#include "agirace/core/scenario.h"

#include <stdexcept>

#include "agirace/core/stats.h"

namespace agirace {

GameState make_initial_state(const ContentDB& content, const SimConfig& cfg, const std::string& player_faction_id) {
  GameState s;
  s.turn = 0;
  s.year = cfg.start_year;
  s.quarter = cfg.start_quarter;

  for (const auto& t : content.factions) {
    FactionState f;
    f.id = t.id;
    f.name = t.name;
    f.type = t.type;
    f.resources = t.resources;
    f.safety_culture = t.safety_culture;
    f.opsec = t.opsec;
    f.capability_score = t.capability_score;
    f.safety_score = t.safety_score;

    const bool gov = t.type == FactionType::Government;
    f.public_opinion = t.public_opinion.value_or(gov ? 50.0 : t.resources.trust);
    f.security_level = t.security_level.value_or(gov ? 3 : 2);

    s.factions[f.id] = f;
  }

  if (!player_faction_id.empty()) {
    if (!find_ptr(s.factions, player_faction_id)) {
      throw std::runtime_error("Unknown player faction: " + player_faction_id);
    }
    s.player_faction_id = player_faction_id;
  }

  s.global_safety = compute_global_safety(s);
  return s;
}

} // namespace agirace
