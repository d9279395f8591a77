#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "agirace/core/entities.h"

namespace agirace {

// Static catalogs loaded once at startup and treated as immutable afterwards.
struct ContentDB {
  std::unordered_map<std::string, ActionDefinition> actions;

  // Catalog order matters: unlocking picks the first affordable node per branch.
  std::vector<TechNode> techs;

  std::vector<FactionTemplate> factions;

  // Throws std::out_of_range for an id not in the catalog.
  const ActionDefinition& action(const std::string& id) const;

  const TechNode* find_tech(const std::string& id) const;
  const FactionTemplate* find_template(const std::string& id) const;
};

enum class VictoryType { None, SafeAgi, Dominant, PublicTrust, Regulatory, Alliance, Control };

enum class LossType { None, Catastrophe, Collapse, Obsolescence, Coup };

inline constexpr int kCurrentSaveVersion = 1;

struct GameState {
  int save_version{kCurrentSaveVersion};

  int turn{0};
  int year{2026};
  int quarter{1};

  std::unordered_map<std::string, FactionState> factions;

  // Derived from the factions; see compute_global_safety().
  double global_safety{0.0};

  bool game_over{false};
  std::string winner_id;
  std::string loser_id;
  VictoryType victory_type{VictoryType::None};
  LossType loss_type{LossType::None};

  // Append-only human-readable turn log.
  std::vector<std::string> log;

  // Symmetric: if b is in alliances[a], a is in alliances[b].
  std::unordered_map<std::string, std::vector<std::string>> alliances;

  // Keyed by tension_key(a, b).
  std::unordered_map<std::string, double> tensions;

  std::vector<std::string> treaties;

  // Faction whose standing losses end the game. Empty: no faction is tracked.
  std::string player_faction_id;
};

// Order-independent key for a pair of factions.
std::string tension_key(const std::string& a, const std::string& b);

// Small helper for safe lookups.
template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<decltype(&it->second)>(nullptr);
  return &it->second;
}

template <typename Map>
const auto* find_ptr(const Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<const decltype(&it->second)>(nullptr);
  return &it->second;
}

} // namespace agirace
