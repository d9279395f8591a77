#pragma once

#include <optional>
#include <string>

#include "agirace/core/game_state.h"
#include "agirace/core/sim_config.h"

namespace agirace {

struct VictoryCheck {
  VictoryType type{VictoryType::None};
  std::string message;
};

struct LossCheck {
  LossType type{LossType::None};
  std::string message;
};

// Type-specific behaviour of a faction. Labs and governments earn income and
// win or lose in different ways; everything else about them is shared data.
//
// The victory and loss checks here cover the standing conditions evaluated
// every turn. Deployment-triggered outcomes (safe AGI, catastrophe) are
// resolved separately by the victory evaluator.
class FactionRules {
 public:
  virtual ~FactionRules() = default;

  // Passive per-turn resource and research generation.
  virtual void apply_income(FactionState& f) const = 0;

  // First matching victory in priority order, ignoring the minimum-turn gate.
  virtual std::optional<VictoryCheck> evaluate_victory(const GameState& state, const FactionState& f,
                                                       const SimConfig& cfg) const = 0;

  // First matching standing loss, ignoring the minimum-turn gate.
  virtual std::optional<LossCheck> evaluate_loss(const GameState& state, const FactionState& f,
                                                 const SimConfig& cfg) const = 0;
};

class LabRules final : public FactionRules {
 public:
  void apply_income(FactionState& f) const override;
  std::optional<VictoryCheck> evaluate_victory(const GameState& state, const FactionState& f,
                                               const SimConfig& cfg) const override;
  std::optional<LossCheck> evaluate_loss(const GameState& state, const FactionState& f,
                                         const SimConfig& cfg) const override;
};

class GovernmentRules final : public FactionRules {
 public:
  void apply_income(FactionState& f) const override;

  // Regulatory victory is checked here too but only opens at cfg.max_turn.
  std::optional<VictoryCheck> evaluate_victory(const GameState& state, const FactionState& f,
                                               const SimConfig& cfg) const override;
  std::optional<LossCheck> evaluate_loss(const GameState& state, const FactionState& f,
                                         const SimConfig& cfg) const override;
};

const FactionRules& rules_for(FactionType type);

// Highest capability among labs other than `exclude_id`; 0 when there are none.
double strongest_rival_lab_capability(const GameState& state, const std::string& exclude_id);

bool has_rival_lab(const GameState& state, const std::string& exclude_id);

// True when every lab satisfies `pred` (vacuously true with no labs).
template <typename Pred>
bool every_lab(const GameState& state, Pred pred) {
  for (const auto& [id, f] : state.factions) {
    if (f.is_lab() && !pred(f)) return false;
  }
  return true;
}

} // namespace agirace
