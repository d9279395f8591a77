#pragma once

#include <string>
#include <vector>

namespace agirace {

// Accumulates the human-readable entries produced while resolving one turn.
//
// The orchestrator appends the collected entries to GameState::log once the
// turn completes; sub-steps only ever append here.
class TurnLog {
 public:
  void add(std::string entry);

  // Non-fatal problems (rejected choices, non-terminal losses). Stored with a
  // "Warning: " prefix and mirrored to the diagnostic logger.
  void warn(const std::string& entry);

  const std::vector<std::string>& entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }

 private:
  std::vector<std::string> entries_;
};

} // namespace agirace
