#include "agirace/core/turn_log.h"

#include <utility>

#include "agirace/util/log.h"

namespace agirace {

void TurnLog::add(std::string entry) {
  log::debug(entry);
  entries_.push_back(std::move(entry));
}

void TurnLog::warn(const std::string& entry) {
  log::warn(entry);
  entries_.push_back("Warning: " + entry);
}

} // namespace agirace
