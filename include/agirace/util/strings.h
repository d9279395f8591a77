#pragma once

#include <string>

namespace agirace {

std::string to_lower(std::string s);

// Formats a value with at most one decimal, dropping a trailing ".0" ("12", "7.5").
std::string format_amount(double v);

} // namespace agirace
