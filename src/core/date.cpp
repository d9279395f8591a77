#include "agirace/core/date.h"

#include <cctype>
#include <stdexcept>

namespace agirace {

QuarterDate::QuarterDate(int year, int quarter) : year_(year), quarter_(quarter) {
  if (quarter < 1 || quarter > 4) throw std::invalid_argument("Quarter out of range: " + std::to_string(quarter));
}

QuarterDate QuarterDate::parse(const std::string& text) {
  std::size_t i = 0;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
  if (i == 0 || i + 2 > text.size()) throw std::invalid_argument("Bad quarter date: " + text);
  const int year = std::stoi(text.substr(0, i));
  if (text[i] == ' ' || text[i] == '-') ++i;
  if (i + 2 != text.size() || (text[i] != 'Q' && text[i] != 'q') ||
      !std::isdigit(static_cast<unsigned char>(text[i + 1]))) {
    throw std::invalid_argument("Bad quarter date: " + text);
  }
  return QuarterDate(year, text[i + 1] - '0');
}

QuarterDate QuarterDate::next() const {
  if (quarter_ == 4) return QuarterDate(year_ + 1, 1);
  return QuarterDate(year_, quarter_ + 1);
}

QuarterDate QuarterDate::add_quarters(int n) const {
  const int idx = year_ * 4 + (quarter_ - 1) + n;
  // Floor division so negative offsets walk back across year boundaries.
  const int y = idx >= 0 ? idx / 4 : -((-idx + 3) / 4);
  return QuarterDate(y, idx - y * 4 + 1);
}

std::string QuarterDate::to_string() const { return std::to_string(year_) + " Q" + std::to_string(quarter_); }

} // namespace agirace
