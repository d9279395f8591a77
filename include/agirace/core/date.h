#pragma once

#include <string>

namespace agirace {

// Calendar quarter. One game turn advances the date by one quarter.
class QuarterDate {
 public:
  QuarterDate() = default;
  QuarterDate(int year, int quarter);

  // Parses "2026 Q1" (also accepts "2026-Q1"). Throws std::invalid_argument.
  static QuarterDate parse(const std::string& text);

  int year() const { return year_; }
  int quarter() const { return quarter_; }

  // Q4 wraps to Q1 of the next year.
  QuarterDate next() const;
  QuarterDate add_quarters(int n) const;

  std::string to_string() const;

  bool operator==(const QuarterDate& o) const { return year_ == o.year_ && quarter_ == o.quarter_; }
  bool operator!=(const QuarterDate& o) const { return !(*this == o); }

 private:
  int year_{2026};
  int quarter_{1};
};

} // namespace agirace
