#include <iostream>

#include "agirace/util/log.h"
#include "agirace/util/strings.h"

#define AGR_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_strings() {
  using namespace agirace;

  AGR_ASSERT(to_lower("US_Lab_A") == "us_lab_a");
  AGR_ASSERT(to_lower("") == "");

  AGR_ASSERT(format_amount(12.0) == "12");
  AGR_ASSERT(format_amount(7.5) == "7.5");
  AGR_ASSERT(format_amount(-0.01) == "0");

  // Log levels parse case-insensitively.
  {
    log::Level l = log::Level::Info;
    AGR_ASSERT(log::parse_level("WARN", &l));
    AGR_ASSERT(l == log::Level::Warn);
    AGR_ASSERT(log::parse_level("Debug", &l));
    AGR_ASSERT(l == log::Level::Debug);
    AGR_ASSERT(log::parse_level("warning", &l));
    AGR_ASSERT(l == log::Level::Warn);
    AGR_ASSERT(log::parse_level("OFF", &l));
    AGR_ASSERT(l == log::Level::Off);

    AGR_ASSERT(!log::parse_level("verbose", &l));
    AGR_ASSERT(l == log::Level::Off);
  }

  return 0;
}
