#include <iostream>

#include "agirace/util/log.h"

int test_date();
int test_json();
int test_strings();
int test_file_io();
int test_stats();
int test_content_validation();
int test_tech();
int test_sim_config();
int test_actions();
int test_espionage();
int test_victory();
int test_engine();
int test_determinism();
int test_serialization();
int test_ai_policy();

int main() {
  // Rejected choices and non-player losses emit warnings; keep output to failures.
  agirace::log::set_level(agirace::log::Level::Error);

  int fails = 0;
  fails += test_date();
  fails += test_json();
  fails += test_strings();
  fails += test_file_io();
  fails += test_stats();
  fails += test_content_validation();
  fails += test_tech();
  fails += test_sim_config();
  fails += test_actions();
  fails += test_espionage();
  fails += test_victory();
  fails += test_engine();
  fails += test_determinism();
  fails += test_serialization();
  fails += test_ai_policy();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
