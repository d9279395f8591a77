#include "agirace/util/log.h"

#include <iostream>
#include <mutex>

#include "agirace/util/strings.h"

namespace agirace::log {
namespace {
std::mutex g_mu;
Level g_level = Level::Info;

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void emit(Level l, const std::string& msg) {
  if (g_level == Level::Off || l < g_level) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level = lvl; }
Level level() { return g_level; }

bool parse_level(const std::string& text, Level* out) {
  const std::string t = to_lower(text);
  Level l;
  if (t == "debug") l = Level::Debug;
  else if (t == "info") l = Level::Info;
  else if (t == "warn" || t == "warning") l = Level::Warn;
  else if (t == "error") l = Level::Error;
  else if (t == "off" || t == "none") l = Level::Off;
  else return false;
  if (out) *out = l;
  return true;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace agirace::log
