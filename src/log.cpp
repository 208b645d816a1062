// ============================================================================
// log.cpp - implementation for log.hpp
// ============================================================================
#include "meshbot/log.hpp"

#include <iostream>

namespace meshbot {

static LogLevel      g_level = LogLevel::Info;
static std::ostream* g_sink  = nullptr;   // nullptr => std::cerr

bool parse_log_level(const std::string& s, LogLevel& out) {
  if (s == "debug") { out = LogLevel::Debug; return true; }
  if (s == "info")  { out = LogLevel::Info;  return true; }
  if (s == "warn")  { out = LogLevel::Warn;  return true; }
  if (s == "error") { out = LogLevel::Error; return true; }
  return false;
}

const char* log_level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

void set_log_level(LogLevel lvl) { g_level = lvl; }
LogLevel log_level() { return g_level; }

void set_log_sink(std::ostream* sink) { g_sink = sink; }

void log_event(LogLevel lvl, const std::string& event, const std::string& details) {
  if (static_cast<int>(lvl) < static_cast<int>(g_level)) return;
  std::ostream& os = g_sink ? *g_sink : std::cerr;
  os << "level=" << log_level_name(lvl) << " event=" << event;
  if (!details.empty()) os << " " << details;
  os << "\n";
}

} // namespace meshbot
