// -----------------------------------------------------------------------------
// log.cpp: level filter and sinks (stderr by default).
// -----------------------------------------------------------------------------
#include "xbeelink/log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace xbeelink::log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Warn)};
std::mutex g_sink_mutex;
Sink g_sink;                                      // empty = stderr

void stderr_sink(Level lvl, const std::string& msg) {
  std::cerr << "level=" << to_string(lvl) << " " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level = static_cast<int>(lvl); }
Level level()             { return static_cast<Level>(g_level.load()); }

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lk(g_sink_mutex);
  g_sink = std::move(sink);
}

const char* to_string(Level lvl) {
  switch (lvl) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
    case Level::Off:   return "off";
  }
  return "unknown";
}

bool level_from_string(const std::string& name, Level& out) {
  if (name == "debug") { out = Level::Debug; return true; }
  if (name == "info")  { out = Level::Info;  return true; }
  if (name == "warn")  { out = Level::Warn;  return true; }
  if (name == "error") { out = Level::Error; return true; }
  if (name == "off")   { out = Level::Off;   return true; }
  return false;
}

void init_from_env() {
  const char* v = std::getenv("XBEELINK_LOG_LEVEL");
  Level lvl;
  if (v && level_from_string(v, lvl)) set_level(lvl);
}

void write(Level lvl, const std::string& message) {
  if (lvl == Level::Off || static_cast<int>(lvl) < g_level.load()) return;
  std::lock_guard<std::mutex> lk(g_sink_mutex);   // also serializes stderr lines
  if (g_sink) g_sink(lvl, message);
  else        stderr_sink(lvl, message);
}

} // namespace xbeelink::log
