// ============================================================================
// log.cpp - implementation for log.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "linkrelay/log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

namespace linkrelay::log {

// ---------------------------------------------------------------------------
// Process-wide sink state. Guarded by g_mutex except the level, which is read
// on every record and only ever swapped whole.
// ---------------------------------------------------------------------------
static std::mutex         g_mutex;
static std::ostream*      g_stream = nullptr;
static std::atomic<int>   g_level{static_cast<int>(Level::Info)};

static const char* level_name(Level l) {
  switch (l) {
    case Level::Debug: return "debug";
    case Level::Info:  return "info";
    case Level::Warn:  return "warn";
    case Level::Error: return "error";
  }
  return "info";
}

// UTC "YYYY-MM-DD HH:MM:SS"; matches the created_at format in the store.
static std::string utc_stamp() {
  std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

void set_level(Level l) { g_level.store(static_cast<int>(l)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool parse_level(const std::string& text, Level& out) {
  std::string s;
  for (char c : text) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (s == "debug")                   { out = Level::Debug; return true; }
  if (s == "info")                    { out = Level::Info;  return true; }
  if (s == "warn" || s == "warning")  { out = Level::Warn;  return true; }
  if (s == "error")                   { out = Level::Error; return true; }
  return false;
}

void set_stream(std::ostream* os) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_stream = os;
}

void write(Level l, const std::string& body) {
  if (static_cast<int>(l) < g_level.load()) return;   // below threshold
  const std::string stamp = utc_stamp();              // format outside the lock

  std::lock_guard<std::mutex> lock(g_mutex);
  std::ostream& os = g_stream ? *g_stream : std::cerr;
  os << stamp << " level=" << level_name(l) << " " << body << "\n";
  os.flush();
}

} // namespace linkrelay::log
