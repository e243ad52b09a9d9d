// ============================================================================
// stats.cpp - implementation for stats.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "linkrelay/stats.hpp"

#include <fcntl.h>          // ::open flags
#include <unistd.h>         // ::write, ::fsync, ::close

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace linkrelay {

const char* to_string(ServiceStatus s) {
  switch (s) {
    case ServiceStatus::Starting: return "starting";
    case ServiceStatus::Running:  return "running";
    case ServiceStatus::Stopped:  return "stopped";
    case ServiceStatus::Reset:    return "reset";
    case ServiceStatus::Error:    return "error";
    case ServiceStatus::Unknown:  return "unknown";
  }
  return "unknown";
}

bool parse_status(const std::string& text, ServiceStatus& out) {
  if (text == "starting") { out = ServiceStatus::Starting; return true; }
  if (text == "running")  { out = ServiceStatus::Running;  return true; }
  if (text == "stopped")  { out = ServiceStatus::Stopped;  return true; }
  if (text == "reset")    { out = ServiceStatus::Reset;    return true; }
  if (text == "error")    { out = ServiceStatus::Error;    return true; }
  if (text == "unknown")  { out = ServiceStatus::Unknown;  return true; }
  return false;
}

// -----------------------------------------------------------------------------
// parse_stats_file() - shared by the writer and observer views.
// OUT:   1 = parsed, 0 = file missing, -1 = unreadable or malformed.
// POLICY:
//   - "messages" must be a non-negative integer.
//   - An unrecognised "status" string reads as unknown rather than corrupt.
// -----------------------------------------------------------------------------
static int parse_stats_file(const std::string& path, Stats& out) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return 0;

  std::ifstream in(path);
  if (!in) return -1;

  json j = json::parse(in, nullptr, /*allow_exceptions*/false);
  if (j.is_discarded() || !j.is_object()) return -1;

  auto m = j.find("messages");
  if (m == j.end() || !m->is_number_integer() || m->get<int64_t>() < 0) return -1;

  Stats s;
  s.messages = m->get<int64_t>();
  s.status   = ServiceStatus::Unknown;
  auto st = j.find("status");
  if (st != j.end() && st->is_string()) parse_status(st->get<std::string>(), s.status);
  out = s;
  return 1;
}

Stats read_stats(const std::string& path) {
  Stats s;
  switch (parse_stats_file(path, s)) {
    case 1:  return s;
    case 0:  return Stats{0, ServiceStatus::Unknown};
    default: return Stats{0, ServiceStatus::Error};
  }
}

bool write_stats_file(const std::string& path, const Stats& stats, std::string& err) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) { err = "stats_dir_error " + ec.message(); return false; }
  }

  json j;
  j["messages"] = stats.messages;
  j["status"]   = to_string(stats.status);
  const std::string body = j.dump();

  const std::string tmp = path + ".tmp";
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) { err = std::string("open_failed reason=") + std::strerror(errno); return false; }

  size_t off = 0;
  while (off < body.size()) {
    ssize_t n = ::write(fd, body.data() + off, body.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      err = std::string("write_failed reason=") + std::strerror(errno);
      ::close(fd);
      return false;
    }
    off += static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0) {
    err = std::string("fsync_failed reason=") + std::strerror(errno);
    ::close(fd);
    return false;
  }
  ::close(fd);

  fs::rename(tmp, target, ec);
  if (ec) { err = "rename_failed " + ec.message(); return false; }
  return true;
}

// ---------- StatsRecorder ----------

StatsRecorder::StatsRecorder(std::string path) : path_(std::move(path)) {}

Stats StatsRecorder::load() {
  Stats s;
  const int rc = parse_stats_file(path_, s);
  if (rc == 0)      s = Stats{0, ServiceStatus::Starting};
  else if (rc < 0)  s = Stats{0, ServiceStatus::Reset};

  std::lock_guard<std::mutex> lock(mutex_);
  current_ = s;
  return s;
}

bool StatsRecorder::set_status(ServiceStatus status, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  current_.status = status;
  return write_stats_file(path_, current_, err);
}

bool StatsRecorder::increment(std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++current_.messages;
  return write_stats_file(path_, current_, err);
}

Stats StatsRecorder::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

} // namespace linkrelay
