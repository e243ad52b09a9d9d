/**
 * @file stats.hpp
 * @brief StatsRecorder - forwarded-message counter and service status on disk.
 *
 * @details
 * The stats file is a single JSON object, rewritten whole on every change:
 *
 * @code
 *   {"messages": 42, "status": "running"}
 * @endcode
 *
 * Writes go to `<path>.tmp`, are fsync'ed, then renamed over the target, so
 * an observer reading concurrently sees either the old or the new record and
 * never a torn one.
 *
 * The recorder has its own mutex, independent of the store's. A crash between
 * delivery and the stats write loses at most that one increment; the message
 * itself is already marked processed and is never re-sent because of it.
 *
 * | Situation                 | `load()` (writer)   | `read_stats()` (observer) |
 * |---------------------------|---------------------|---------------------------|
 * | file missing              | 0, starting         | 0, unknown                |
 * | file unreadable / corrupt | 0, reset            | 0, error                  |
 */
#ifndef LINKRELAY_STATS_HPP
#define LINKRELAY_STATS_HPP

#include <cstdint>
#include <mutex>
#include <string>

namespace linkrelay {

enum class ServiceStatus { Starting, Running, Stopped, Reset, Error, Unknown };

const char* to_string(ServiceStatus s);
bool parse_status(const std::string& text, ServiceStatus& out);

struct Stats {
  int64_t       messages{0};
  ServiceStatus status{ServiceStatus::Starting};
};

/// Observer view of a stats file (see table above).
Stats read_stats(const std::string& path);

/// Durable whole-file write: temp file, fsync, rename.
bool write_stats_file(const std::string& path, const Stats& stats, std::string& err);

class StatsRecorder {
public:
  explicit StatsRecorder(std::string path);

  /// Load the previous record with writer semantics and make it current.
  Stats load();

  bool set_status(ServiceStatus status, std::string& err);

  /// messages += 1, then persist.
  bool increment(std::string& err);

  Stats snapshot() const;
  const std::string& path() const { return path_; }

private:
  std::string        path_;
  Stats              current_;
  mutable std::mutex mutex_;
};

} // namespace linkrelay

#endif // LINKRELAY_STATS_HPP
