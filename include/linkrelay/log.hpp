/**
 * @file log.hpp
 * @brief Leveled key=value logging to stderr for the relay daemon and core.
 *
 * @details
 * Every line the relay writes looks like the status lines the CLI tools print:
 *
 * @code
 *   2026-10-19 12:00:05 level=info event=forwarded source=-1001 id=42
 * @endcode
 *
 * - One line per record; the mutex keeps lines whole when the receiving
 *   worker, the retention scheduler and the admin layer log at once.
 * - Timestamp is UTC, same format as the `created_at` column in the store.
 * - The sink defaults to `std::cerr`; tests swap in a `std::ostringstream`.
 *
 * Usage:
 * @code
 *   log::info() << "event=expanded from=" << url << " to=" << final_url;
 * @endcode
 */
#ifndef LINKRELAY_LOG_HPP
#define LINKRELAY_LOG_HPP

#include <ostream>
#include <sstream>
#include <string>

namespace linkrelay::log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Minimum level written; records below it are dropped.
void set_level(Level level);
Level level();

/// Parse "debug|info|warn|error" (case-insensitive). Returns false if unknown.
bool parse_level(const std::string& text, Level& out);

/// Redirect output (nullptr restores std::cerr). Caller keeps the stream alive.
void set_stream(std::ostream* os);

/// Write one complete record. Thread-safe.
void write(Level level, const std::string& body);

/**
 * @brief One log record under construction; flushed on destruction.
 */
class Line {
public:
  explicit Line(Level level) : level_(level) {}
  Line(const Line&) = delete;
  Line& operator=(const Line&) = delete;
  ~Line() { write(level_, buf_.str()); }

  template <typename T>
  Line& operator<<(const T& v) {
    buf_ << v;
    return *this;
  }

private:
  Level level_;
  std::ostringstream buf_;
};

inline Line debug() { return Line(Level::Debug); }
inline Line info()  { return Line(Level::Info); }
inline Line warn()  { return Line(Level::Warn); }
inline Line error() { return Line(Level::Error); }

} // namespace linkrelay::log

#endif // LINKRELAY_LOG_HPP
