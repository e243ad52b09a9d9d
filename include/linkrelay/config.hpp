/**
 * @file config.hpp
 * @brief Env-file configuration: startup settings plus live, re-read-per-call knobs.
 *
 * @details
 * PURPOSE
 * -------
 * The relay is configured by one env-style file (`KEY=VALUE` per line). Most
 * keys are read once at startup (`Settings`). Three are read again every time
 * they are needed so that edits made through the admin layer apply without a
 * restart (`LiveConfig`):
 *
 * | Key                          | Used by             | Default                 |
 * |------------------------------|---------------------|-------------------------|
 * | `CLEANUP_DAYS`               | RetentionScheduler  | 30                      |
 * | `CLEANUP_TIME`               | RetentionScheduler  | 00:05 (local time)      |
 * | `CLEANUP_CODES_WHEN_DISABLED`| RetentionScheduler  | true                    |
 * | `DUP_CODE_REGEX`             | CodeExtractor       | `\b[A-Za-z0-9]{6,}\b`   |
 *
 * FILE FORMAT
 * -----------
 * - Blank lines and lines starting with `#` are ignored.
 * - An optional `export ` prefix is accepted.
 * - Values may be wrapped in matching single or double quotes.
 * - Keys missing from the file fall back to the process environment.
 *
 * Nothing here throws. Parsers return `false` with a reason in `err`, or fall
 * back to the documented defaults.
 */
#ifndef LINKRELAY_CONFIG_HPP
#define LINKRELAY_CONFIG_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace linkrelay {

using EnvMap = std::map<std::string, std::string>;

/// Wall-clock time of day (local time) for the daily retention sweep.
struct TimeOfDay {
  int hour{0};
  int minute{5};
};

static constexpr int CLEANUP_DAYS_DEFAULT = 30;
static constexpr TimeOfDay CLEANUP_TIME_DEFAULT{0, 5};
static constexpr const char* DUP_CODE_REGEX_DEFAULT = R"(\b[A-Za-z0-9]{6,}\b)";

/// Keys that must be present (file or environment) for the daemon to start.
extern const std::vector<std::string> REQUIRED_KEYS;

// -------- env file I/O --------

/// Parse env-file text into `out` (later duplicates win).
void parse_env_text(const std::string& text, EnvMap& out);

/// Read an env file. Returns false (with `err`) if it cannot be opened.
bool read_env_file(const std::string& path, EnvMap& out, std::string& err);

/// Rewrite the whole env file (`KEY=VALUE`, sorted by key). Empty values are kept.
bool write_env_file(const std::string& path, const EnvMap& env, std::string& err);

// -------- value parsers --------

/// "-1001, 42,,7" -> {-1001, 42, 7}. Fails on any non-integer entry.
bool parse_source_list(const std::string& text, std::vector<int64_t>& out, std::string& err);
std::string format_source_list(const std::vector<int64_t>& ids);

/// Strict "HH:MM" parse (0..23, 0..59). Returns false on anything else.
bool parse_time_of_day(const std::string& text, TimeOfDay& out);

/// Lenient forms used by the scheduler: invalid input yields the defaults.
TimeOfDay parse_cleanup_time(const std::string& text);
int parse_cleanup_days(const std::string& text);

/// "1/true/yes/on" and "0/false/no/off" (case-insensitive); otherwise `fallback`.
bool parse_bool(const std::string& text, bool fallback);

// -------- startup settings --------

/**
 * @brief Values read once at startup.
 *
 * `api_id`/`api_hash`/`session_*` identify the account on the source network.
 * The line transport shipped here does not use them, but they stay required
 * so a config written for a chat-network transport is accepted unchanged.
 */
struct Settings {
  std::string          api_id;
  std::string          api_hash;
  std::string          session_string;
  std::string          session_name{"mirror"};
  std::string          dest_chat;
  std::vector<int64_t> source_chats;
  std::string          admin_password;
  int                  web_port{8000};
};

/// Validate required keys and typed values. On failure `err` names the key.
bool load_settings(const EnvMap& env, Settings& out, std::string& err);

/// Fill every key the relay knows about from the process environment when the file lacks it.
EnvMap with_process_env(EnvMap file_values);

/// `./config/.env` if readable, else `/config/.env` if readable, else `./config/.env`.
std::string default_env_path();

/// DATA_DIR if set, else `/data` when it is a directory, else `./data`.
std::string resolve_data_dir(const EnvMap& env);

// -------- live configuration --------

/**
 * @class LiveConfig
 * @brief Handle to the env file for values that must be re-read on each use.
 *
 * @details
 * Owned by the daemon and passed by reference to the scheduler, the code
 * extractor and the admin service. Every accessor re-reads the file; a
 * missing or unreadable file falls through to the process environment and
 * then to the defaults. `update()` is a read-modify-write under the handle's
 * mutex so two admin edits cannot interleave.
 */
class LiveConfig {
public:
  explicit LiveConfig(std::string env_path);

  const std::string& path() const { return path_; }

  /// File contents overlaid on nothing: only keys present in the file.
  EnvMap file_values() const;

  /// Value for `key`: file first, then process environment.
  std::optional<std::string> get(const std::string& key) const;

  int retention_days() const;
  TimeOfDay retention_time() const;
  bool clear_codes_when_disabled() const;
  std::string dup_code_regex() const;

  /// Apply `edit` to the current file values and write them back.
  bool update(const std::function<void(EnvMap&)>& edit, std::string& err);

private:
  std::string path_;
  mutable std::mutex mutex_;
};

} // namespace linkrelay

#endif // LINKRELAY_CONFIG_HPP
