/**
 * @file admin.hpp
 * @brief AdminService - operator-facing edits of filters, labels and live settings.
 *
 * @details
 * The admin layer is the third worker sharing the StateStore (next to the
 * receiving worker and the RetentionScheduler). Every call is one short,
 * store-locked unit; nothing here runs on the message path.
 *
 * Config writes go through LiveConfig::update(), which rewrites the whole
 * env file. `ADMIN_PASSWORD` is written back on every edit so a password that
 * only lived in the process environment is not lost.
 *
 * Error reporting: `false` + `err` (short reason token, e.g. `bad_pattern`,
 * `not_found`, `bad_time`), same as the rest of the project.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "linkrelay/config.hpp"
#include "linkrelay/state_store.hpp"
#include "linkrelay/stats.hpp"

namespace linkrelay {

/// One row of the per-source overview.
struct ChannelStat {
  int64_t     source_id{0};
  std::string name;
  int64_t     messages{0};   ///< processed rows currently held for this source
};

class AdminService {
public:
  AdminService(StateStore& store, LiveConfig& config,
               std::string admin_password, std::string stats_path);

  /// Constant-time comparison against ADMIN_PASSWORD.
  bool check_password(const std::string& candidate) const;

  // ---- filters ----
  bool list_filters(std::vector<FilterRule>& out, std::string& err);
  bool add_filter(const std::string& pattern, const std::string& replacement,
                  int64_t& new_id, std::string& err);
  bool update_filter(int64_t id, const std::string& pattern, const std::string& replacement,
                     std::string& err);
  bool delete_filter(int64_t id, std::string& err);
  /// `moved` is false when the rule is already first / last.
  bool move_filter_up(int64_t id, bool& moved, std::string& err);
  bool move_filter_down(int64_t id, bool& moved, std::string& err);

  // ---- sources ----
  /// Upsert a label and append the source to SOURCE_CHATS if absent.
  bool set_channel(int64_t source_id, const std::string& name, std::string& err);
  /// Configured sources first (configured order), then other sources seen in the store.
  bool channel_stats(std::vector<ChannelStat>& out, std::string& err);
  /// SOURCE_CHATS as currently written in the config.
  bool configured_sources(std::vector<int64_t>& out, std::string& err) const;

  // ---- live settings ----
  /// Empty `days` / `time` removes the key (defaults apply again).
  bool set_retention(const std::string& days, const std::string& time, std::string& err);
  /// Empty pattern removes the key; invalid patterns are refused.
  bool set_dup_code_regex(const std::string& pattern, std::string& err);

  // ---- state ----
  bool run_query(const std::string& sql, QueryResult& out, std::string& err);
  /// Forget every processed identity and cached code.
  bool reset_state(std::string& err);
  /// Stats file as an observer sees it.
  Stats service_stats() const;

private:
  bool edit_config(const std::function<void(EnvMap&)>& edit, std::string& err);

  StateStore& store_;
  LiveConfig& config_;
  std::string admin_password_;
  std::string stats_path_;
};

} // namespace linkrelay
