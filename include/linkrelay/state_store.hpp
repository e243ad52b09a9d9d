/**
 * @file state_store.hpp
 * @brief StateStore - SQLite-backed durable state shared by every relay worker.
 *
 * @details
 * ## What lives here
 *
 * | Table             | Key                        | Written by                  |
 * |-------------------|----------------------------|-----------------------------|
 * | `processed`       | (source_id, message_id)    | pipeline; retention sweep   |
 * | `channels`        | source_id                  | admin                       |
 * | `duplicate_codes` | code                       | pipeline; retention sweep   |
 * | `url_filters`     | id (ordered by sort_order) | admin                       |
 *
 * ## Locking
 * One `std::mutex` per store. Each public method takes it for its whole
 * duration, so a read-then-write sequence that an invariant depends on (for
 * example swapping two filters' `sort_order`) is a single critical section.
 * Nothing here does network I/O, so the lock is only ever held for local,
 * short SQLite work.
 *
 * ## Errors
 * Every operation returns `false` and fills `err` when SQLite fails. Callers
 * decide what that means (the pipeline aborts the message; the scheduler logs
 * and waits for the next cycle). Nothing throws and nothing exits.
 *
 * ## Inserts
 * Processed identities and duplicate codes use `INSERT OR IGNORE`, so a
 * message delivered twice by the transport can never double-insert.
 */
#ifndef LINKRELAY_STATE_STORE_HPP
#define LINKRELAY_STATE_STORE_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct sqlite3;

namespace linkrelay {

/// Format a time point as UTC "YYYY-MM-DD HH:MM:SS" (the `created_at` format).
std::string format_utc(std::chrono::system_clock::time_point tp);

/**
 * @struct FilterRule
 * @brief One row of the ordered, user-editable rewrite chain.
 *
 * `replacement == EXPAND_MARKER` selects network link expansion; anything
 * else is a regex replacement template.
 */
struct FilterRule {
  int64_t     id{0};
  std::string pattern;
  std::string replacement;
  int64_t     sort_order{0};
};

/// Sentinel replacement value meaning "expand via redirects" rather than substitute.
static constexpr const char* EXPAND_MARKER = "amz";

enum class MoveDirection { Up, Down };

/// Result of an administrative read-only query.
struct QueryResult {
  std::vector<std::string> columns;
  nlohmann::json           rows = nlohmann::json::array();  ///< array of arrays
  bool                     truncated{false};                ///< row cap reached
};

class StateStore {
public:
  /// Upper bound on rows returned by run_readonly_query().
  static constexpr size_t MAX_QUERY_ROWS = 1000;

  StateStore() = default;
  ~StateStore();

  StateStore(const StateStore&) = delete;
  StateStore& operator=(const StateStore&) = delete;

  /**
   * @brief Open (or create) the database and bring the schema up to date.
   *
   * @param path  File path, or ":memory:" for a private in-memory store.
   * @param err   Reason on failure.
   *
   * Enables WAL on file databases and runs the column migrations for
   * stores created by older releases (missing `sort_order`, `created_at`).
   */
  bool open(const std::string& path, std::string& err);
  void close();
  bool is_open() const;

  /// @name Processed identities
  ///@{
  bool is_processed(int64_t source_id, int64_t message_id, bool& out, std::string& err);
  bool mark_processed(int64_t source_id, int64_t message_id, std::string& err);
  bool mark_processed_at(int64_t source_id, int64_t message_id,
                         std::chrono::system_clock::time_point at, std::string& err);

  /**
   * @brief Delete processed rows older than `now - days`.
   *
   * `days <= 0` deletes nothing and succeeds with `removed == 0`.
   */
  bool cleanup_processed(int days, std::chrono::system_clock::time_point now,
                         int64_t& removed, std::string& err);

  /// Processed-row count per source id.
  bool processed_counts(std::map<int64_t, int64_t>& out, std::string& err);
  ///@}

  /// @name Duplicate codes
  ///@{
  /// Which of `codes` are already stored (exact match on the normalized form).
  bool find_existing_codes(const std::vector<std::string>& codes,
                           std::set<std::string>& out, std::string& err);
  /// Insert-if-absent, one timestamp for the whole batch, one transaction.
  bool mark_codes(const std::vector<std::string>& codes, std::string& err);
  bool clear_codes(int64_t& removed, std::string& err);
  ///@}

  /// @name Channel labels
  ///@{
  bool upsert_channel(int64_t source_id, const std::string& name, std::string& err);
  bool channel_labels(std::map<int64_t, std::string>& out, std::string& err);
  ///@}

  /// @name Filter rules
  ///@{
  /// All rules in application order (sort_order, then id).
  bool list_filters(std::vector<FilterRule>& out, std::string& err);
  /// Append at max(sort_order)+1.
  bool add_filter(const std::string& pattern, const std::string& replacement,
                  int64_t& new_id, std::string& err);
  bool update_filter(int64_t id, const std::string& pattern, const std::string& replacement,
                     bool& found, std::string& err);
  bool delete_filter(int64_t id, bool& found, std::string& err);
  /// Swap sort_order with the neighbour in `dir`. `moved` is false at either end.
  bool move_filter(int64_t id, MoveDirection dir, bool& moved, std::string& err);
  ///@}

  /// @name Administrative
  ///@{
  /**
   * @brief Run one statement that SQLite itself reports as read-only.
   *
   * The statement is prepared under an authorizer that admits only reads,
   * then checked with `sqlite3_stmt_readonly`. Multiple statements, writes,
   * ATTACH, PRAGMA and transaction control are all rejected before any step.
   */
  bool run_readonly_query(const std::string& sql, QueryResult& out, std::string& err);

  /// Delete every processed identity and duplicate code. Filters and labels stay.
  bool reset(std::string& err);
  ///@}

private:
  bool exec_locked(const char* sql, std::string& err);
  bool has_column_locked(const char* table, const char* column, bool& out, std::string& err);
  bool migrate_locked(std::string& err);
  std::string db_error() const;

  sqlite3*   db_{nullptr};
  std::mutex mutex_;
};

} // namespace linkrelay

#endif // LINKRELAY_STATE_STORE_HPP
