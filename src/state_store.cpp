// ============================================================================
// state_store.cpp - implementation for state_store.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "linkrelay/state_store.hpp"

#include <sqlite3.h>

#include <cctype>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace linkrelay {

// ---------------------------------------------------------------------------
// Schema. Column names follow the logical model; migrations below handle
// databases created before sort_order / created_at existed.
// ---------------------------------------------------------------------------
static const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS processed (
    source_id  INTEGER,
    message_id INTEGER,
    created_at TEXT,
    PRIMARY KEY (source_id, message_id)
);
CREATE TABLE IF NOT EXISTS channels (
    source_id INTEGER PRIMARY KEY,
    name      TEXT
);
CREATE TABLE IF NOT EXISTS duplicate_codes (
    code       TEXT PRIMARY KEY,
    created_at TEXT
);
CREATE TABLE IF NOT EXISTS url_filters (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    pattern     TEXT,
    replacement TEXT,
    sort_order  INTEGER DEFAULT 0
);
)SQL";

// -------- helpers --------

// Owns one prepared statement; finalized on scope exit.
class Statement {
public:
  Statement() = default;
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }

  bool prepare(sqlite3* db, const char* sql) {
    return sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) == SQLITE_OK;
  }

  sqlite3_stmt* get() const { return stmt_; }
  sqlite3_stmt** out() { return &stmt_; }

  void bind(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }
  void bind(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
  }

  void reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

private:
  sqlite3_stmt* stmt_{nullptr};
};

static std::string column_text(sqlite3_stmt* s, int col) {
  const unsigned char* p = sqlite3_column_text(s, col);
  return p ? reinterpret_cast<const char*>(p) : std::string();
}

std::string format_utc(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

// ---------------------------------------------------------------------------
// readonly_authorizer() - admits only what a plain SELECT needs.
// POLICY:
//   - SELECT, column READ, FUNCTION calls and recursive CTEs are allowed.
//   - Everything else (INSERT/UPDATE/DELETE/DDL, ATTACH, PRAGMA, transaction
//     control) is denied at prepare time, so no statement reaches step().
// ---------------------------------------------------------------------------
static int readonly_authorizer(void*, int action, const char*, const char*, const char*, const char*) {
  switch (action) {
    case SQLITE_SELECT:
    case SQLITE_READ:
    case SQLITE_FUNCTION:
    case SQLITE_RECURSIVE:
      return SQLITE_OK;
    default:
      return SQLITE_DENY;
  }
}

// ---------- lifecycle ----------

StateStore::~StateStore() { close(); }

bool StateStore::open(const std::string& path, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_) { err = "already_open"; return false; }

  const bool in_memory = (path == ":memory:");
  if (!in_memory) {
    fs::path p(path);
    if (p.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(p.parent_path(), ec);
      if (ec) { err = "data_dir_error " + ec.message(); return false; }
    }
  }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    err = "open_failed path=" + path + " reason=" + (db_ ? sqlite3_errmsg(db_) : "out_of_memory");
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  sqlite3_busy_timeout(db_, 5000);

  if (!in_memory && !exec_locked("PRAGMA journal_mode=WAL;", err)) return false;
  if (!exec_locked(SCHEMA_SQL, err)) return false;
  return migrate_locked(err);
}

void StateStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_) {
    sqlite3_close_v2(db_);
    db_ = nullptr;
  }
}

bool StateStore::is_open() const { return db_ != nullptr; }

// ---------- private helpers (caller holds mutex_) ----------

std::string StateStore::db_error() const {
  return db_ ? sqlite3_errmsg(db_) : "not_open";
}

bool StateStore::exec_locked(const char* sql, std::string& err) {
  if (!db_) { err = "not_open"; return false; }
  char* msg = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &msg) != SQLITE_OK) {
    err = msg ? msg : db_error();
    sqlite3_free(msg);
    return false;
  }
  return true;
}

bool StateStore::has_column_locked(const char* table, const char* column, bool& out, std::string& err) {
  const std::string sql = std::string("PRAGMA table_info(") + table + ")";
  Statement st;
  if (!st.prepare(db_, sql.c_str())) { err = db_error(); return false; }
  out = false;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    if (column_text(st.get(), 1) == column) out = true;
  }
  if (rc != SQLITE_DONE) { err = db_error(); return false; }
  return true;
}

// -----------------------------------------------------------------------------
// migrate_locked() - bring stores from older releases up to the current schema.
// POLICY:
//   - url_filters without sort_order: add it, seed from id so order is unchanged.
//   - processed without created_at: add it, stamp existing rows with "now" so
//     the retention window starts counting from the upgrade.
// -----------------------------------------------------------------------------
bool StateStore::migrate_locked(std::string& err) {
  bool has = false;

  if (!has_column_locked("url_filters", "sort_order", has, err)) return false;
  if (!has) {
    if (!exec_locked("ALTER TABLE url_filters ADD COLUMN sort_order INTEGER DEFAULT 0", err)) return false;
    if (!exec_locked("UPDATE url_filters SET sort_order = id WHERE sort_order IS NULL OR sort_order = 0", err))
      return false;
  }

  if (!has_column_locked("processed", "created_at", has, err)) return false;
  if (!has) {
    if (!exec_locked("ALTER TABLE processed ADD COLUMN created_at TEXT", err)) return false;
    Statement st;
    if (!st.prepare(db_, "UPDATE processed SET created_at = ? WHERE created_at IS NULL")) {
      err = db_error();
      return false;
    }
    st.bind(1, format_utc(std::chrono::system_clock::now()));
    if (sqlite3_step(st.get()) != SQLITE_DONE) { err = db_error(); return false; }
  }
  return true;
}

// ---------- processed identities ----------

bool StateStore::is_processed(int64_t source_id, int64_t message_id, bool& out, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  Statement st;
  if (!st.prepare(db_, "SELECT 1 FROM processed WHERE source_id = ? AND message_id = ?")) {
    err = db_error();
    return false;
  }
  st.bind(1, source_id);
  st.bind(2, message_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) { err = db_error(); return false; }
  out = (rc == SQLITE_ROW);
  return true;
}

bool StateStore::mark_processed(int64_t source_id, int64_t message_id, std::string& err) {
  return mark_processed_at(source_id, message_id, std::chrono::system_clock::now(), err);
}

bool StateStore::mark_processed_at(int64_t source_id, int64_t message_id,
                                   std::chrono::system_clock::time_point at, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  Statement st;
  if (!st.prepare(db_, "INSERT OR IGNORE INTO processed (source_id, message_id, created_at) VALUES (?, ?, ?)")) {
    err = db_error();
    return false;
  }
  st.bind(1, source_id);
  st.bind(2, message_id);
  st.bind(3, format_utc(at));
  if (sqlite3_step(st.get()) != SQLITE_DONE) { err = db_error(); return false; }
  return true;
}

bool StateStore::cleanup_processed(int days, std::chrono::system_clock::time_point now,
                                   int64_t& removed, std::string& err) {
  removed = 0;
  if (days <= 0) return true;                       // sweep disabled for this cycle

  const auto cutoff = now - std::chrono::hours(24) * days;

  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  Statement st;
  if (!st.prepare(db_, "DELETE FROM processed WHERE created_at IS NOT NULL AND created_at < ?")) {
    err = db_error();
    return false;
  }
  st.bind(1, format_utc(cutoff));                   // lexical order == time order for this format
  if (sqlite3_step(st.get()) != SQLITE_DONE) { err = db_error(); return false; }
  removed = sqlite3_changes(db_);
  return true;
}

bool StateStore::processed_counts(std::map<int64_t, int64_t>& out, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  Statement st;
  if (!st.prepare(db_, "SELECT source_id, COUNT(*) FROM processed GROUP BY source_id")) {
    err = db_error();
    return false;
  }
  out.clear();
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out[sqlite3_column_int64(st.get(), 0)] = sqlite3_column_int64(st.get(), 1);
  }
  if (rc != SQLITE_DONE) { err = db_error(); return false; }
  return true;
}

// ---------- duplicate codes ----------

bool StateStore::find_existing_codes(const std::vector<std::string>& codes,
                                     std::set<std::string>& out, std::string& err) {
  out.clear();
  if (codes.empty()) return true;

  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  // One reusable point lookup per code; avoids building an IN (...) list that
  // could exceed SQLite's host-parameter limit on very long messages.
  Statement st;
  if (!st.prepare(db_, "SELECT code FROM duplicate_codes WHERE code = ?")) {
    err = db_error();
    return false;
  }
  for (const auto& code : codes) {
    st.bind(1, code);
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) out.insert(column_text(st.get(), 0));
    else if (rc != SQLITE_DONE) { err = db_error(); return false; }
    st.reset();
  }
  return true;
}

bool StateStore::mark_codes(const std::vector<std::string>& codes, std::string& err) {
  if (codes.empty()) return true;

  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  const std::string now = format_utc(std::chrono::system_clock::now());
  if (!exec_locked("BEGIN IMMEDIATE", err)) return false;

  Statement st;
  bool ok = st.prepare(db_, "INSERT OR IGNORE INTO duplicate_codes (code, created_at) VALUES (?, ?)");
  for (size_t i = 0; ok && i < codes.size(); ++i) {
    st.bind(1, codes[i]);
    st.bind(2, now);
    ok = (sqlite3_step(st.get()) == SQLITE_DONE);
    st.reset();
  }
  if (!ok) {
    err = db_error();
    std::string ignored;
    exec_locked("ROLLBACK", ignored);
    return false;
  }
  return exec_locked("COMMIT", err);
}

bool StateStore::clear_codes(int64_t& removed, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  removed = 0;
  if (!exec_locked("DELETE FROM duplicate_codes", err)) return false;
  removed = sqlite3_changes(db_);
  return true;
}

// ---------- channel labels ----------

bool StateStore::upsert_channel(int64_t source_id, const std::string& name, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  Statement st;
  if (!st.prepare(db_, "INSERT OR REPLACE INTO channels (source_id, name) VALUES (?, ?)")) {
    err = db_error();
    return false;
  }
  st.bind(1, source_id);
  st.bind(2, name);
  if (sqlite3_step(st.get()) != SQLITE_DONE) { err = db_error(); return false; }
  return true;
}

bool StateStore::channel_labels(std::map<int64_t, std::string>& out, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  Statement st;
  if (!st.prepare(db_, "SELECT source_id, name FROM channels")) { err = db_error(); return false; }
  out.clear();
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out[sqlite3_column_int64(st.get(), 0)] = column_text(st.get(), 1);
  }
  if (rc != SQLITE_DONE) { err = db_error(); return false; }
  return true;
}

// ---------- filter rules ----------

bool StateStore::list_filters(std::vector<FilterRule>& out, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  Statement st;
  if (!st.prepare(db_, "SELECT id, pattern, replacement, sort_order FROM url_filters ORDER BY sort_order, id")) {
    err = db_error();
    return false;
  }
  out.clear();
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    FilterRule r;
    r.id          = sqlite3_column_int64(st.get(), 0);
    r.pattern     = column_text(st.get(), 1);
    r.replacement = column_text(st.get(), 2);
    r.sort_order  = sqlite3_column_int64(st.get(), 3);
    out.push_back(std::move(r));
  }
  if (rc != SQLITE_DONE) { err = db_error(); return false; }
  return true;
}

bool StateStore::add_filter(const std::string& pattern, const std::string& replacement,
                            int64_t& new_id, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  Statement max_st;
  if (!max_st.prepare(db_, "SELECT COALESCE(MAX(sort_order), 0) FROM url_filters")) {
    err = db_error();
    return false;
  }
  if (sqlite3_step(max_st.get()) != SQLITE_ROW) { err = db_error(); return false; }
  const int64_t next_order = sqlite3_column_int64(max_st.get(), 0) + 1;

  Statement ins;
  if (!ins.prepare(db_, "INSERT INTO url_filters (pattern, replacement, sort_order) VALUES (?, ?, ?)")) {
    err = db_error();
    return false;
  }
  ins.bind(1, pattern);
  ins.bind(2, replacement);
  ins.bind(3, next_order);
  if (sqlite3_step(ins.get()) != SQLITE_DONE) { err = db_error(); return false; }
  new_id = sqlite3_last_insert_rowid(db_);
  return true;
}

bool StateStore::update_filter(int64_t id, const std::string& pattern, const std::string& replacement,
                               bool& found, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  Statement st;
  if (!st.prepare(db_, "UPDATE url_filters SET pattern = ?, replacement = ? WHERE id = ?")) {
    err = db_error();
    return false;
  }
  st.bind(1, pattern);
  st.bind(2, replacement);
  st.bind(3, id);
  if (sqlite3_step(st.get()) != SQLITE_DONE) { err = db_error(); return false; }
  found = sqlite3_changes(db_) > 0;
  return true;
}

bool StateStore::delete_filter(int64_t id, bool& found, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  Statement st;
  if (!st.prepare(db_, "DELETE FROM url_filters WHERE id = ?")) { err = db_error(); return false; }
  st.bind(1, id);
  if (sqlite3_step(st.get()) != SQLITE_DONE) { err = db_error(); return false; }
  found = sqlite3_changes(db_) > 0;
  return true;
}

// -----------------------------------------------------------------------------
// move_filter() - swap a rule's sort_order with its neighbour.
// PRE:   id names an existing rule (otherwise moved=false, success).
// POLICY:
//   - Up:   neighbour is the largest sort_order strictly below ours.
//   - Down: neighbour is the smallest sort_order strictly above ours.
//   - Lookup of both rows and both UPDATEs run under one lock and one
//     transaction; the chain never observes a half-swapped order.
// -----------------------------------------------------------------------------
bool StateStore::move_filter(int64_t id, MoveDirection dir, bool& moved, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  moved = false;
  if (!db_) { err = "not_open"; return false; }

  Statement cur;
  if (!cur.prepare(db_, "SELECT sort_order FROM url_filters WHERE id = ?")) { err = db_error(); return false; }
  cur.bind(1, id);
  int rc = sqlite3_step(cur.get());
  if (rc == SQLITE_DONE) return true;               // unknown id: nothing to do
  if (rc != SQLITE_ROW) { err = db_error(); return false; }
  const int64_t cur_order = sqlite3_column_int64(cur.get(), 0);

  const char* neighbour_sql = (dir == MoveDirection::Up)
    ? "SELECT id, sort_order FROM url_filters WHERE sort_order < ? ORDER BY sort_order DESC LIMIT 1"
    : "SELECT id, sort_order FROM url_filters WHERE sort_order > ? ORDER BY sort_order ASC LIMIT 1";
  Statement nb;
  if (!nb.prepare(db_, neighbour_sql)) { err = db_error(); return false; }
  nb.bind(1, cur_order);
  rc = sqlite3_step(nb.get());
  if (rc == SQLITE_DONE) return true;               // already first/last
  if (rc != SQLITE_ROW) { err = db_error(); return false; }
  const int64_t nb_id    = sqlite3_column_int64(nb.get(), 0);
  const int64_t nb_order = sqlite3_column_int64(nb.get(), 1);
  cur.reset();
  nb.reset();

  if (!exec_locked("BEGIN IMMEDIATE", err)) return false;
  Statement upd;
  bool ok = upd.prepare(db_, "UPDATE url_filters SET sort_order = ? WHERE id = ?");
  if (ok) {
    upd.bind(1, nb_order);
    upd.bind(2, id);
    ok = sqlite3_step(upd.get()) == SQLITE_DONE;
    upd.reset();
  }
  if (ok) {
    upd.bind(1, cur_order);
    upd.bind(2, nb_id);
    ok = sqlite3_step(upd.get()) == SQLITE_DONE;
  }
  if (!ok) {
    err = db_error();
    std::string ignored;
    exec_locked("ROLLBACK", ignored);
    return false;
  }
  if (!exec_locked("COMMIT", err)) return false;
  moved = true;
  return true;
}

// ---------- administrative ----------

// True when the remaining SQL holds nothing but whitespace and ';'.
static bool only_trailing_noise(const char* tail) {
  if (!tail) return true;
  for (const char* p = tail; *p; ++p) {
    if (!std::isspace(static_cast<unsigned char>(*p)) && *p != ';') return false;
  }
  return true;
}

bool StateStore::run_readonly_query(const std::string& sql, QueryResult& out, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) { err = "not_open"; return false; }

  // Authorizer is scoped to this prepare; the lock keeps other workers from
  // preparing their own statements under it.
  sqlite3_set_authorizer(db_, readonly_authorizer, nullptr);
  Statement st;
  const char* tail = nullptr;
  const int prc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), st.out(), &tail);
  const std::string prepare_msg = (prc == SQLITE_OK) ? std::string() : db_error();
  sqlite3_set_authorizer(db_, nullptr, nullptr);

  if (prc == SQLITE_AUTH)           { err = "not_read_only"; return false; }
  if (prc != SQLITE_OK)             { err = "sql_error " + prepare_msg; return false; }
  if (!st.get())                    { err = "empty_query"; return false; }
  if (!only_trailing_noise(tail))   { err = "multiple_statements"; return false; }
  if (!sqlite3_stmt_readonly(st.get())) { err = "not_read_only"; return false; }

  out = QueryResult{};
  const int ncol = sqlite3_column_count(st.get());
  for (int c = 0; c < ncol; ++c) {
    const char* name = sqlite3_column_name(st.get(), c);
    out.columns.emplace_back(name ? name : "");
  }

  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    if (out.rows.size() >= MAX_QUERY_ROWS) { out.truncated = true; break; }
    json row = json::array();
    for (int c = 0; c < ncol; ++c) {
      switch (sqlite3_column_type(st.get(), c)) {
        case SQLITE_INTEGER: row.push_back(sqlite3_column_int64(st.get(), c)); break;
        case SQLITE_FLOAT:   row.push_back(sqlite3_column_double(st.get(), c)); break;
        case SQLITE_NULL:    row.push_back(nullptr); break;
        case SQLITE_BLOB:    row.push_back("<blob " + std::to_string(sqlite3_column_bytes(st.get(), c)) + " bytes>"); break;
        default:             row.push_back(column_text(st.get(), c)); break;
      }
    }
    out.rows.push_back(std::move(row));
  }
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) { err = "sql_error " + db_error(); return false; }
  return true;
}

bool StateStore::reset(std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!exec_locked("BEGIN IMMEDIATE", err)) return false;
  if (!exec_locked("DELETE FROM processed", err) || !exec_locked("DELETE FROM duplicate_codes", err)) {
    std::string ignored;
    exec_locked("ROLLBACK", ignored);
    return false;
  }
  return exec_locked("COMMIT", err);
}

} // namespace linkrelay
