/**
 * @file main.cpp
 * @brief linkrelayctl - one-shot admin commands against a relay's config and state.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): global `--env`, `--data-dir`, `--format`, `--password`.
 *  - Open the same env file and `<data>/state.db` the daemon uses. SQLite WAL
 *    plus the busy timeout lets this run while the daemon is up.
 *  - Check the admin password, then run exactly one AdminService operation.
 *  - Print results as aligned text (pretty) or one JSON document (json).
 *
 * Exit codes:
 *  - 0 ok, 1 store unusable, 2 config/usage error, 3 bad password,
 *    4 operation refused (reason printed as `status=error reason=...`).
 */

#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "linkrelay/admin.hpp"
#include "linkrelay/config.hpp"
#include "linkrelay/log.hpp"
#include "linkrelay/state_store.hpp"
#include "linkrelay/stats.hpp"

using json = nlohmann::json;
using namespace linkrelay;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
};

static int fail(const std::string& reason, int code) {
  std::cerr << "status=error reason=" << reason << "\n";
  return code;
}

static int ok_json(const json& j) {
  std::cout << j.dump(2) << "\n";
  return 0;
}

// ---------- pretty printers ----------

static void print_filters(const std::vector<FilterRule>& rules, const Ansi& ansi) {
  if (rules.empty()) { std::cout << ansi.dim("(no filters)") << "\n"; return; }
  std::cout << ansi.bold("  ID  ORDER  PATTERN -> REPLACEMENT") << "\n";
  for (const auto& r : rules) {
    std::cout << "  " << std::left << std::setw(4) << r.id
              << std::setw(7) << r.sort_order
              << r.pattern << "  ->  "
              << (r.replacement.empty() ? ansi.dim("(empty)") : r.replacement) << "\n";
  }
}

static void print_channels(const std::vector<ChannelStat>& rows, const Ansi& ansi) {
  if (rows.empty()) { std::cout << ansi.dim("(no sources)") << "\n"; return; }
  std::cout << ansi.bold("  SOURCE                MESSAGES  NAME") << "\n";
  for (const auto& c : rows) {
    std::cout << "  " << std::left << std::setw(22) << c.source_id
              << std::setw(10) << c.messages
              << (c.name.empty() ? ansi.dim("-") : c.name) << "\n";
  }
}

static void print_query(const QueryResult& q, const Ansi& ansi) {
  std::string header;
  for (size_t i = 0; i < q.columns.size(); ++i) {
    if (i) header += " | ";
    header += q.columns[i];
  }
  std::cout << ansi.bold(header) << "\n";
  for (const auto& row : q.rows) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
      if (i) line += " | ";
      line += row[i].is_string() ? row[i].get<std::string>() : row[i].dump();
    }
    std::cout << line << "\n";
  }
  std::cout << ansi.dim("(" + std::to_string(q.rows.size()) + " rows" +
                        (q.truncated ? ", truncated" : "") + ")") << "\n";
}

static json filters_json(const std::vector<FilterRule>& rules) {
  json arr = json::array();
  for (const auto& r : rules) {
    arr.push_back({{"id", r.id}, {"pattern", r.pattern},
                   {"replacement", r.replacement}, {"sort_order", r.sort_order}});
  }
  return arr;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_env;
  std::string opt_data_dir;
  std::string opt_format = "pretty";   // pretty|json
  std::string opt_password;
  bool        opt_no_color = false;

  CLI::App app{"linkrelayctl - relay administration"};
  app.require_subcommand(1);
  app.add_option("--env", opt_env, "Env file (default ./config/.env, then /config/.env)");
  app.add_option("--data-dir", opt_data_dir, "State directory (default DATA_DIR, /data or ./data)");
  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty","json"}));
  app.add_option("--password", opt_password, "Admin password")->envname("LINKRELAY_PASSWORD");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  // filters
  auto* c_filters = app.add_subcommand("filters", "List filter rules in application order");

  std::string f_pattern, f_replacement;
  int64_t f_id = 0;
  auto* c_add = app.add_subcommand("filter-add", "Append a filter rule");
  c_add->add_option("--pattern", f_pattern, "Regex")->required();
  c_add->add_option("--replacement", f_replacement, "Template, or 'amz' to expand links");
  auto* c_update = app.add_subcommand("filter-update", "Replace a rule's pattern and replacement");
  c_update->add_option("--id", f_id, "Rule id")->required();
  c_update->add_option("--pattern", f_pattern, "Regex")->required();
  c_update->add_option("--replacement", f_replacement, "Template, or 'amz' to expand links");
  auto* c_delete = app.add_subcommand("filter-delete", "Delete a rule");
  c_delete->add_option("--id", f_id, "Rule id")->required();
  auto* c_up = app.add_subcommand("filter-up", "Move a rule one step earlier");
  c_up->add_option("--id", f_id, "Rule id")->required();
  auto* c_down = app.add_subcommand("filter-down", "Move a rule one step later");
  c_down->add_option("--id", f_id, "Rule id")->required();

  // sources
  int64_t ch_id = 0;
  std::string ch_name;
  auto* c_channel = app.add_subcommand("channel-set", "Label a source and add it to SOURCE_CHATS");
  c_channel->add_option("--id", ch_id, "Source id")->required();
  c_channel->add_option("--name", ch_name, "Display name");
  auto* c_channels = app.add_subcommand("channels", "Per-source processed counts");

  // settings
  std::string r_days, r_time, d_regex;
  auto* c_retention = app.add_subcommand("retention", "Set CLEANUP_DAYS / CLEANUP_TIME (empty = default)");
  c_retention->add_option("--days", r_days, "Days to keep processed ids (<= 0 disables)");
  c_retention->add_option("--time", r_time, "Daily sweep time HH:MM (local)");
  auto* c_regex = app.add_subcommand("dup-regex", "Set DUP_CODE_REGEX (empty = default)");
  c_regex->add_option("--pattern", d_regex, "Regex; group 1 is the code when present");

  // state
  std::string q_sql;
  bool reset_yes = false;
  auto* c_query = app.add_subcommand("query", "Run one read-only SQL statement");
  c_query->add_option("sql", q_sql, "SELECT ...")->required();
  auto* c_reset = app.add_subcommand("reset", "Forget all processed ids and codes");
  c_reset->add_flag("--yes", reset_yes, "Confirm");
  auto* c_stats = app.add_subcommand("stats", "Show the daemon's stats file");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "pretty";
  const bool as_json = opt_format == "json";
  log::set_level(log::Level::Warn);

  // ---- config ----
  if (opt_env.empty()) opt_env = default_env_path();
  std::string err;
  EnvMap file_env;
  if (!read_env_file(opt_env, file_env, err)) {
    std::cerr << "status=warn reason=env_file_unreadable path=" << opt_env << "\n";
  }
  const EnvMap env = with_process_env(file_env);
  auto pw = env.find("ADMIN_PASSWORD");
  if (pw == env.end() || pw->second.empty()) return fail("missing_env_var key=ADMIN_PASSWORD", 2);
  if (opt_data_dir.empty()) opt_data_dir = resolve_data_dir(env);

  StateStore store;
  LiveConfig live(opt_env);
  AdminService admin(store, live, pw->second, opt_data_dir + "/stats.json");
  if (!admin.check_password(opt_password)) return fail("bad_password", 3);

  if (c_stats->parsed()) {
    const Stats s = admin.service_stats();
    if (as_json) return ok_json({{"messages", s.messages}, {"status", to_string(s.status)}});
    std::cout << "status=" << to_string(s.status) << " messages=" << s.messages << "\n";
    return 0;
  }

  if (c_retention->parsed()) {
    if (!admin.set_retention(r_days, r_time, err)) return fail(err, 4);
    std::cout << "status=ok\n";
    return 0;
  }
  if (c_regex->parsed()) {
    if (!admin.set_dup_code_regex(d_regex, err)) return fail(err, 4);
    std::cout << "status=ok\n";
    return 0;
  }

  // ---- store-backed commands ----
  if (!store.open(opt_data_dir + "/state.db", err)) return fail("store_open_failed " + err, 1);

  if (c_filters->parsed()) {
    std::vector<FilterRule> rules;
    if (!admin.list_filters(rules, err)) return fail(err, 1);
    if (as_json) return ok_json(filters_json(rules));
    print_filters(rules, ansi);
    return 0;
  }
  if (c_add->parsed()) {
    int64_t id = 0;
    if (!admin.add_filter(f_pattern, f_replacement, id, err)) return fail(err, 4);
    std::cout << "status=ok id=" << id << "\n";
    return 0;
  }
  if (c_update->parsed()) {
    if (!admin.update_filter(f_id, f_pattern, f_replacement, err)) return fail(err, 4);
    std::cout << "status=ok id=" << f_id << "\n";
    return 0;
  }
  if (c_delete->parsed()) {
    if (!admin.delete_filter(f_id, err)) return fail(err, 4);
    std::cout << "status=ok id=" << f_id << "\n";
    return 0;
  }
  if (c_up->parsed() || c_down->parsed()) {
    bool moved = false;
    const bool done = c_up->parsed() ? admin.move_filter_up(f_id, moved, err)
                                     : admin.move_filter_down(f_id, moved, err);
    if (!done) return fail(err, 4);
    std::cout << "status=ok id=" << f_id << " moved=" << (moved ? 1 : 0) << "\n";
    return 0;
  }
  if (c_channel->parsed()) {
    if (!admin.set_channel(ch_id, ch_name, err)) return fail(err, 4);
    std::cout << "status=ok source=" << ch_id << "\n";
    return 0;
  }
  if (c_channels->parsed()) {
    std::vector<ChannelStat> rows;
    if (!admin.channel_stats(rows, err)) return fail(err, 1);
    if (as_json) {
      json arr = json::array();
      for (const auto& c : rows) {
        arr.push_back({{"source_id", c.source_id}, {"name", c.name}, {"messages", c.messages}});
      }
      return ok_json(arr);
    }
    print_channels(rows, ansi);
    return 0;
  }
  if (c_query->parsed()) {
    QueryResult q;
    if (!admin.run_query(q_sql, q, err)) return fail(err, 4);
    if (as_json) return ok_json({{"columns", q.columns}, {"rows", q.rows}, {"truncated", q.truncated}});
    print_query(q, ansi);
    return 0;
  }
  if (c_reset->parsed()) {
    if (!reset_yes) return fail("confirmation_required flag=--yes", 2);
    if (!admin.reset_state(err)) return fail(err, 1);
    std::cout << "status=ok\n";
    return 0;
  }

  return fail("no_command", 2);
}
