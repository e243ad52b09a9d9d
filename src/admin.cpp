#include "linkrelay/admin.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

#include "linkrelay/log.hpp"
#include "linkrelay/pattern.hpp"

namespace linkrelay {

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

AdminService::AdminService(StateStore& store, LiveConfig& config,
                           std::string admin_password, std::string stats_path)
: store_(store),
  config_(config),
  admin_password_(std::move(admin_password)),
  stats_path_(std::move(stats_path)) {}

bool AdminService::check_password(const std::string& candidate) const {
  if (admin_password_.empty()) return false;
  unsigned char diff = static_cast<unsigned char>(candidate.size() != admin_password_.size());
  const size_t n = std::max(candidate.size(), admin_password_.size());
  for (size_t i = 0; i < n; ++i) {
    const unsigned char a = i < candidate.size() ? static_cast<unsigned char>(candidate[i]) : 0;
    const unsigned char b = i < admin_password_.size() ? static_cast<unsigned char>(admin_password_[i]) : 0;
    diff |= static_cast<unsigned char>(a ^ b);
  }
  return diff == 0;
}

bool AdminService::edit_config(const std::function<void(EnvMap&)>& edit, std::string& err) {
  return config_.update([&](EnvMap& env) {
    edit(env);
    if (!admin_password_.empty()) env["ADMIN_PASSWORD"] = admin_password_;
  }, err);
}

// ---- filters -----------------------------------------------------------------

bool AdminService::list_filters(std::vector<FilterRule>& out, std::string& err) {
  return store_.list_filters(out, err);
}

bool AdminService::add_filter(const std::string& pattern, const std::string& replacement,
                              int64_t& new_id, std::string& err) {
  std::string why;
  if (!validate_pattern(pattern, why)) {
    err = "bad_pattern " + why;
    return false;
  }
  if (!store_.add_filter(pattern, replacement, new_id, err)) return false;
  log::info() << "event=filter_added id=" << new_id;
  return true;
}

bool AdminService::update_filter(int64_t id, const std::string& pattern,
                                 const std::string& replacement, std::string& err) {
  std::string why;
  if (!validate_pattern(pattern, why)) {
    err = "bad_pattern " + why;
    return false;
  }
  bool found = false;
  if (!store_.update_filter(id, pattern, replacement, found, err)) return false;
  if (!found) {
    err = "not_found";
    return false;
  }
  log::info() << "event=filter_updated id=" << id;
  return true;
}

bool AdminService::delete_filter(int64_t id, std::string& err) {
  bool found = false;
  if (!store_.delete_filter(id, found, err)) return false;
  if (!found) {
    err = "not_found";
    return false;
  }
  log::info() << "event=filter_deleted id=" << id;
  return true;
}

bool AdminService::move_filter_up(int64_t id, bool& moved, std::string& err) {
  return store_.move_filter(id, MoveDirection::Up, moved, err);
}

bool AdminService::move_filter_down(int64_t id, bool& moved, std::string& err) {
  return store_.move_filter(id, MoveDirection::Down, moved, err);
}

// ---- sources -----------------------------------------------------------------

bool AdminService::configured_sources(std::vector<int64_t>& out, std::string& err) const {
  out.clear();
  const auto v = config_.get("SOURCE_CHATS");
  if (!v) return true;
  return parse_source_list(*v, out, err);
}

// -----------------------------------------------------------------------------
// set_channel() - Label a source and make sure it is configured.
// POLICY:
//   - Config is written first; a failed write leaves the label untouched.
//   - An unparsable SOURCE_CHATS is refused rather than overwritten.
// NOTE: the running Relay keeps its startup source list; new sources apply
//       after a restart.
// -----------------------------------------------------------------------------
bool AdminService::set_channel(int64_t source_id, const std::string& name, std::string& err) {
  std::vector<int64_t> sources;
  if (!configured_sources(sources, err)) return false;

  if (std::find(sources.begin(), sources.end(), source_id) == sources.end()) {
    sources.push_back(source_id);
    const std::string list = format_source_list(sources);
    if (!edit_config([&](EnvMap& env) { env["SOURCE_CHATS"] = list; }, err)) return false;
  }

  if (!store_.upsert_channel(source_id, trim(name), err)) return false;
  log::info() << "event=channel_set source=" << source_id;
  return true;
}

bool AdminService::channel_stats(std::vector<ChannelStat>& out, std::string& err) {
  out.clear();
  std::map<int64_t, std::string> labels;
  std::map<int64_t, int64_t> counts;
  if (!store_.channel_labels(labels, err)) return false;
  if (!store_.processed_counts(counts, err)) return false;

  std::vector<int64_t> sources;
  std::string cfg_err;
  if (!configured_sources(sources, cfg_err)) {
    log::warn() << "event=config_invalid key=SOURCE_CHATS reason=" << cfg_err;
    sources.clear();
  }

  std::set<int64_t> listed;
  for (int64_t id : sources) {
    if (!listed.insert(id).second) continue;
    ChannelStat s;
    s.source_id = id;
    auto l = labels.find(id);
    if (l != labels.end()) s.name = l->second;
    auto c = counts.find(id);
    if (c != counts.end()) s.messages = c->second;
    out.push_back(s);
  }
  for (const auto& kv : counts) {
    if (listed.count(kv.first)) continue;
    ChannelStat s;
    s.source_id = kv.first;
    s.messages  = kv.second;
    auto l = labels.find(kv.first);
    if (l != labels.end()) s.name = l->second;
    out.push_back(s);
  }
  return true;
}

// ---- live settings -----------------------------------------------------------

bool AdminService::set_retention(const std::string& days, const std::string& time, std::string& err) {
  const std::string d = trim(days);
  const std::string t = trim(time);

  if (!d.empty()) {
    size_t used = 0;
    try {
      std::stoi(d, &used);
    } catch (const std::exception&) {
      used = 0;
    }
    if (used != d.size()) {
      err = "bad_days";
      return false;
    }
  }
  if (!t.empty()) {
    TimeOfDay tod;
    if (!parse_time_of_day(t, tod)) {
      err = "bad_time";
      return false;
    }
  }

  if (!edit_config([&](EnvMap& env) {
        if (d.empty()) env.erase("CLEANUP_DAYS"); else env["CLEANUP_DAYS"] = d;
        if (t.empty()) env.erase("CLEANUP_TIME"); else env["CLEANUP_TIME"] = t;
      }, err)) {
    return false;
  }
  log::info() << "event=retention_set days=" << (d.empty() ? "default" : d)
              << " time=" << (t.empty() ? "default" : t);
  return true;
}

bool AdminService::set_dup_code_regex(const std::string& pattern, std::string& err) {
  const std::string p = trim(pattern);
  if (!p.empty()) {
    std::string why;
    if (!validate_pattern(p, why)) {
      log::warn() << "event=dup_regex_rejected reason=" << why;
      err = "bad_pattern " + why;
      return false;
    }
  }
  if (!edit_config([&](EnvMap& env) {
        if (p.empty()) env.erase("DUP_CODE_REGEX"); else env["DUP_CODE_REGEX"] = p;
      }, err)) {
    return false;
  }
  log::info() << "event=dup_regex_set default=" << (p.empty() ? 1 : 0);
  return true;
}

// ---- state -------------------------------------------------------------------

bool AdminService::run_query(const std::string& sql, QueryResult& out, std::string& err) {
  if (!store_.run_readonly_query(sql, out, err)) {
    log::warn() << "event=query_rejected reason=" << err;
    return false;
  }
  return true;
}

bool AdminService::reset_state(std::string& err) {
  if (!store_.reset(err)) return false;
  log::info() << "event=state_reset";
  return true;
}

Stats AdminService::service_stats() const {
  return read_stats(stats_path_);
}

} // namespace linkrelay
