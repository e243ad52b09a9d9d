// ============================================================================
// config.cpp - implementation for config.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "linkrelay/config.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace fs = std::filesystem;

namespace linkrelay {

const std::vector<std::string> REQUIRED_KEYS = {
  "API_ID", "API_HASH", "DEST_CHAT", "SOURCE_CHATS", "ADMIN_PASSWORD"
};

// -------- helpers --------

static std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

static std::string lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Whole-string integer parse; rejects trailing junk and empty input.
template <typename T>
static bool parse_int(const std::string& s, T& out) {
  if (s.empty()) return false;
  const char* b = s.data();
  const char* e = s.data() + s.size();
  if (*b == '+') ++b;                          // from_chars rejects a leading '+'
  auto [ptr, ec] = std::from_chars(b, e, out);
  return ec == std::errc() && ptr == e;
}

// -------- env file I/O --------

// -----------------------------------------------------------------------------
// parse_env_text() - KEY=VALUE lines into a map.
// POLICY:
//   - '#' starts a comment only at the beginning of a line (values may hold '#',
//     e.g. regex patterns).
//   - Split on the first '='; lines without '=' are ignored.
//   - Matching outer quotes are stripped; nothing is unescaped.
// -----------------------------------------------------------------------------
void parse_env_text(const std::string& text, EnvMap& out) {
  std::istringstream in(text);
  std::string raw;
  while (std::getline(in, raw)) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;

    std::string key = trim(line.substr(0, eq));
    std::string val = trim(line.substr(eq + 1));
    if (key.empty()) continue;
    if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
      val = val.substr(1, val.size() - 2);
    }
    out[key] = val;
  }
}

bool read_env_file(const std::string& path, EnvMap& out, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "open_failed path=" + path; return false; }
  std::ostringstream ss;
  ss << in.rdbuf();
  parse_env_text(ss.str(), out);
  return true;
}

// Quote a value the reader would otherwise change: surrounding whitespace is
// trimmed and one matching pair of outer quotes is stripped.
static std::string env_value(const std::string& v) {
  const bool padded = !v.empty() && (std::isspace(static_cast<unsigned char>(v.front())) ||
                                     std::isspace(static_cast<unsigned char>(v.back())));
  const bool quoted = v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front();
  return (padded || quoted) ? "\"" + v + "\"" : v;
}

// Write to "<path>.tmp" then rename, so readers never see a half-written file.
bool write_env_file(const std::string& path, const EnvMap& env, std::string& err) {
  std::error_code ec;
  const fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) { err = "config_dir_error " + ec.message(); return false; }
  }

  fs::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) { err = "open_failed path=" + tmp.string(); return false; }
    for (const auto& [k, v] : env) out << k << "=" << env_value(v) << "\n";
    out.flush();
    if (!out) { err = "write_failed path=" + tmp.string(); return false; }
  }

  fs::rename(tmp, target, ec);
  if (ec) { err = "rename_failed " + ec.message(); return false; }
  return true;
}

// -------- value parsers --------

bool parse_source_list(const std::string& text, std::vector<int64_t>& out, std::string& err) {
  out.clear();
  std::istringstream in(text);
  std::string item;
  while (std::getline(in, item, ',')) {
    item = trim(item);
    if (item.empty()) continue;               // "1,,2" and trailing commas are fine
    int64_t v = 0;
    if (!parse_int(item, v)) { err = "bad_source_id value=" + item; return false; }
    out.push_back(v);
  }
  return true;
}

std::string format_source_list(const std::vector<int64_t>& ids) {
  std::string s;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) s += ",";
    s += std::to_string(ids[i]);
  }
  return s;
}

bool parse_time_of_day(const std::string& text, TimeOfDay& out) {
  const std::string t = trim(text);
  const auto colon = t.find(':');
  if (colon == std::string::npos) return false;
  int h = 0, m = 0;
  if (!parse_int(trim(t.substr(0, colon)), h)) return false;
  if (!parse_int(trim(t.substr(colon + 1)), m)) return false;
  if (h < 0 || h > 23 || m < 0 || m > 59) return false;
  out.hour = h;
  out.minute = m;
  return true;
}

TimeOfDay parse_cleanup_time(const std::string& text) {
  TimeOfDay t;
  if (!parse_time_of_day(text, t)) return CLEANUP_TIME_DEFAULT;
  return t;
}

int parse_cleanup_days(const std::string& text) {
  int d = 0;
  if (!parse_int(trim(text), d)) return CLEANUP_DAYS_DEFAULT;
  return d;
}

bool parse_bool(const std::string& text, bool fallback) {
  const std::string s = lower(trim(text));
  if (s == "1" || s == "true" || s == "yes" || s == "on")  return true;
  if (s == "0" || s == "false" || s == "no" || s == "off") return false;
  return fallback;
}

// -------- startup settings --------

// -----------------------------------------------------------------------------
// load_settings() - Validate the startup surface.
// PRE:   `env` already merged (file over process environment).
// POLICY:
//   - Every REQUIRED_KEYS entry must be present and non-empty.
//   - API_ID must be an integer; SOURCE_CHATS must parse as an id list.
//   - WEB_PORT falls back to 8000 when absent; rejected when malformed.
// OUT:   `out` fully populated only on success.
// -----------------------------------------------------------------------------
bool load_settings(const EnvMap& env, Settings& out, std::string& err) {
  auto value = [&env](const std::string& key) -> std::string {
    auto it = env.find(key);
    return it == env.end() ? std::string() : trim(it->second);
  };

  for (const auto& key : REQUIRED_KEYS) {
    if (value(key).empty()) { err = "missing_env_var key=" + key; return false; }
  }

  Settings s;
  s.api_id = value("API_ID");
  int64_t api_id_num = 0;
  if (!parse_int(s.api_id, api_id_num)) { err = "bad_api_id value=" + s.api_id; return false; }

  s.api_hash       = value("API_HASH");
  s.session_string = value("SESSION_STRING");
  if (!value("SESSION").empty()) s.session_name = value("SESSION");
  s.dest_chat      = value("DEST_CHAT");
  s.admin_password = env.at("ADMIN_PASSWORD");

  if (!parse_source_list(value("SOURCE_CHATS"), s.source_chats, err)) return false;

  const std::string port = value("WEB_PORT");
  if (!port.empty()) {
    if (!parse_int(port, s.web_port) || s.web_port <= 0 || s.web_port > 65535) {
      err = "bad_web_port value=" + port;
      return false;
    }
  }

  out = std::move(s);
  return true;
}

EnvMap with_process_env(EnvMap file_values) {
  static const char* const KNOWN[] = {
    "API_ID", "API_HASH", "DEST_CHAT", "SOURCE_CHATS", "ADMIN_PASSWORD",
    "SESSION_STRING", "SESSION", "WEB_PORT", "DATA_DIR",
    "CLEANUP_DAYS", "CLEANUP_TIME", "CLEANUP_CODES_WHEN_DISABLED", "DUP_CODE_REGEX",
  };
  for (const char* key : KNOWN) {
    if (file_values.count(key)) continue;
    const char* v = std::getenv(key);
    if (v) file_values[key] = v;
  }
  return file_values;
}

std::string default_env_path() {
  static const char* const CANDIDATES[] = {"./config/.env", "/config/.env"};
  for (const char* p : CANDIDATES) {
    if (::access(p, R_OK) == 0) return p;
  }
  return CANDIDATES[0];
}

std::string resolve_data_dir(const EnvMap& env) {
  auto it = env.find("DATA_DIR");
  if (it != env.end() && !trim(it->second).empty()) return trim(it->second);
  std::error_code ec;
  if (fs::is_directory("/data", ec)) return "/data";
  return "./data";
}

// -------- live configuration --------

LiveConfig::LiveConfig(std::string env_path) : path_(std::move(env_path)) {}

EnvMap LiveConfig::file_values() const {
  std::lock_guard<std::mutex> lock(mutex_);
  EnvMap env;
  std::string err;
  read_env_file(path_, env, err);   // missing file is an empty config, not an error
  return env;
}

std::optional<std::string> LiveConfig::get(const std::string& key) const {
  EnvMap env = file_values();
  auto it = env.find(key);
  if (it != env.end() && !it->second.empty()) return it->second;
  if (const char* v = std::getenv(key.c_str()); v && *v) return std::string(v);
  return std::nullopt;
}

int LiveConfig::retention_days() const {
  auto v = get("CLEANUP_DAYS");
  return v ? parse_cleanup_days(*v) : CLEANUP_DAYS_DEFAULT;
}

TimeOfDay LiveConfig::retention_time() const {
  auto v = get("CLEANUP_TIME");
  return v ? parse_cleanup_time(*v) : CLEANUP_TIME_DEFAULT;
}

bool LiveConfig::clear_codes_when_disabled() const {
  auto v = get("CLEANUP_CODES_WHEN_DISABLED");
  return v ? parse_bool(*v, true) : true;
}

std::string LiveConfig::dup_code_regex() const {
  auto v = get("DUP_CODE_REGEX");
  return v ? *v : std::string(DUP_CODE_REGEX_DEFAULT);
}

bool LiveConfig::update(const std::function<void(EnvMap&)>& edit, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnvMap env;
  std::string read_err;
  read_env_file(path_, env, read_err);   // start empty if the file is new
  edit(env);
  return write_env_file(path_, env, err);
}

} // namespace linkrelay
