// ============================================================================
// pattern.cpp - implementation for pattern.hpp
// ============================================================================

#include "linkrelay/pattern.hpp"

#include <cctype>

#include "linkrelay/log.hpp"

namespace linkrelay {

bool compile_pattern(const std::string& pattern, std::regex& out, std::string& err) {
  if (pattern.empty()) { err = "empty_pattern"; return false; }

  std::regex::flag_type flags = std::regex::ECMAScript;
  std::string body = pattern;
  if (body.rfind("(?i)", 0) == 0) {
    flags |= std::regex::icase;
    body = body.substr(4);
  }

  try {
    out = std::regex(body, flags);
  } catch (const std::regex_error& e) {
    err = std::string("invalid_regex reason=") + e.what();
    return false;
  }
  return true;
}

bool validate_pattern(const std::string& pattern, std::string& err) {
  std::regex ignored;
  return compile_pattern(pattern, ignored, err);
}

std::string to_ecma_replacement(const std::string& tmpl) {
  std::string out;
  out.reserve(tmpl.size());
  for (size_t i = 0; i < tmpl.size(); ++i) {
    const char c = tmpl[i];
    if (c == '$') { out += "$$"; continue; }                       // literal in the source dialect
    if (c != '\\' || i + 1 >= tmpl.size()) { out += c; continue; }

    const char n = tmpl[i + 1];
    if (std::isdigit(static_cast<unsigned char>(n))) {            // \1 .. \99
      out += '$';
      out += n;
      ++i;
      if (i + 1 < tmpl.size() && std::isdigit(static_cast<unsigned char>(tmpl[i + 1]))) out += tmpl[++i];
    } else if (n == 'g' && i + 2 < tmpl.size() && tmpl[i + 2] == '<') {   // \g<1>
      const auto close = tmpl.find('>', i + 3);
      const std::string num = (close == std::string::npos) ? std::string() : tmpl.substr(i + 3, close - i - 3);
      bool numeric = !num.empty();
      for (char d : num) numeric = numeric && std::isdigit(static_cast<unsigned char>(d));
      if (numeric) {
        out += '$';
        out += num;
        i = close;
      } else {
        out += c;                                                  // named groups: leave as text
      }
    } else if (n == '\\') {
      out += '\\';
      ++i;
    } else {
      out += c;
    }
  }
  return out;
}

std::shared_ptr<const std::regex> PatternCache::get(const std::string& pattern, const char* owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(pattern);
  if (it != entries_.end()) return it->second;

  std::shared_ptr<const std::regex> compiled;
  auto rx = std::make_shared<std::regex>();
  std::string err;
  if (compile_pattern(pattern, *rx, err)) {
    compiled = std::move(rx);
  } else {
    log::error() << "event=pattern_disabled owner=" << owner << " pattern='" << pattern << "' " << err;
  }
  if (entries_.size() >= capacity_) entries_.clear();   // full: start over
  entries_.emplace(pattern, compiled);
  return compiled;
}

size_t PatternCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace linkrelay
