// ============================================================================
// code_extractor.cpp - implementation for code_extractor.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "linkrelay/code_extractor.hpp"

#include <cctype>
#include <regex>
#include <unordered_set>

#include "linkrelay/log.hpp"

namespace linkrelay {

namespace {

bool is_ascii_word(unsigned char c) {
  return c < 0x80 && (std::isalnum(c) || c == '_');
}

// `\b` in std::regex only knows ASCII, so the bytes of an accented letter
// count as a word break. A match whose word edge touches a UTF-8 byte sits
// inside a longer word and is not a code.
bool splits_word(const std::string& text, size_t pos, size_t len) {
  if (len == 0) return false;
  const auto at = [&text](size_t i) { return static_cast<unsigned char>(text[i]); };
  if (pos > 0 && at(pos - 1) >= 0x80 && is_ascii_word(at(pos))) return true;
  const size_t end = pos + len;
  if (end < text.size() && at(end) >= 0x80 && is_ascii_word(at(end - 1))) return true;
  return false;
}

} // namespace

std::string normalize_code(const std::string& code) {
  size_t b = 0, e = code.size();
  while (b < e && std::isspace(static_cast<unsigned char>(code[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(code[e - 1]))) --e;

  std::string out = code.substr(b, e - b);
  for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

CodeExtractor::CodeExtractor(PatternSource source) : source_(std::move(source)) {}

CodeExtractor::CodeExtractor(const LiveConfig& config)
: source_([&config] { return config.dup_code_regex(); }) {}

// -----------------------------------------------------------------------------
// extract() - codes in first-seen order.
// PRE:   `text` has already been through the filter chain.
// POLICY:
//   - Empty text or a disabled pattern yields no codes.
//   - Empty captures (optional groups that did not participate) are skipped.
//   - Patterns using `\b` skip matches that end inside a non-ASCII word
//     ("Informações" yields nothing, not "INFORMA").
//   - Regex runtime errors (e.g. complexity limits) disable this call only.
// -----------------------------------------------------------------------------
std::vector<std::string> CodeExtractor::extract(const std::string& text) {
  std::vector<std::string> codes;
  if (text.empty()) return codes;

  const std::string pattern = source_();
  auto rx = patterns_.get(pattern, "dup_code_regex");
  if (!rx) return codes;
  const bool word_bounded = pattern.find("\\b") != std::string::npos;

  try {
    std::unordered_set<std::string> seen;
    const bool grouped = rx->mark_count() > 0;
    for (std::sregex_iterator it(text.begin(), text.end(), *rx), end; it != end; ++it) {
      if (word_bounded &&
          splits_word(text, static_cast<size_t>(it->position(0)), static_cast<size_t>(it->length(0)))) {
        continue;
      }
      std::string code = normalize_code(grouped ? (*it)[1].str() : it->str());
      if (code.empty()) continue;
      if (seen.insert(code).second) codes.push_back(std::move(code));
    }
  } catch (const std::regex_error& e) {
    log::error() << "event=extract_failed reason=" << e.what();
    codes.clear();
  }
  return codes;
}

} // namespace linkrelay
