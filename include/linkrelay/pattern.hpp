/**
 * @file pattern.hpp
 * @brief Compile-once regex handling for user-editable patterns.
 *
 * @details
 * Filter rules and the duplicate-code pattern are typed by an operator and
 * stored as text. This module is the single place they become `std::regex`:
 *
 * - `compile_pattern()` is what the admin layer calls before accepting a
 *   pattern (compile-on-write).
 * - `PatternCache` is what the hot path uses. It remembers the compiled form
 *   per pattern string and also remembers failures, so a bad row that slipped
 *   in (hand-edited database, older release) is reported once and then simply
 *   skipped on every later message.
 *
 * Dialect: ECMAScript. A leading `(?i)` (common in patterns written for other
 * engines) is accepted and turned into a case-insensitive flag.
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <string>

namespace linkrelay {

/// Compile `pattern`. Returns false and a reason in `err` if it is not a valid regex.
bool compile_pattern(const std::string& pattern, std::regex& out, std::string& err);

/// Shorthand for compile-on-write validation.
bool validate_pattern(const std::string& pattern, std::string& err);

/**
 * @brief Rewrite a replacement template into ECMAScript format syntax.
 *
 * `\1` and `\g<1>` become `$1`; `\\` becomes a literal backslash. A `$` in
 * the template is literal text and is escaped to `$$`.
 */
std::string to_ecma_replacement(const std::string& tmpl);

class PatternCache {
public:
  static constexpr size_t DEFAULT_CAPACITY = 256;

  /// Holds at most `capacity` patterns. Inserting past that starts over from
  /// an empty cache; patterns still in use are recompiled on their next get().
  explicit PatternCache(size_t capacity = DEFAULT_CAPACITY) : capacity_(capacity ? capacity : 1) {}

  /// Compiled regex for `pattern`, or nullptr if it does not compile.
  /// `owner` names the caller in the one-time error log line.
  std::shared_ptr<const std::regex> get(const std::string& pattern, const char* owner);

  size_t size() const;

private:
  size_t             capacity_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<const std::regex>> entries_;   ///< nullptr = invalid
};

} // namespace linkrelay
