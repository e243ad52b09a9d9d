/**
 * @file code_extractor.hpp
 * @brief Content fingerprints ("codes") and the cache that remembers them.
 *
 * @details
 * Two messages with different identities can carry the same offer: a product
 * id, a coupon, an order code. `CodeExtractor` pulls those tokens out of the
 * already-filtered text; `DuplicateCache` checks and records them in the
 * store so the second copy is skipped.
 *
 * EXTRACTION
 * ----------
 * - One pattern, re-read from its source on every call (the daemon points it
 *   at `LiveConfig::dup_code_regex()`), default `\b[A-Za-z0-9]{6,}\b`.
 * - Pattern with a capture group: group 1 is the code. Otherwise the whole
 *   match is.
 * - Each code is normalized (trim + ASCII uppercase); the result keeps first
 *   occurrence order and drops repeats.
 * - Text is UTF-8. For patterns with `\b`, an ASCII run that continues into
 *   an accented letter is part of a longer word and is not extracted.
 * - A pattern that does not compile disables extraction (empty result) and
 *   is logged once per distinct value.
 *
 * CACHE
 * -----
 * `exists()` returns the subset already stored; `record()` is insert-if-absent.
 * Both are single store operations and hold the store lock only for their own
 * SQL.
 */
#ifndef LINKRELAY_CODE_EXTRACTOR_HPP
#define LINKRELAY_CODE_EXTRACTOR_HPP

#include <functional>
#include <set>
#include <string>
#include <vector>

#include "linkrelay/config.hpp"
#include "linkrelay/pattern.hpp"
#include "linkrelay/state_store.hpp"

namespace linkrelay {

/// Trim surrounding whitespace and uppercase ASCII letters.
std::string normalize_code(const std::string& code);

class CodeExtractor {
public:
  using PatternSource = std::function<std::string()>;

  /// Pattern re-read from `source` on every extract().
  explicit CodeExtractor(PatternSource source);

  /// Pattern re-read from the live config file.
  explicit CodeExtractor(const LiveConfig& config);

  /// Ordered, de-duplicated, normalized codes found in `text`.
  std::vector<std::string> extract(const std::string& text);

private:
  PatternSource source_;
  PatternCache  patterns_;
};

class DuplicateCache {
public:
  explicit DuplicateCache(StateStore& store) : store_(store) {}

  /// Subset of `codes` already known.
  bool exists(const std::vector<std::string>& codes, std::set<std::string>& out, std::string& err) {
    return store_.find_existing_codes(codes, out, err);
  }

  /// Insert unseen codes with the current timestamp.
  bool record(const std::vector<std::string>& codes, std::string& err) {
    return store_.mark_codes(codes, err);
  }

  /// Drop every cached code (retention sweep).
  bool clear(int64_t& removed, std::string& err) { return store_.clear_codes(removed, err); }

private:
  StateStore& store_;
};

} // namespace linkrelay

#endif // LINKRELAY_CODE_EXTRACTOR_HPP
