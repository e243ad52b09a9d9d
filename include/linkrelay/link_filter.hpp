/**
 * @file link_filter.hpp
 * @brief LinkFilterChain - ordered, operator-editable rewrite rules over message text.
 *
 * @details
 * ## Rule kinds
 * - **Expansion** (`replacement == EXPAND_MARKER`): every distinct match of
 *   `pattern` is treated as a URL, resolved through redirects, product URLs
 *   lose their tracking query, and each literal occurrence of the original is
 *   replaced by the result.
 * - **Substitution** (anything else): `std::regex_replace(text, pattern,
 *   replacement)` over the whole text.
 *
 * ## Ordering
 * Rules are read from the store on **every** call, ordered by
 * `(sort_order, id)`, so an admin reorder applies to the very next message.
 * Each rule sees the output of the previous one.
 *
 * ## Failure model
 * | Failure                          | Effect                                  |
 * |----------------------------------|-----------------------------------------|
 * | store read fails                 | text returned unchanged, logged         |
 * | pattern does not compile         | rule skipped (logged once per pattern)  |
 * | one URL fails to resolve         | that URL left as-is, others still done  |
 * | regex engine error mid-rule      | rule skipped, prior text kept           |
 *
 * Nothing here is fatal to the pipeline. The store lock is held only while
 * the rule list is read; URL resolution happens with no lock held.
 */
#ifndef LINKRELAY_LINK_FILTER_HPP
#define LINKRELAY_LINK_FILTER_HPP

#include <regex>
#include <string>
#include <vector>

#include "linkrelay/link_resolver.hpp"
#include "linkrelay/pattern.hpp"
#include "linkrelay/state_store.hpp"

namespace linkrelay {

class LinkFilterChain {
public:
  LinkFilterChain(StateStore& store, ILinkResolver& resolver);

  /// Run every rule, in order, over `text`.
  std::string apply(const std::string& text);

  /// Apply one already-loaded rule list (used by apply() and by tests).
  std::string apply_rules(const std::vector<FilterRule>& rules, const std::string& text);

private:
  std::string expand_links(const FilterRule& rule, const std::regex& rx, const std::string& text);
  std::string substitute(const FilterRule& rule, const std::regex& rx, const std::string& text);

  StateStore&    store_;
  ILinkResolver& resolver_;
  PatternCache   patterns_;
};

} // namespace linkrelay

#endif // LINKRELAY_LINK_FILTER_HPP
