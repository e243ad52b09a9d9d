// ============================================================================
// link_filter.cpp - implementation for link_filter.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "linkrelay/link_filter.hpp"

#include <unordered_set>

#include "linkrelay/log.hpp"

namespace linkrelay {

std::string canonicalize_product_url(const std::string& url) {
  const bool product = url.find("/dp/") != std::string::npos || url.find("/gp/") != std::string::npos;
  const auto q = url.find('?');
  if (product && q != std::string::npos) return url.substr(0, q);
  return url;
}

// Replace every literal occurrence of `from` in `s`; scans past each insert.
static void replace_all(std::string& s, const std::string& from, const std::string& to) {
  if (from.empty()) return;
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

LinkFilterChain::LinkFilterChain(StateStore& store, ILinkResolver& resolver)
: store_(store), resolver_(resolver) {}

std::string LinkFilterChain::apply(const std::string& text) {
  if (text.empty()) return text;                    // attachment-only: nothing to rewrite

  std::vector<FilterRule> rules;
  std::string err;
  if (!store_.list_filters(rules, err)) {           // lock released on return
    log::error() << "event=filters_unavailable reason=" << err;
    return text;
  }
  return apply_rules(rules, text);
}

std::string LinkFilterChain::apply_rules(const std::vector<FilterRule>& rules, const std::string& text) {
  std::string out = text;
  for (const auto& rule : rules) {
    auto rx = patterns_.get(rule.pattern, "url_filter");
    if (!rx) continue;                              // disabled until fixed by an admin

    if (rule.replacement == EXPAND_MARKER) out = expand_links(rule, *rx, out);
    else                                   out = substitute(rule, *rx, out);
  }
  return out;
}

// -----------------------------------------------------------------------------
// expand_links() - resolve each distinct match and splice the result back in.
// POLICY:
//   - Capture group 1 is the URL when the pattern has groups; else whole match.
//   - Distinct URLs are resolved once each, in first-seen order.
//   - Product URLs (/dp/, /gp/) drop their query string after resolution.
//   - A failed resolution leaves that URL alone and moves on.
// -----------------------------------------------------------------------------
std::string LinkFilterChain::expand_links(const FilterRule& rule, const std::regex& rx, const std::string& text) {
  std::vector<std::string> urls;
  try {
    std::unordered_set<std::string> seen;
    const bool grouped = rx.mark_count() > 0;
    for (std::sregex_iterator it(text.begin(), text.end(), rx), end; it != end; ++it) {
      std::string url = grouped ? (*it)[1].str() : it->str();
      if (url.empty()) continue;
      if (seen.insert(url).second) urls.push_back(std::move(url));
    }
  } catch (const std::regex_error& e) {
    log::error() << "event=filter_error id=" << rule.id << " pattern='" << rule.pattern << "' reason=" << e.what();
    return text;
  }

  std::string out = text;
  for (const auto& url : urls) {
    auto resolved = resolver_.resolve(url);
    if (!resolved) {
      log::debug() << "event=expand_kept url=" << url;
      continue;
    }
    const std::string final_url = canonicalize_product_url(*resolved);
    if (final_url != url) {
      replace_all(out, url, final_url);
      log::info() << "event=expanded from=" << url << " to=" << final_url;
    }
  }
  return out;
}

std::string LinkFilterChain::substitute(const FilterRule& rule, const std::regex& rx, const std::string& text) {
  try {
    std::string out = std::regex_replace(text, rx, to_ecma_replacement(rule.replacement));
    if (out != text) log::info() << "event=filter_matched id=" << rule.id << " pattern='" << rule.pattern << "'";
    return out;
  } catch (const std::regex_error& e) {
    log::error() << "event=filter_error id=" << rule.id << " pattern='" << rule.pattern << "' reason=" << e.what();
    return text;
  }
}

} // namespace linkrelay
