/**
 * @file link_resolver.hpp
 * @brief Network link expansion seam used by expansion filter rules.
 *
 * @details
 * The filter chain only needs one thing from the network: "where does this
 * URL end up after redirects?". That question sits behind `ILinkResolver` so
 * the chain can be tested with a table-driven fake and so the HTTP stack is
 * confined to one translation unit (http_link_resolver.cpp).
 *
 * Implementations must bound each call by a timeout and must never throw.
 * A failed lookup is `std::nullopt`; the caller keeps the original URL.
 */
#pragma once

#include <optional>
#include <string>

namespace linkrelay {

class ILinkResolver {
public:
  virtual ~ILinkResolver() = default;

  /// Final URL after following redirects, or nullopt on any failure.
  virtual std::optional<std::string> resolve(const std::string& url) = 0;
};

/**
 * @brief Drop the query string of product-page URLs.
 *
 * A URL whose path contains `/dp/` or `/gp/` and that carries `?...` is cut
 * at the first `?`. Any other URL is returned unchanged.
 */
std::string canonicalize_product_url(const std::string& url);

} // namespace linkrelay
