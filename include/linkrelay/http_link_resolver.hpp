/**
 * @file http_link_resolver.hpp
 * @brief ILinkResolver backed by libcurl (GET, follow redirects, report final URL).
 */
#pragma once

#include <string>

#include "linkrelay/link_resolver.hpp"

namespace linkrelay {

struct ResolverOptions {
  long        timeout_ms{10000};     ///< whole request, redirects included
  long        max_redirects{10};
  std::string user_agent{
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
      "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"};
};

/**
 * @class HttpLinkResolver
 * @brief Follows redirects for one URL and returns where it lands.
 *
 * The response body is never read past its first chunk: once the final hop
 * starts sending data the transfer is cut and the effective URL taken.
 * Each call uses its own easy handle; calls may run on any thread.
 */
class HttpLinkResolver : public ILinkResolver {
public:
  explicit HttpLinkResolver(ResolverOptions opts = ResolverOptions());

  std::optional<std::string> resolve(const std::string& url) override;

private:
  ResolverOptions opts_;
};

} // namespace linkrelay
