// -----------------------------------------------------------------------------
// http_link_resolver.cpp - libcurl redirect follower
//
// Only the final URL matters, so the body is abandoned on its first byte and
// a CURLE_WRITE_ERROR caused by that is treated as success.
// -----------------------------------------------------------------------------
#include "linkrelay/http_link_resolver.hpp"

#include <memory>
#include <mutex>
#include <utility>

#include <curl/curl.h>

#include "linkrelay/log.hpp"

namespace linkrelay {

namespace {

struct BodyProbe {
  bool started{false};
};

size_t abandon_body(char*, size_t, size_t, void* userdata) {
  static_cast<BodyProbe*>(userdata)->started = true;
  return 0;
}

void global_init_once() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct EasyDeleter {
  void operator()(CURL* h) const { curl_easy_cleanup(h); }
};

} // namespace

HttpLinkResolver::HttpLinkResolver(ResolverOptions opts) : opts_(std::move(opts)) {
  global_init_once();
}

// -----------------------------------------------------------------------------
// resolve() - GET `url`, follow up to max_redirects, return the effective URL.
// POLICY:
//   - Any transport error, timeout or redirect overflow -> nullopt.
//   - HTTP error statuses still report the URL they were served from.
// -----------------------------------------------------------------------------
std::optional<std::string> HttpLinkResolver::resolve(const std::string& url) {
  std::unique_ptr<CURL, EasyDeleter> h(curl_easy_init());
  if (!h) {
    log::error() << "event=expand_failed url=" << url << " reason=curl_init";
    return std::nullopt;
  }

  BodyProbe probe;
  curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(h.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(h.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h.get(), CURLOPT_MAXREDIRS, opts_.max_redirects);
  curl_easy_setopt(h.get(), CURLOPT_TIMEOUT_MS, opts_.timeout_ms);
  curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h.get(), CURLOPT_USERAGENT, opts_.user_agent.c_str());
  curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, abandon_body);
  curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &probe);

  const CURLcode rc = curl_easy_perform(h.get());
  if (rc != CURLE_OK && !(rc == CURLE_WRITE_ERROR && probe.started)) {
    log::error() << "event=expand_failed url=" << url << " reason=" << curl_easy_strerror(rc);
    return std::nullopt;
  }

  char* final_url = nullptr;
  if (curl_easy_getinfo(h.get(), CURLINFO_EFFECTIVE_URL, &final_url) != CURLE_OK || !final_url) {
    log::error() << "event=expand_failed url=" << url << " reason=no_effective_url";
    return std::nullopt;
  }
  return std::string(final_url);
}

} // namespace linkrelay
