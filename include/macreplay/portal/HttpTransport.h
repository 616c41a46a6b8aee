// Repository: MacReplay-gateway
// Component: HTTP Transport
// Purpose: Bounded, retrying HTTP GET used for every upstream portal call.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_PORTAL_HTTP_TRANSPORT_H_
#define MACREPLAY_PORTAL_HTTP_TRANSPORT_H_

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace macreplay::portal {

struct HttpRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::vector<std::pair<std::string, std::string>> cookies;
  std::string proxy;  // Empty = direct.
  std::chrono::milliseconds timeout{5000};
  int max_retries = 3;  // Extra attempts after a 500/502/503/504.
};

struct HttpResponse {
  long status = 0;
  std::string body;
};

// IHttpTransport performs one logical GET. Implementations return nullopt for
// network errors and for any non-2xx final status; they never throw.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  virtual std::optional<HttpResponse> Get(const HttpRequest& request) = 0;
};

// libcurl-backed transport. Retries 500/502/503/504 with linear backoff of
// 100 ms per attempt.
class CurlHttpTransport : public IHttpTransport {
 public:
  CurlHttpTransport();
  ~CurlHttpTransport() override = default;

  std::optional<HttpResponse> Get(const HttpRequest& request) override;

  static bool IsRetryableStatus(long status);

 private:
  std::optional<HttpResponse> PerformOnce(const HttpRequest& request,
                                          std::string* error) const;
};

}  // namespace macreplay::portal

#endif  // MACREPLAY_PORTAL_HTTP_TRANSPORT_H_
