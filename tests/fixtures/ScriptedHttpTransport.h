// Repository: MacReplay-gateway
// Component: Scripted HTTP Transport
// Purpose: Test transport answering upstream GETs from a table of URL fragments.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_TESTS_FIXTURES_SCRIPTED_HTTP_TRANSPORT_H_
#define MACREPLAY_TESTS_FIXTURES_SCRIPTED_HTTP_TRANSPORT_H_

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "macreplay/portal/HttpTransport.h"

namespace macreplay::tests::fixtures {

// ScriptedHttpTransport answers with the first rule whose fragment occurs in
// the request URL. Unmatched requests fail like a network error. Every
// request is recorded.
class ScriptedHttpTransport : public portal::IHttpTransport {
 public:
  void Respond(std::string url_fragment, std::string body, long status = 200) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.push_back({std::move(url_fragment), portal::HttpResponse{status, std::move(body)}});
  }

  void Fail(std::string url_fragment) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.push_back({std::move(url_fragment), std::nullopt});
  }

  std::optional<portal::HttpResponse> Get(const portal::HttpRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    for (const auto& rule : rules_) {
      if (request.url.find(rule.first) == std::string::npos) continue;
      if (!rule.second || rule.second->status < 200 || rule.second->status >= 300) {
        return std::nullopt;
      }
      return rule.second;
    }
    return std::nullopt;
  }

  std::vector<portal::HttpRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  size_t CountRequests(const std::string& url_fragment) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& request : requests_) {
      if (request.url.find(url_fragment) != std::string::npos) ++count;
    }
    return count;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, std::optional<portal::HttpResponse>>> rules_;
  std::vector<portal::HttpRequest> requests_;
};

}  // namespace macreplay::tests::fixtures

#endif  // MACREPLAY_TESTS_FIXTURES_SCRIPTED_HTTP_TRANSPORT_H_
