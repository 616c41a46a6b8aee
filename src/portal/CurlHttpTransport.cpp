// Repository: MacReplay-gateway
// Component: HTTP Transport
// Purpose: Bounded, retrying HTTP GET used for every upstream portal call.
// Copyright (c) 2025 MacReplay

#include "macreplay/portal/HttpTransport.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <thread>

#include "macreplay/util/Logger.hpp"

namespace macreplay::portal {

namespace {

using macreplay::util::Logger;

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  const size_t total = size * nmemb;
  static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
  return total;
}

struct CurlEasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::once_flag g_curl_init_once;

}  // namespace

CurlHttpTransport::CurlHttpTransport() {
  std::call_once(g_curl_init_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool CurlHttpTransport::IsRetryableStatus(long status) {
  return status == 500 || status == 502 || status == 503 || status == 504;
}

std::optional<HttpResponse> CurlHttpTransport::PerformOnce(const HttpRequest& request,
                                                           std::string* error) const {
  std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
  if (!curl) {
    *error = "curl_easy_init failed";
    return std::nullopt;
  }

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(request.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  curl_slist* raw_headers = nullptr;
  for (const auto& [name, value] : request.headers) {
    raw_headers = curl_slist_append(raw_headers, (name + ": " + value).c_str());
  }
  std::unique_ptr<curl_slist, CurlSlistDeleter> headers(raw_headers);
  if (headers) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  std::string cookie_line;
  for (const auto& [name, value] : request.cookies) {
    if (!cookie_line.empty()) cookie_line += "; ";
    cookie_line += name + "=" + value;
  }
  if (!cookie_line.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_COOKIE, cookie_line.c_str());
  }
  if (!request.proxy.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_PROXY, request.proxy.c_str());
  }

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    *error = curl_easy_strerror(res);
    return std::nullopt;
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

std::optional<HttpResponse> CurlHttpTransport::Get(const HttpRequest& request) {
  for (int attempt = 0;; ++attempt) {
    std::string error;
    auto response = PerformOnce(request, &error);
    if (!response) {
      Logger::Debug("[HttpTransport] GET " + request.url + " failed: " + error);
      return std::nullopt;
    }
    if (response->status >= 200 && response->status < 300) {
      return response;
    }
    if (!IsRetryableStatus(response->status) || attempt >= request.max_retries) {
      Logger::Debug("[HttpTransport] GET " + request.url + " returned HTTP " +
                    std::to_string(response->status));
      return std::nullopt;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100 * (attempt + 1)));
  }
}

}  // namespace macreplay::portal
