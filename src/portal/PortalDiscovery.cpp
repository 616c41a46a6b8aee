// Repository: MacReplay-gateway
// Component: Portal Discovery
// Purpose: Derive a portal's API URL from its published xpcom.common.js.
// Copyright (c) 2025 MacReplay

#include "macreplay/portal/PortalDiscovery.h"

#include <regex>

#include "macreplay/portal/PortalClient.h"
#include "macreplay/util/Logger.hpp"

namespace macreplay::portal {

namespace {

using macreplay::util::Logger;

constexpr size_t kMaxStatementBytes = 4096;

std::string StripScriptNoise(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == ' ' || c == '\'' || c == '+') continue;
    out.push_back(c);
  }
  return out;
}

void ReplaceAll(std::string& text, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

// Text between `keyword` and the next `terminator`, without either. Regexes
// only ever see these slices, never the whole script.
std::optional<std::string> StatementAfter(const std::string& script, const std::string& keyword,
                                          const std::string& terminator) {
  const size_t begin = script.find(keyword);
  if (begin == std::string::npos) return std::nullopt;
  const size_t body = begin + keyword.size();
  const size_t end = script.find(terminator, body);
  if (end == std::string::npos || end - body > kMaxStatementBytes) return std::nullopt;
  return script.substr(body, end - body);
}

// Last digit of `this.portal_<field>=...;`, the capture group it selects.
std::optional<int> FindGroupIndex(const std::string& script, const std::string& field) {
  auto statement = StatementAfter(script, "this." + field + "=", ";");
  if (!statement) return std::nullopt;
  std::smatch match;
  if (!std::regex_search(*statement, match, std::regex(R"((\d)\D*$)"))) return std::nullopt;
  return std::stoi(match[1].str());
}

// scheme://host[:port] of `url`, or empty when it has neither.
std::string UrlOrigin(const std::string& url) {
  const size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) return "";
  const size_t host_begin = scheme_end + 3;
  const size_t host_end = url.find_first_of("/?#", host_begin);
  const std::string host = url.substr(
      host_begin, host_end == std::string::npos ? std::string::npos : host_end - host_begin);
  if (host.empty()) return "";
  return url.substr(0, host_begin) + host;
}

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

const std::vector<std::string>& DiscoveryScriptPaths() {
  static const std::vector<std::string> kPaths = {
      "/c/xpcom.common.js",
      "/client/xpcom.common.js",
      "/c_/xpcom.common.js",
      "/stalker_portal/c/xpcom.common.js",
      "/stalker_portal/c_/xpcom.common.js",
  };
  return kPaths;
}

std::optional<std::string> ExtractPortalUrl(const std::string& script_url,
                                            const std::string& script_text) {
  const std::string script = StripScriptNoise(script_text);
  try {
    // varpattern=/(https?):\/\/.../;
    auto pattern_statement = StatementAfter(script, "varpattern", "/;");
    const size_t pattern_begin =
        pattern_statement ? pattern_statement->rfind("/(http") : std::string::npos;
    if (pattern_begin == std::string::npos) {
      Logger::Debug("[PortalDiscovery] No pattern in " + script_url);
      return std::nullopt;
    }
    std::string pattern = pattern_statement->substr(pattern_begin + 1);
    ReplaceAll(pattern, "\\/", "/");

    std::smatch url_match;
    if (!std::regex_search(script_url, url_match, std::regex(pattern))) {
      Logger::Debug("[PortalDiscovery] Pattern '" + pattern + "' does not match " +
                    script_url);
      return std::nullopt;
    }

    const auto protocol_index = FindGroupIndex(script, "portal_protocol");
    const auto ip_index = FindGroupIndex(script, "portal_ip");
    const auto path_index = FindGroupIndex(script, "portal_path");
    if (!protocol_index || !ip_index || !path_index) {
      Logger::Debug("[PortalDiscovery] Missing group indices in " + script_url);
      return std::nullopt;
    }
    for (int index : {*protocol_index, *ip_index, *path_index}) {
      if (static_cast<size_t>(index) >= url_match.size() || !url_match[index].matched) {
        Logger::Debug("[PortalDiscovery] Group " + std::to_string(index) +
                      " not captured from " + script_url);
        return std::nullopt;
      }
    }

    auto loader = StatementAfter(script, "this.ajax_loader=", ";");
    if (!loader || loader->size() < 4 || loader->compare(loader->size() - 4, 4, ".php") != 0) {
      Logger::Debug("[PortalDiscovery] No ajax_loader in " + script_url);
      return std::nullopt;
    }

    std::string portal_url = *loader;
    ReplaceAll(portal_url, "this.portal_protocol", url_match[*protocol_index].str());
    ReplaceAll(portal_url, "this.portal_ip", url_match[*ip_index].str());
    ReplaceAll(portal_url, "this.portal_path", url_match[*path_index].str());
    return portal_url;
  } catch (const std::regex_error& e) {
    Logger::Debug(std::string("[PortalDiscovery] Unusable pattern in ") + script_url + ": " +
                  e.what());
    return std::nullopt;
  }
}

std::optional<std::string> DiscoverPortalUrl(IHttpTransport& transport,
                                             const std::string& target_url,
                                             const std::string& proxy) {
  const std::string origin = UrlOrigin(target_url);
  if (origin.empty()) {
    Logger::Warn("[PortalDiscovery] Invalid URL: " + target_url);
    return std::nullopt;
  }

  std::vector<std::string> routes;
  if (!proxy.empty()) routes.push_back(proxy);
  routes.emplace_back();

  for (const auto& route : routes) {
    for (const auto& path : DiscoveryScriptPaths()) {
      HttpRequest request;
      request.url = origin + path;
      request.proxy = route;
      request.headers.emplace_back("User-Agent", kPortalUserAgent);
      auto response = transport.Get(request);
      if (!response) continue;
      auto portal_url = ExtractPortalUrl(request.url, response->body);
      if (portal_url) {
        Logger::Info("[PortalDiscovery] Portal found: " + *portal_url);
        return portal_url;
      }
    }
  }
  Logger::Warn("[PortalDiscovery] No usable xpcom.common.js under " + origin);
  return std::nullopt;
}

std::optional<std::string> ResolvePortalUrl(IHttpTransport& transport,
                                            const std::string& configured_url,
                                            const std::string& proxy) {
  if (EndsWith(configured_url, ".php")) return configured_url;
  return DiscoverPortalUrl(transport, configured_url, proxy);
}

}  // namespace macreplay::portal
