// Repository: MacReplay-gateway
// Component: Portal Protocol Client
// Purpose: Stateless client for the Stalker/Ministra handshake, listing, link and EPG calls.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_PORTAL_PORTAL_CLIENT_H_
#define MACREPLAY_PORTAL_PORTAL_CLIENT_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "macreplay/portal/HttpTransport.h"
#include "macreplay/portal/PortalTypes.h"

namespace macreplay::portal {

inline constexpr const char* kPortalUserAgent = "Mozilla/5.0 (QtEmbedded; U; Linux; C)";

// IPortalClient is the upstream protocol surface. Every operation returns
// nullopt on network failure, non-2xx status, malformed JSON or a missing
// field. Tokens are never cached here: callers pass the token they got from
// Handshake() for the same endpoint.
class IPortalClient {
 public:
  virtual ~IPortalClient() = default;

  virtual std::optional<std::string> Handshake(const PortalEndpoint& endpoint) = 0;

  virtual std::optional<Json::Value> GetProfile(const PortalEndpoint& endpoint,
                                                const std::string& token) = 0;

  // Account marker (the `phone` field of get_main_info). Empty strings are
  // reported as nullopt.
  virtual std::optional<std::string> GetExpiry(const PortalEndpoint& endpoint,
                                               const std::string& token) = 0;

  virtual std::optional<std::vector<Channel>> ListChannels(const PortalEndpoint& endpoint,
                                                           const std::string& token) = 0;

  // Empty genre tables are reported as nullopt.
  virtual std::optional<GenreMap> ListGenres(const PortalEndpoint& endpoint,
                                             const std::string& token) = 0;

  // Last whitespace-separated token of the returned js.cmd.
  virtual std::optional<std::string> CreateLink(const PortalEndpoint& endpoint,
                                                const std::string& token,
                                                const std::string& cmd) = 0;

  virtual std::optional<EpgData> GetEpg(const PortalEndpoint& endpoint,
                                        const std::string& token, int period_hours) = 0;
};

class StalkerPortalClient : public IPortalClient {
 public:
  explicit StalkerPortalClient(std::shared_ptr<IHttpTransport> transport);

  std::optional<std::string> Handshake(const PortalEndpoint& endpoint) override;
  std::optional<Json::Value> GetProfile(const PortalEndpoint& endpoint,
                                        const std::string& token) override;
  std::optional<std::string> GetExpiry(const PortalEndpoint& endpoint,
                                       const std::string& token) override;
  std::optional<std::vector<Channel>> ListChannels(const PortalEndpoint& endpoint,
                                                   const std::string& token) override;
  std::optional<GenreMap> ListGenres(const PortalEndpoint& endpoint,
                                     const std::string& token) override;
  std::optional<std::string> CreateLink(const PortalEndpoint& endpoint,
                                        const std::string& token,
                                        const std::string& cmd) override;
  std::optional<EpgData> GetEpg(const PortalEndpoint& endpoint, const std::string& token,
                                int period_hours) override;

 private:
  // GETs `endpoint.url?query` and returns the `js` member of the envelope.
  std::optional<Json::Value> CallJs(const PortalEndpoint& endpoint, const std::string& query,
                                    const std::string& token);

  std::shared_ptr<IHttpTransport> transport_;
};

// Builds the request every portal call shares: user agent, cookies, proxy and
// bearer token when one is given.
HttpRequest BuildPortalRequest(const PortalEndpoint& endpoint, const std::string& query,
                               const std::string& token);

// Converts a JSON scalar to text. Numbers keep their integral form; null and
// containers become empty.
std::string JsonScalarToString(const Json::Value& value);

// Percent-encodes the characters of a query value that would break the URL.
std::string EncodeQueryValue(const std::string& value);

}  // namespace macreplay::portal

#endif  // MACREPLAY_PORTAL_PORTAL_CLIENT_H_
