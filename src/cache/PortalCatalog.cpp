// Repository: MacReplay-gateway
// Component: Portal Catalog
// Purpose: Fetches one portal's channel list, genres and EPG using the first MAC that works.
// Copyright (c) 2025 MacReplay

#include "macreplay/cache/PortalCatalog.h"

#include "macreplay/util/Logger.hpp"

namespace macreplay::cache {

using macreplay::util::Logger;

std::optional<PortalCatalog> FetchPortalCatalog(portal::IPortalClient& client,
                                                const config::Portal& portal,
                                                const CatalogRequest& request) {
  for (const auto& mac : portal.macs) {
    const portal::PortalEndpoint endpoint{portal.url, mac.mac, portal.proxy};
    const std::string context = "Portal(" + portal.id + "):MAC(" + mac.mac + ")";

    auto token = client.Handshake(endpoint);
    if (!token) {
      Logger::Debug("[PortalCatalog] " + context + ": handshake failed");
      continue;
    }
    if (!client.GetProfile(endpoint, *token)) {
      Logger::Debug("[PortalCatalog] " + context + ": profile failed");
      continue;
    }
    auto channels = client.ListChannels(endpoint, *token);
    if (!channels) {
      Logger::Debug("[PortalCatalog] " + context + ": channel list failed");
      continue;
    }

    PortalCatalog catalog;
    catalog.mac = mac.mac;
    catalog.channels = std::move(*channels);

    if (request.genres) {
      auto genres = client.ListGenres(endpoint, *token);
      if (!genres) {
        Logger::Debug("[PortalCatalog] " + context + ": genres failed");
        continue;
      }
      catalog.genres = std::move(*genres);
    }
    if (request.epg) {
      auto epg = client.GetEpg(endpoint, *token, request.epg_period_hours);
      if (!epg) {
        Logger::Debug("[PortalCatalog] " + context + ": EPG failed");
        continue;
      }
      catalog.epg = std::move(*epg);
    }
    return catalog;
  }
  return std::nullopt;
}

}  // namespace macreplay::cache
