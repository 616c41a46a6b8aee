// Repository: MacReplay-gateway
// Component: Portal Catalog
// Purpose: Fetches one portal's channel list, genres and EPG using the first MAC that works.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_CACHE_PORTAL_CATALOG_H_
#define MACREPLAY_CACHE_PORTAL_CATALOG_H_

#include <optional>
#include <string>
#include <vector>

#include "macreplay/config/GatewayConfig.h"
#include "macreplay/portal/PortalClient.h"

namespace macreplay::cache {

struct CatalogRequest {
  bool genres = false;
  bool epg = false;
  int epg_period_hours = 24;
};

struct PortalCatalog {
  std::string mac;  // MAC that produced the data.
  std::vector<portal::Channel> channels;
  portal::GenreMap genres;
  portal::EpgData epg;
};

// Tries the portal's MACs in rotation order until one yields every part the
// request asks for. MACs are not rotated here; artifact builds only read.
std::optional<PortalCatalog> FetchPortalCatalog(portal::IPortalClient& client,
                                                const config::Portal& portal,
                                                const CatalogRequest& request);

}  // namespace macreplay::cache

#endif  // MACREPLAY_CACHE_PORTAL_CATALOG_H_
