// Repository: MacReplay-gateway
// Component: Portal Discovery
// Purpose: Derive a portal's API URL from its published xpcom.common.js.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_PORTAL_PORTAL_DISCOVERY_H_
#define MACREPLAY_PORTAL_PORTAL_DISCOVERY_H_

#include <optional>
#include <string>
#include <vector>

#include "macreplay/portal/HttpTransport.h"

namespace macreplay::portal {

// Script locations probed under the configured URL's origin, in order.
const std::vector<std::string>& DiscoveryScriptPaths();

// Applies the loader template found in `script_text` to `script_url`.
// Returns nullopt when the script does not carry a usable pattern.
std::optional<std::string> ExtractPortalUrl(const std::string& script_url,
                                            const std::string& script_text);

// Probes every script path, first through `proxy` (when set) then directly.
// The first script that yields a URL wins.
std::optional<std::string> DiscoverPortalUrl(IHttpTransport& transport,
                                             const std::string& target_url,
                                             const std::string& proxy);

// URL used for API calls: unchanged when it already ends in ".php",
// discovered otherwise.
std::optional<std::string> ResolvePortalUrl(IHttpTransport& transport,
                                            const std::string& configured_url,
                                            const std::string& proxy);

}  // namespace macreplay::portal

#endif  // MACREPLAY_PORTAL_PORTAL_DISCOVERY_H_
