// Repository: MacReplay-gateway
// Component: Portal Types
// Purpose: Values exchanged with Stalker/Ministra portals.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_PORTAL_PORTAL_TYPES_H_
#define MACREPLAY_PORTAL_PORTAL_TYPES_H_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace macreplay::portal {

// Where and as whom a portal call is made. One endpoint per (portal, MAC).
struct PortalEndpoint {
  std::string url;    // Resolved API URL (ends in .php).
  std::string mac;
  std::string proxy;  // Empty for direct connections.
};

// Channel as listed by the portal. Fields arrive as strings or numbers and
// are normalized to strings.
struct Channel {
  std::string id;
  std::string name;
  std::string number;
  std::string genre_id;
  std::string logo;
  std::string cmd;
};

struct Programme {
  int64_t start_timestamp = 0;  // Unix seconds, UTC.
  int64_t stop_timestamp = 0;
  std::string name;
  std::string description;
};

using GenreMap = std::map<std::string, std::string>;           // id -> title
using EpgData = std::map<std::string, std::vector<Programme>>;  // channel id -> programmes

}  // namespace macreplay::portal

#endif  // MACREPLAY_PORTAL_PORTAL_TYPES_H_
