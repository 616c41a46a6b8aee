// Repository: MacReplay-gateway
// Component: Lineup Builder
// Purpose: HDHomeRun-style channel lineup of all enabled channels.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_CACHE_LINEUP_BUILDER_H_
#define MACREPLAY_CACHE_LINEUP_BUILDER_H_

#include <string>
#include <vector>

#include "macreplay/config/GatewayConfig.h"
#include "macreplay/portal/PortalTypes.h"

namespace macreplay::cache {

struct LineupEntry {
  std::string guide_number;
  std::string guide_name;
  std::string url;

  bool operator==(const LineupEntry& other) const {
    return guide_number == other.guide_number && guide_name == other.guide_name &&
           url == other.url;
  }
};

std::vector<LineupEntry> CollectLineupEntries(const config::Portal& portal,
                                              const std::vector<portal::Channel>& channels,
                                              const std::string& host);

// Stable numeric sort by GuideNumber.
void SortLineup(std::vector<LineupEntry>& lineup);

// JSON array of {"GuideNumber", "GuideName", "URL"} objects.
std::string LineupToJson(const std::vector<LineupEntry>& lineup);

}  // namespace macreplay::cache

#endif  // MACREPLAY_CACHE_LINEUP_BUILDER_H_
