// Repository: MacReplay-gateway
// Component: Playlist Builder
// Purpose: Renders enabled channels of all portals as an M3U playlist.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_CACHE_PLAYLIST_BUILDER_H_
#define MACREPLAY_CACHE_PLAYLIST_BUILDER_H_

#include <string>
#include <vector>

#include "macreplay/config/GatewayConfig.h"
#include "macreplay/portal/PortalTypes.h"

namespace macreplay::cache {

inline constexpr const char* kPlaylistHeader = "#EXTM3U \n";

struct PlaylistEntry {
  std::string portal_id;
  std::string channel_id;
  std::string name;
  std::string number;
  std::string genre;
  std::string epg_id;
};

// Enabled channels of `portal` with its customizations applied, in upstream
// order. The EPG id defaults to the channel name.
std::vector<PlaylistEntry> CollectPlaylistEntries(const config::Portal& portal,
                                                  const std::vector<portal::Channel>& channels,
                                                  const portal::GenreMap& genres);

std::string FormatPlaylistEntry(const PlaylistEntry& entry, const std::string& host,
                                const config::Settings& settings);

// Sorts by name, then number, then genre (each a stable sort, each only when
// enabled) and renders the playlist text.
std::string RenderPlaylist(std::vector<PlaylistEntry> entries, const std::string& host,
                           const config::Settings& settings);

// Orders channel numbers numerically when both parse as integers; numeric
// values sort before anything else, the rest compare as text.
bool ChannelNumberLess(const std::string& a, const std::string& b);

std::string PlayUrl(const std::string& host, const std::string& portal_id,
                    const std::string& channel_id);

}  // namespace macreplay::cache

#endif  // MACREPLAY_CACHE_PLAYLIST_BUILDER_H_
