// Repository: MacReplay-gateway
// Component: Playlist Builder
// Purpose: Renders enabled channels of all portals as an M3U playlist.
// Copyright (c) 2025 MacReplay

#include "macreplay/cache/PlaylistBuilder.h"

#include <algorithm>
#include <optional>

namespace macreplay::cache {

namespace {

std::optional<long long> ParseChannelNumber(const std::string& text) {
  if (text.empty()) return std::nullopt;
  try {
    size_t consumed = 0;
    const long long value = std::stoll(text, &consumed);
    if (consumed != text.size()) return std::nullopt;
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

template <typename Map>
const std::string* Lookup(const Map& map, const std::string& key) {
  auto it = map.find(key);
  return it == map.end() ? nullptr : &it->second;
}

}  // namespace

bool ChannelNumberLess(const std::string& a, const std::string& b) {
  const auto na = ParseChannelNumber(a);
  const auto nb = ParseChannelNumber(b);
  if (na && nb) return *na < *nb;
  if (na != nb) return na.has_value();
  return a < b;
}

std::string PlayUrl(const std::string& host, const std::string& portal_id,
                    const std::string& channel_id) {
  return "http://" + host + "/play/" + portal_id + "/" + channel_id;
}

std::vector<PlaylistEntry> CollectPlaylistEntries(const config::Portal& portal,
                                                  const std::vector<portal::Channel>& channels,
                                                  const portal::GenreMap& genres) {
  std::vector<PlaylistEntry> entries;
  for (const auto& channel : channels) {
    if (!portal.IsChannelEnabled(channel.id)) continue;

    PlaylistEntry entry;
    entry.portal_id = portal.id;
    entry.channel_id = channel.id;

    const std::string* name = Lookup(portal.custom_names, channel.id);
    entry.name = name ? *name : channel.name;

    const std::string* genre = Lookup(portal.custom_genres, channel.id);
    if (genre) {
      entry.genre = *genre;
    } else if (const std::string* title = Lookup(genres, channel.genre_id)) {
      entry.genre = *title;
    }

    const std::string* number = Lookup(portal.custom_numbers, channel.id);
    entry.number = number ? *number : channel.number;

    const std::string* epg_id = Lookup(portal.custom_epg_ids, channel.id);
    entry.epg_id = epg_id ? *epg_id : entry.name;

    entries.push_back(std::move(entry));
  }
  return entries;
}

std::string FormatPlaylistEntry(const PlaylistEntry& entry, const std::string& host,
                                const config::Settings& settings) {
  std::string line = "#EXTINF:-1 tvg-id=\"" + entry.epg_id;
  if (settings.use_channel_numbers) {
    line += "\" tvg-chno=\"" + entry.number;
  }
  if (settings.use_channel_genres) {
    line += "\" group-title=\"" + entry.genre;
  }
  line += "\"," + entry.name + "\n" + PlayUrl(host, entry.portal_id, entry.channel_id);
  return line;
}

std::string RenderPlaylist(std::vector<PlaylistEntry> entries, const std::string& host,
                           const config::Settings& settings) {
  if (settings.sort_by_name) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const PlaylistEntry& a, const PlaylistEntry& b) { return a.name < b.name; });
  }
  if (settings.use_channel_numbers && settings.sort_by_number) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const PlaylistEntry& a, const PlaylistEntry& b) {
                       return ChannelNumberLess(a.number, b.number);
                     });
  }
  if (settings.use_channel_genres && settings.sort_by_genre) {
    std::stable_sort(
        entries.begin(), entries.end(),
        [](const PlaylistEntry& a, const PlaylistEntry& b) { return a.genre < b.genre; });
  }

  std::string playlist = kPlaylistHeader;
  for (size_t i = 0; i < entries.size(); ++i) {
    if (i > 0) playlist += "\n";
    playlist += FormatPlaylistEntry(entries[i], host, settings);
  }
  return playlist;
}

}  // namespace macreplay::cache
