// Repository: MacReplay-gateway
// Component: Lineup Builder
// Purpose: HDHomeRun-style channel lineup of all enabled channels.
// Copyright (c) 2025 MacReplay

#include "macreplay/cache/LineupBuilder.h"

#include <algorithm>

#include <json/json.h>

#include "macreplay/cache/PlaylistBuilder.h"

namespace macreplay::cache {

std::vector<LineupEntry> CollectLineupEntries(const config::Portal& portal,
                                              const std::vector<portal::Channel>& channels,
                                              const std::string& host) {
  std::vector<LineupEntry> lineup;
  for (const auto& channel : channels) {
    if (!portal.IsChannelEnabled(channel.id)) continue;

    LineupEntry entry;
    auto name = portal.custom_names.find(channel.id);
    entry.guide_name = name != portal.custom_names.end() ? name->second : channel.name;
    auto number = portal.custom_numbers.find(channel.id);
    entry.guide_number = number != portal.custom_numbers.end() ? number->second : channel.number;
    entry.url = PlayUrl(host, portal.id, channel.id);
    lineup.push_back(std::move(entry));
  }
  return lineup;
}

void SortLineup(std::vector<LineupEntry>& lineup) {
  std::stable_sort(lineup.begin(), lineup.end(),
                   [](const LineupEntry& a, const LineupEntry& b) {
                     return ChannelNumberLess(a.guide_number, b.guide_number);
                   });
}

std::string LineupToJson(const std::vector<LineupEntry>& lineup) {
  Json::Value array(Json::arrayValue);
  for (const auto& entry : lineup) {
    Json::Value item(Json::objectValue);
    item["GuideNumber"] = entry.guide_number;
    item["GuideName"] = entry.guide_name;
    item["URL"] = entry.url;
    array.append(item);
  }
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, array);
}

}  // namespace macreplay::cache
