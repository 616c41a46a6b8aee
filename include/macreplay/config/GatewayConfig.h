// Repository: MacReplay-gateway
// Component: Gateway Configuration Model
// Purpose: Typed view of settings and portal records held by the ConfigStore.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_CONFIG_GATEWAY_CONFIG_H_
#define MACREPLAY_CONFIG_GATEWAY_CONFIG_H_

#include <map>
#include <set>
#include <string>
#include <vector>

namespace macreplay::config {

// Default relay argument template. Placeholders are substituted per stream.
inline constexpr const char* kDefaultFfmpegCommand =
    "-re -http_proxy <proxy> -timeout <timeout> -i <url> -map 0 -codec copy "
    "-f mpegts -flush_packets 0 -fflags +nobuffer -flags low_delay "
    "-strict experimental -analyzeduration 0 -probesize 32 -copyts "
    "-threads 12 pipe:";

// One credential of a portal. Position in Portal::macs is rotation priority.
struct MacEntry {
  std::string mac;
  std::string expiry;  // Last-known marker returned by the account info call.

  bool operator==(const MacEntry& other) const {
    return mac == other.mac && expiry == other.expiry;
  }
};

struct Portal {
  std::string id;
  std::string name;
  std::string url;
  std::string proxy;  // Empty when the portal is reached directly.
  bool enabled = true;
  std::vector<MacEntry> macs;
  int streams_per_mac = 1;  // 0 = unlimited.
  int epg_offset_hours = 0;

  std::set<std::string> enabled_channels;
  std::map<std::string, std::string> custom_names;
  std::map<std::string, std::string> custom_numbers;
  std::map<std::string, std::string> custom_genres;
  std::map<std::string, std::string> custom_epg_ids;
  // Channel id on this portal -> channel name it can stand in for.
  std::map<std::string, std::string> fallback_channels;

  bool IsChannelEnabled(const std::string& channel_id) const {
    return enabled_channels.count(channel_id) > 0;
  }
};

enum class StreamMethod {
  kFfmpeg,    // Relay through the external remux process.
  kRedirect,  // Answer with a 302 to the upstream link.
};

struct Settings {
  StreamMethod stream_method = StreamMethod::kFfmpeg;
  std::string ffmpeg_command = kDefaultFfmpegCommand;
  int ffmpeg_timeout_s = 5;
  bool test_streams = true;
  bool try_all_macs = true;
  bool use_channel_genres = true;
  bool use_channel_numbers = true;
  bool sort_by_genre = false;
  bool sort_by_number = true;
  bool sort_by_name = false;
};

const char* StreamMethodName(StreamMethod method);

}  // namespace macreplay::config

#endif  // MACREPLAY_CONFIG_GATEWAY_CONFIG_H_
