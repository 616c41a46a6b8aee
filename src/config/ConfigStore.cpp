// Repository: MacReplay-gateway
// Component: Configuration Store
// Purpose: Thread-safe owner of the JSON configuration document and its typed view.
// Copyright (c) 2025 MacReplay

#include "macreplay/config/ConfigStore.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <set>
#include <sstream>

#include "macreplay/util/Logger.hpp"

namespace macreplay::config {

namespace {

using macreplay::util::Logger;

constexpr const char* kStreamMethod = "stream method";
constexpr const char* kFfmpegCommand = "ffmpeg command";
constexpr const char* kFfmpegTimeout = "ffmpeg timeout";
constexpr const char* kTestStreams = "test streams";
constexpr const char* kTryAllMacs = "try all macs";
constexpr const char* kUseGenres = "use channel genres";
constexpr const char* kUseNumbers = "use channel numbers";
constexpr const char* kSortGenre = "sort playlist by channel genre";
constexpr const char* kSortNumber = "sort playlist by channel number";
constexpr const char* kSortName = "sort playlist by channel name";

std::string GenerateHex(size_t length) {
  static const char kDigits[] = "0123456789abcdef";
  std::random_device device;
  std::mt19937_64 engine(device());
  std::uniform_int_distribution<int> digit(0, 15);
  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    out.push_back(kDigits[digit(engine)]);
  }
  return out;
}

// Non-empty string member or the default. Other JSON types fall back too.
std::string StringOr(const Json::Value& object, const char* key,
                     const std::string& fallback) {
  if (!object.isObject() || !object.isMember(key)) return fallback;
  const Json::Value& value = object[key];
  if (!value.isString() || value.asString().empty()) return fallback;
  return value.asString();
}

int ParseInt(const std::string& text, int fallback) {
  try {
    size_t consumed = 0;
    const int parsed = std::stoi(text, &consumed);
    if (consumed != text.size()) return fallback;
    return parsed;
  } catch (const std::exception&) {
    return fallback;
  }
}

bool ParseBool(const std::string& text) { return text == "true"; }

const char* BoolText(bool value) { return value ? "true" : "false"; }

std::map<std::string, std::string> StringMapOr(const Json::Value& object,
                                               const char* key) {
  std::map<std::string, std::string> out;
  if (!object.isMember(key) || !object[key].isObject()) return out;
  const Json::Value& map = object[key];
  for (const auto& name : map.getMemberNames()) {
    if (map[name].isString()) {
      out[name] = map[name].asString();
    }
  }
  return out;
}

Json::Value StringMapToJson(const std::map<std::string, std::string>& map) {
  Json::Value out(Json::objectValue);
  for (const auto& [key, value] : map) {
    out[key] = value;
  }
  return out;
}

std::vector<MacEntry> MacsFromJson(const Json::Value& object) {
  std::vector<MacEntry> macs;
  if (!object.isMember("macs") || !object["macs"].isObject()) return macs;
  const Json::Value& table = object["macs"];

  std::set<std::string> seen;
  auto append = [&](const std::string& mac) {
    if (seen.count(mac) > 0 || !table.isMember(mac)) return;
    seen.insert(mac);
    const Json::Value& expiry = table[mac];
    macs.push_back(MacEntry{mac, expiry.isString() ? expiry.asString() : ""});
  };

  if (object.isMember("mac order") && object["mac order"].isArray()) {
    for (const auto& mac : object["mac order"]) {
      if (mac.isString()) append(mac.asString());
    }
  }
  for (const auto& mac : table.getMemberNames()) {
    append(mac);
  }
  return macs;
}

Settings SettingsFromJson(const Json::Value& raw) {
  Settings defaults;
  Settings settings;
  settings.stream_method =
      StringOr(raw, kStreamMethod, "ffmpeg") == "ffmpeg" ? StreamMethod::kFfmpeg
                                                         : StreamMethod::kRedirect;
  settings.ffmpeg_command = StringOr(raw, kFfmpegCommand, defaults.ffmpeg_command);
  settings.ffmpeg_timeout_s =
      ParseInt(StringOr(raw, kFfmpegTimeout, "5"), defaults.ffmpeg_timeout_s);
  settings.test_streams = ParseBool(StringOr(raw, kTestStreams, "true"));
  settings.try_all_macs = ParseBool(StringOr(raw, kTryAllMacs, "true"));
  settings.use_channel_genres = ParseBool(StringOr(raw, kUseGenres, "true"));
  settings.use_channel_numbers = ParseBool(StringOr(raw, kUseNumbers, "true"));
  settings.sort_by_genre = ParseBool(StringOr(raw, kSortGenre, "false"));
  settings.sort_by_number = ParseBool(StringOr(raw, kSortNumber, "true"));
  settings.sort_by_name = ParseBool(StringOr(raw, kSortName, "false"));
  return settings;
}

void WriteSettings(const Settings& settings, Json::Value& raw) {
  if (settings.stream_method == StreamMethod::kFfmpeg) {
    raw[kStreamMethod] = StreamMethodName(settings.stream_method);
  } else if (StringOr(raw, kStreamMethod, "ffmpeg") == "ffmpeg") {
    raw[kStreamMethod] = StreamMethodName(settings.stream_method);
  }
  raw[kFfmpegCommand] = settings.ffmpeg_command;
  raw[kFfmpegTimeout] = std::to_string(settings.ffmpeg_timeout_s);
  raw[kTestStreams] = BoolText(settings.test_streams);
  raw[kTryAllMacs] = BoolText(settings.try_all_macs);
  raw[kUseGenres] = BoolText(settings.use_channel_genres);
  raw[kUseNumbers] = BoolText(settings.use_channel_numbers);
  raw[kSortGenre] = BoolText(settings.sort_by_genre);
  raw[kSortNumber] = BoolText(settings.sort_by_number);
  raw[kSortName] = BoolText(settings.sort_by_name);
}

// HDHomeRun descriptor keys are carried through; only fill them when absent.
void FillCarriedSettings(Json::Value& raw) {
  raw["enable hdhr"] = StringOr(raw, "enable hdhr", "true");
  raw["hdhr name"] = StringOr(raw, "hdhr name", "MacReplay");
  raw["hdhr id"] = StringOr(raw, "hdhr id", GenerateHex(32));
  raw["hdhr tuners"] = StringOr(raw, "hdhr tuners", "10");
}

}  // namespace

const char* StreamMethodName(StreamMethod method) {
  switch (method) {
    case StreamMethod::kFfmpeg:
      return "ffmpeg";
    case StreamMethod::kRedirect:
      return "redirect";
  }
  return "ffmpeg";
}

Portal PortalFromJson(const std::string& portal_id, const Json::Value& value) {
  Portal portal;
  portal.id = portal_id;
  if (!value.isObject()) return portal;

  portal.name = StringOr(value, "name", "");
  portal.url = StringOr(value, "url", "");
  portal.proxy = StringOr(value, "proxy", "");
  portal.enabled = ParseBool(StringOr(value, "enabled", "true"));
  portal.macs = MacsFromJson(value);
  portal.streams_per_mac = ParseInt(StringOr(value, "streams per mac", "1"), 1);
  if (portal.streams_per_mac < 0) portal.streams_per_mac = 1;
  portal.epg_offset_hours = ParseInt(StringOr(value, "epg offset", "0"), 0);

  if (value.isMember("enabled channels") && value["enabled channels"].isArray()) {
    for (const auto& id : value["enabled channels"]) {
      if (id.isString()) portal.enabled_channels.insert(id.asString());
    }
  }
  portal.custom_names = StringMapOr(value, "custom channel names");
  portal.custom_numbers = StringMapOr(value, "custom channel numbers");
  portal.custom_genres = StringMapOr(value, "custom genres");
  portal.custom_epg_ids = StringMapOr(value, "custom epg ids");
  portal.fallback_channels = StringMapOr(value, "fallback channels");
  return portal;
}

Json::Value PortalToJson(const Portal& portal) {
  Json::Value out(Json::objectValue);
  out["enabled"] = BoolText(portal.enabled);
  out["name"] = portal.name;
  out["url"] = portal.url;

  Json::Value macs(Json::objectValue);
  Json::Value order(Json::arrayValue);
  for (const auto& entry : portal.macs) {
    macs[entry.mac] = entry.expiry;
    order.append(entry.mac);
  }
  out["macs"] = macs;
  out["mac order"] = order;

  out["streams per mac"] = std::to_string(portal.streams_per_mac);
  out["epg offset"] = std::to_string(portal.epg_offset_hours);
  out["proxy"] = portal.proxy;

  Json::Value enabled(Json::arrayValue);
  for (const auto& id : portal.enabled_channels) {
    enabled.append(id);
  }
  out["enabled channels"] = enabled;
  out["custom channel names"] = StringMapToJson(portal.custom_names);
  out["custom channel numbers"] = StringMapToJson(portal.custom_numbers);
  out["custom genres"] = StringMapToJson(portal.custom_genres);
  out["custom epg ids"] = StringMapToJson(portal.custom_epg_ids);
  out["fallback channels"] = StringMapToJson(portal.fallback_channels);
  return out;
}

ConfigStore::ConfigStore(std::string path) : path_(std::move(path)) {
  LoadFromJson(Json::Value(Json::objectValue));
}

bool ConfigStore::Load() {
  Json::Value root(Json::objectValue);
  if (!path_.empty()) {
    std::ifstream in(path_);
    if (!in) {
      Logger::Warn("[ConfigStore] No existing config found at " + path_ +
                   ". Creating a new one");
    } else {
      Json::CharReaderBuilder builder;
      std::string errors;
      if (!Json::parseFromStream(builder, in, &root, &errors) || !root.isObject()) {
        Logger::Warn("[ConfigStore] Unreadable config " + path_ + ": " + errors +
                     ". Starting from defaults");
        root = Json::Value(Json::objectValue);
      }
    }
  }

  LoadFromJson(root);

  std::lock_guard<std::mutex> lock(mutex_);
  return SaveLocked();
}

void ConfigStore::LoadFromJson(const Json::Value& root) {
  Json::Value raw_settings(Json::objectValue);
  if (root.isObject() && root.isMember("settings") && root["settings"].isObject()) {
    raw_settings = root["settings"];
  }
  const Settings settings = SettingsFromJson(raw_settings);
  WriteSettings(settings, raw_settings);
  FillCarriedSettings(raw_settings);

  std::map<std::string, Portal> portals;
  if (root.isObject() && root.isMember("portals") && root["portals"].isObject()) {
    const Json::Value& table = root["portals"];
    for (const auto& id : table.getMemberNames()) {
      portals[id] = PortalFromJson(id, table[id]);
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  raw_settings_ = std::move(raw_settings);
  settings_ = settings;
  portals_ = std::move(portals);
}

bool ConfigStore::Save() {
  std::lock_guard<std::mutex> lock(mutex_);
  return SaveLocked();
}

bool ConfigStore::SaveLocked() {
  if (path_.empty()) return true;

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "    ";
  const std::string text = Json::writeString(builder, ToJsonLocked());

  std::error_code ec;
  const auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      Logger::Error("[ConfigStore] Cannot create " + parent.string() + ": " + ec.message());
      return false;
    }
  }

  const std::string temp_path = path_ + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::out | std::ios::trunc);
    if (!out) {
      Logger::Error("[ConfigStore] Cannot open " + temp_path + " for writing");
      return false;
    }
    out << text << '\n';
    if (!out.good()) {
      Logger::Error("[ConfigStore] Failed writing " + temp_path);
      return false;
    }
  }
  if (std::rename(temp_path.c_str(), path_.c_str()) != 0) {
    Logger::Error("[ConfigStore] Failed to replace " + path_);
    return false;
  }
  return true;
}

Json::Value ConfigStore::ToJson() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ToJsonLocked();
}

Json::Value ConfigStore::ToJsonLocked() const {
  Json::Value root(Json::objectValue);
  root["settings"] = raw_settings_;
  Json::Value portals(Json::objectValue);
  for (const auto& [id, portal] : portals_) {
    portals[id] = PortalToJson(portal);
  }
  root["portals"] = portals;
  return root;
}

Settings ConfigStore::GetSettings() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return settings_;
}

bool ConfigStore::UpdateSettings(const Settings& settings) {
  std::lock_guard<std::mutex> lock(mutex_);
  settings_ = settings;
  WriteSettings(settings_, raw_settings_);
  return SaveLocked();
}

std::string ConfigStore::GetRawSetting(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!raw_settings_.isMember(key) || !raw_settings_[key].isString()) return "";
  return raw_settings_[key].asString();
}

std::vector<Portal> ConfigStore::GetPortals() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Portal> out;
  out.reserve(portals_.size());
  for (const auto& [id, portal] : portals_) {
    out.push_back(portal);
  }
  return out;
}

std::vector<Portal> ConfigStore::GetEnabledPortals() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Portal> out;
  for (const auto& [id, portal] : portals_) {
    if (portal.enabled) out.push_back(portal);
  }
  return out;
}

std::optional<Portal> ConfigStore::GetPortal(const std::string& portal_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = portals_.find(portal_id);
  if (it == portals_.end()) return std::nullopt;
  return it->second;
}

bool ConfigStore::UpsertPortal(const Portal& portal) {
  std::lock_guard<std::mutex> lock(mutex_);
  portals_[portal.id] = portal;
  return SaveLocked();
}

bool ConfigStore::RemovePortal(const std::string& portal_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (portals_.erase(portal_id) == 0) return false;
  return SaveLocked();
}

bool ConfigStore::MutatePortal(const std::string& portal_id,
                               const std::function<void(Portal&)>& mutation) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = portals_.find(portal_id);
  if (it == portals_.end()) return false;
  mutation(it->second);
  return SaveLocked();
}

std::string GenerateHexId() { return GenerateHex(32); }

}  // namespace macreplay::config
