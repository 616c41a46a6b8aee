// Repository: MacReplay-gateway
// Component: Configuration Store
// Purpose: Thread-safe owner of the JSON configuration document and its typed view.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_CONFIG_CONFIG_STORE_H_
#define MACREPLAY_CONFIG_CONFIG_STORE_H_

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "macreplay/config/GatewayConfig.h"

namespace macreplay::config {

// ConfigStore owns settings and portal records. Readers receive copies;
// every mutation happens under the store mutex and is written to disk
// before the call returns. An empty path keeps the store in memory.
class ConfigStore {
 public:
  explicit ConfigStore(std::string path);

  ConfigStore(const ConfigStore&) = delete;
  ConfigStore& operator=(const ConfigStore&) = delete;

  // Reads the file, normalizes missing or mistyped values to defaults and
  // writes the normalized document back. A missing or unparsable file is
  // not fatal: the store starts from defaults. Returns false only when the
  // normalized document could not be written.
  bool Load();

  // Replaces the in-memory state from a parsed document without touching disk.
  void LoadFromJson(const Json::Value& root);

  bool Save();

  Settings GetSettings() const;
  bool UpdateSettings(const Settings& settings);

  // Raw settings value, including keys the gateway only carries through.
  std::string GetRawSetting(const std::string& key) const;

  std::vector<Portal> GetPortals() const;
  std::vector<Portal> GetEnabledPortals() const;
  std::optional<Portal> GetPortal(const std::string& portal_id) const;

  bool UpsertPortal(const Portal& portal);
  bool RemovePortal(const std::string& portal_id);

  // Applies `mutation` to the stored portal under the store mutex and saves.
  // Returns false if the portal does not exist or the save failed.
  bool MutatePortal(const std::string& portal_id,
                    const std::function<void(Portal&)>& mutation);

  Json::Value ToJson() const;

  const std::string& path() const { return path_; }

 private:
  Json::Value ToJsonLocked() const;
  bool SaveLocked();

  const std::string path_;
  mutable std::mutex mutex_;
  Json::Value raw_settings_;
  Settings settings_;
  std::map<std::string, Portal> portals_;
};

// Parses one portal record, falling back to defaults for missing values.
Portal PortalFromJson(const std::string& portal_id, const Json::Value& value);
Json::Value PortalToJson(const Portal& portal);

// 32 lowercase hex digits, used for portal ids.
std::string GenerateHexId();

}  // namespace macreplay::config

#endif  // MACREPLAY_CONFIG_CONFIG_STORE_H_
