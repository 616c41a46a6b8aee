// Repository: MacReplay-gateway
// Component: Portal Registry
// Purpose: Adds, updates and removes portals, testing their MACs before they are stored.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_RUNTIME_PORTAL_REGISTRY_H_
#define MACREPLAY_RUNTIME_PORTAL_REGISTRY_H_

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "macreplay/config/ConfigStore.h"
#include "macreplay/portal/HttpTransport.h"
#include "macreplay/portal/PortalClient.h"

namespace macreplay::runtime {

struct PortalSpec {
  std::string name;
  std::string url;  // API URL, or any URL under the portal's origin.
  std::string proxy;
  std::vector<std::string> macs;
  int streams_per_mac = 1;
  int epg_offset_hours = 0;
  bool enabled = true;
};

struct PortalChangeResult {
  bool success = false;
  std::string message;
  std::string portal_id;
  std::vector<std::string> working_macs;
  std::vector<std::string> dead_macs;
};

// PortalRegistry keeps only MACs that pass handshake, profile and account
// info. A portal with no working MAC is rejected. Every accepted change runs
// the on-change hook (the gateway uses it to drop the cached guide).
class PortalRegistry {
 public:
  PortalRegistry(config::ConfigStore& store, std::shared_ptr<portal::IHttpTransport> transport,
                 std::shared_ptr<portal::IPortalClient> client,
                 std::function<void()> on_change = nullptr);

  PortalChangeResult AddPortal(const PortalSpec& spec);

  // Known MACs keep their stored marker unless `retest` is set; new MACs are
  // always tested. Channel customizations are preserved.
  PortalChangeResult UpdatePortal(const std::string& portal_id, const PortalSpec& spec,
                                  bool retest);

  bool RemovePortal(const std::string& portal_id);

  // Handshake, profile and account info; returns the account marker.
  std::optional<std::string> TestMac(const std::string& url, const std::string& mac,
                                     const std::string& proxy);

 private:
  void NotifyChange();

  config::ConfigStore& store_;
  std::shared_ptr<portal::IHttpTransport> transport_;
  std::shared_ptr<portal::IPortalClient> client_;
  std::function<void()> on_change_;
};

// Trims entries, drops empty ones and duplicates, keeping first-seen order.
std::vector<std::string> NormalizeMacList(const std::vector<std::string>& macs);

}  // namespace macreplay::runtime

#endif  // MACREPLAY_RUNTIME_PORTAL_REGISTRY_H_
