// Repository: MacReplay-gateway
// Component: Portal Registry
// Purpose: Adds, updates and removes portals, testing their MACs before they are stored.
// Copyright (c) 2025 MacReplay

#include "macreplay/runtime/PortalRegistry.h"

#include <algorithm>
#include <set>

#include "macreplay/portal/PortalDiscovery.h"
#include "macreplay/util/Logger.hpp"

namespace macreplay::runtime {

using macreplay::util::Logger;

namespace {

std::string Trim(const std::string& text) {
  const size_t begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  const size_t end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

}  // namespace

std::vector<std::string> NormalizeMacList(const std::vector<std::string>& macs) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (const auto& raw : macs) {
    const std::string mac = Trim(raw);
    if (mac.empty() || !seen.insert(mac).second) continue;
    out.push_back(mac);
  }
  return out;
}

PortalRegistry::PortalRegistry(config::ConfigStore& store,
                               std::shared_ptr<portal::IHttpTransport> transport,
                               std::shared_ptr<portal::IPortalClient> client,
                               std::function<void()> on_change)
    : store_(store),
      transport_(std::move(transport)),
      client_(std::move(client)),
      on_change_(std::move(on_change)) {}

void PortalRegistry::NotifyChange() {
  if (on_change_) on_change_();
}

std::optional<std::string> PortalRegistry::TestMac(const std::string& url,
                                                   const std::string& mac,
                                                   const std::string& proxy) {
  const portal::PortalEndpoint endpoint{url, mac, proxy};
  auto token = client_->Handshake(endpoint);
  if (!token) return std::nullopt;
  if (!client_->GetProfile(endpoint, *token)) return std::nullopt;
  return client_->GetExpiry(endpoint, *token);
}

PortalChangeResult PortalRegistry::AddPortal(const PortalSpec& spec) {
  PortalChangeResult result;
  auto url = portal::ResolvePortalUrl(*transport_, spec.url, spec.proxy);
  if (!url) {
    result.message = "Error getting URL for Portal(" + spec.name + ")";
    Logger::Error("[PortalRegistry] " + result.message);
    return result;
  }

  config::Portal portal;
  portal.id = config::GenerateHexId();
  portal.name = spec.name;
  portal.url = *url;
  portal.proxy = spec.proxy;
  portal.enabled = spec.enabled;
  portal.streams_per_mac = spec.streams_per_mac;
  portal.epg_offset_hours = spec.epg_offset_hours;

  for (const auto& mac : NormalizeMacList(spec.macs)) {
    auto expiry = TestMac(portal.url, mac, portal.proxy);
    if (expiry) {
      Logger::Info("[PortalRegistry] Successfully tested MAC(" + mac + ") for Portal(" +
                   spec.name + ")");
      portal.macs.push_back(config::MacEntry{mac, *expiry});
      result.working_macs.push_back(mac);
    } else {
      Logger::Error("[PortalRegistry] Error testing MAC(" + mac + ") for Portal(" + spec.name +
                    ")");
      result.dead_macs.push_back(mac);
    }
  }

  if (portal.macs.empty()) {
    result.message = "None of the MACs tested OK for Portal(" + spec.name + ")";
    Logger::Error("[PortalRegistry] " + result.message);
    return result;
  }

  if (!store_.UpsertPortal(portal)) {
    result.message = "Portal(" + spec.name + ") could not be saved";
    Logger::Error("[PortalRegistry] " + result.message);
    return result;
  }
  result.success = true;
  result.portal_id = portal.id;
  result.message = "Portal(" + spec.name + ") added";
  Logger::Info("[PortalRegistry] " + result.message + " as " + portal.id);
  NotifyChange();
  return result;
}

PortalChangeResult PortalRegistry::UpdatePortal(const std::string& portal_id,
                                                const PortalSpec& spec, bool retest) {
  PortalChangeResult result;
  result.portal_id = portal_id;

  auto existing = store_.GetPortal(portal_id);
  if (!existing) {
    result.message = "Unknown Portal(" + portal_id + ")";
    Logger::Error("[PortalRegistry] " + result.message);
    return result;
  }

  auto url = portal::ResolvePortalUrl(*transport_, spec.url, spec.proxy);
  if (!url) {
    result.message = "Error getting URL for Portal(" + spec.name + ")";
    Logger::Error("[PortalRegistry] " + result.message);
    return result;
  }

  std::vector<config::MacEntry> macs;
  for (const auto& mac : NormalizeMacList(spec.macs)) {
    auto known = std::find_if(existing->macs.begin(), existing->macs.end(),
                              [&](const config::MacEntry& entry) { return entry.mac == mac; });
    if (!retest && known != existing->macs.end()) {
      macs.push_back(*known);
      result.working_macs.push_back(mac);
      continue;
    }
    auto expiry = TestMac(*url, mac, spec.proxy);
    if (expiry) {
      Logger::Info("[PortalRegistry] Successfully tested MAC(" + mac + ") for Portal(" +
                   spec.name + ")");
      macs.push_back(config::MacEntry{mac, *expiry});
      result.working_macs.push_back(mac);
    } else {
      Logger::Error("[PortalRegistry] Error testing MAC(" + mac + ") for Portal(" + spec.name +
                    ")");
      result.dead_macs.push_back(mac);
    }
  }

  if (macs.empty()) {
    result.message = "None of the MACs tested OK for Portal(" + spec.name + ")";
    Logger::Error("[PortalRegistry] " + result.message);
    return result;
  }

  const bool saved = store_.MutatePortal(portal_id, [&](config::Portal& portal) {
    portal.name = spec.name;
    portal.url = *url;
    portal.proxy = spec.proxy;
    portal.enabled = spec.enabled;
    portal.streams_per_mac = spec.streams_per_mac;
    portal.epg_offset_hours = spec.epg_offset_hours;
    portal.macs = macs;
  });
  if (!saved) {
    result.message = "Portal(" + spec.name + ") could not be saved";
    Logger::Error("[PortalRegistry] " + result.message);
    return result;
  }
  result.success = true;
  result.message = "Portal(" + spec.name + ") updated";
  Logger::Info("[PortalRegistry] " + result.message);
  NotifyChange();
  return result;
}

bool PortalRegistry::RemovePortal(const std::string& portal_id) {
  auto existing = store_.GetPortal(portal_id);
  if (!existing || !store_.RemovePortal(portal_id)) {
    Logger::Warn("[PortalRegistry] Portal(" + portal_id + ") not removed");
    return false;
  }
  Logger::Info("[PortalRegistry] Portal(" + existing->name + ") removed");
  NotifyChange();
  return true;
}

}  // namespace macreplay::runtime
