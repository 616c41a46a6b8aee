// Repository: MacReplay-gateway
// Component: MAC Pool
// Purpose: Rotation order of each portal's MAC credentials and move-to-tail rotation.
// Copyright (c) 2025 MacReplay

#include "macreplay/runtime/MacPool.h"

#include <algorithm>

#include "macreplay/telemetry/MetricsExporter.h"
#include "macreplay/util/Logger.hpp"

namespace macreplay::runtime {

using macreplay::util::Logger;

const char* RotationReasonToString(RotationReason reason) {
  switch (reason) {
    case RotationReason::kHandshakeFailed:
      return "handshake_failed";
    case RotationReason::kChannelNotFound:
      return "channel_not_found";
    case RotationReason::kLinkUnavailable:
      return "link_unavailable";
    case RotationReason::kProbeFailed:
      return "probe_failed";
    case RotationReason::kRelayExited:
      return "relay_exited";
    case RotationReason::kOperatorRequest:
      return "operator_request";
  }
  return "unknown";
}

bool MoveMacToTail(std::vector<config::MacEntry>& macs, const std::string& mac) {
  auto it = std::find_if(macs.begin(), macs.end(),
                         [&](const config::MacEntry& entry) { return entry.mac == mac; });
  if (it == macs.end()) return false;
  std::rotate(it, it + 1, macs.end());
  return true;
}

MacPool::MacPool(config::ConfigStore& store,
                 std::shared_ptr<telemetry::MetricsExporter> metrics)
    : store_(store), metrics_(std::move(metrics)) {}

std::vector<config::MacEntry> MacPool::RotationOrder(const std::string& portal_id) const {
  auto portal = store_.GetPortal(portal_id);
  if (!portal) return {};
  return portal->macs;
}

bool MacPool::Rotate(const std::string& portal_id, const std::string& mac,
                     RotationReason reason) {
  bool moved = false;
  const bool saved = store_.MutatePortal(portal_id, [&](config::Portal& portal) {
    moved = MoveMacToTail(portal.macs, mac);
  });
  if (!moved) {
    Logger::Warn("[MacPool] Portal(" + portal_id + "):MAC(" + mac +
                 "): not in rotation, nothing moved");
    return false;
  }
  if (!saved) {
    Logger::Error("[MacPool] Portal(" + portal_id + "):MAC(" + mac +
                  "): rotation not persisted");
  }
  Logger::Info("[MacPool] Portal(" + portal_id + "):MAC(" + mac + "): moved to tail (" +
               RotationReasonToString(reason) + ")");
  if (metrics_) {
    metrics_->RecordRotation(portal_id, RotationReasonToString(reason));
  }
  return true;
}

}  // namespace macreplay::runtime
