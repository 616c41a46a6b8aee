// Repository: MacReplay-gateway
// Component: MAC Pool
// Purpose: Rotation order of each portal's MAC credentials and move-to-tail rotation.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_RUNTIME_MAC_POOL_H_
#define MACREPLAY_RUNTIME_MAC_POOL_H_

#include <memory>
#include <string>
#include <vector>

#include "macreplay/config/ConfigStore.h"
#include "macreplay/config/GatewayConfig.h"

namespace macreplay::telemetry {
class MetricsExporter;
}

namespace macreplay::runtime {

// Why a MAC was sent to the back of its portal's list.
enum class RotationReason {
  kHandshakeFailed,
  kChannelNotFound,
  kLinkUnavailable,
  kProbeFailed,
  kRelayExited,
  kOperatorRequest,
};

const char* RotationReasonToString(RotationReason reason);

// Moves `mac` to the tail of `macs`, keeping the relative order of the rest.
// Returns false (and leaves `macs` untouched) when `mac` is not present.
bool MoveMacToTail(std::vector<config::MacEntry>& macs, const std::string& mac);

// MacPool is the only writer of MAC order. Rotation never removes a MAC.
class MacPool {
 public:
  MacPool(config::ConfigStore& store,
          std::shared_ptr<telemetry::MetricsExporter> metrics = nullptr);

  // Current rotation order for the portal; empty when it does not exist.
  std::vector<config::MacEntry> RotationOrder(const std::string& portal_id) const;

  // Moves `mac` to the tail and persists the new order.
  bool Rotate(const std::string& portal_id, const std::string& mac, RotationReason reason);

 private:
  config::ConfigStore& store_;
  std::shared_ptr<telemetry::MetricsExporter> metrics_;
};

}  // namespace macreplay::runtime

#endif  // MACREPLAY_RUNTIME_MAC_POOL_H_
