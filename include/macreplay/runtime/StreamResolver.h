// Repository: MacReplay-gateway
// Component: Stream Resolver
// Purpose: Resolves (portal, channel) to a verified upstream link using MAC rotation
//          and cross-portal fallback.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_RUNTIME_STREAM_RESOLVER_H_
#define MACREPLAY_RUNTIME_STREAM_RESOLVER_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "macreplay/config/ConfigStore.h"
#include "macreplay/portal/PortalClient.h"
#include "macreplay/relay/StreamProber.h"
#include "macreplay/runtime/MacPool.h"
#include "macreplay/runtime/OccupancyTable.h"

namespace macreplay::telemetry {
class MetricsExporter;
}

namespace macreplay::runtime {

struct PlayRequest {
  std::string portal_id;
  std::string channel_id;
  std::string client_address;
  bool web = false;  // Browser playback; never falls back to other portals.
};

// Result of trying one MAC. Everything but kSuccess and kBusy rotates the MAC.
enum class AttemptOutcome {
  kSuccess,
  kBusy,
  kCredentialFailure,  // Handshake, profile or channel list failed.
  kChannelNotFound,
  kLinkFailure,
  kProbeFailure,
};

const char* AttemptOutcomeToString(AttemptOutcome outcome);

struct ResolvedStream {
  std::string portal_id;
  std::string portal_name;
  std::string mac;
  std::string channel_id;
  std::string channel_name;
  std::string link;
  std::string proxy;
  bool via_fallback = false;
  // Requested portal/channel when the stream came from a fallback.
  std::string requested_portal_id;
  std::string requested_channel_id;
};

struct ResolutionResult {
  enum class Status {
    kResolved,
    kUnknownPortal,
    kUnavailable,
  };

  Status status = Status::kUnavailable;
  // No MAC of the requested portal had capacity. Nothing was rotated.
  bool no_free_mac = false;
  std::optional<ResolvedStream> stream;
  // Admission held for the resolved MAC; moves into the relay.
  std::optional<OccupancyLease> lease;
};

// StreamResolver walks MACs in rotation order. Each MAC attempt is admitted
// through the occupancy table first, so the slot is held while the link is
// resolved and probed and is handed to the caller on success.
class StreamResolver {
 public:
  StreamResolver(config::ConfigStore& store, std::shared_ptr<portal::IPortalClient> client,
                 MacPool& mac_pool, OccupancyTable& occupancy,
                 std::shared_ptr<relay::IStreamProber> prober,
                 std::shared_ptr<telemetry::MetricsExporter> metrics = nullptr);

  ResolutionResult Resolve(const PlayRequest& request);

 private:
  struct Attempt {
    AttemptOutcome outcome = AttemptOutcome::kCredentialFailure;
    std::string channel_name;  // Upstream or custom name when the channel was found.
    std::optional<ResolvedStream> stream;
    std::optional<OccupancyLease> lease;
  };

  Attempt TryMac(const config::Portal& portal, const config::MacEntry& mac,
                 const std::string& channel_id, const PlayRequest& request,
                 const config::Settings& settings);

  // Searches other enabled portals for a channel mapped to `channel_name`.
  std::optional<Attempt> TryFallbacks(const PlayRequest& request,
                                      const std::string& channel_name,
                                      const config::Settings& settings);

  static std::optional<RotationReason> RotationFor(AttemptOutcome outcome);

  void Record(const std::string& portal_id, const char* result);

  config::ConfigStore& store_;
  std::shared_ptr<portal::IPortalClient> client_;
  MacPool& mac_pool_;
  OccupancyTable& occupancy_;
  std::shared_ptr<relay::IStreamProber> prober_;
  std::shared_ptr<telemetry::MetricsExporter> metrics_;
};

// Link taken from a channel's cmd without a create_link call: the second
// space-separated field. Empty when there is none.
std::string DirectLinkFromCmd(const std::string& cmd);

// True when the cmd must be turned into a link by the portal.
bool NeedsCreateLink(const std::string& cmd);

}  // namespace macreplay::runtime

#endif  // MACREPLAY_RUNTIME_STREAM_RESOLVER_H_
