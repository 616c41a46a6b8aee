// Repository: MacReplay-gateway
// Component: Relay Manager
// Purpose: Supervises one remux process per stream and pumps its output to the client.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_RELAY_RELAY_MANAGER_H_
#define MACREPLAY_RELAY_RELAY_MANAGER_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "macreplay/relay/ChildProcess.h"
#include "macreplay/runtime/OccupancyTable.h"

namespace macreplay::runtime {
class MacPool;
}

namespace macreplay::telemetry {
class MetricsExporter;
}

namespace macreplay::relay {

// Size of each read from the relay's stdout.
inline constexpr size_t kRelayChunkSize = 1024;

// IRelaySink is the client side of a relay.
class IRelaySink {
 public:
  virtual ~IRelaySink() = default;

  // Returns false once the client can no longer receive data.
  virtual bool Write(const char* data, size_t size) = 0;

  // Cheap check used while the relay produces nothing.
  virtual bool IsConnected() = 0;
};

struct RelayOutcome {
  bool spawn_failed = false;
  bool client_disconnected = false;
  bool read_failed = false;
  bool mac_rotated = false;
  int exit_status = 0;
  uint64_t bytes_relayed = 0;
};

// Starts the relay command with stdout captured; nullptr when it cannot be
// started.
using RelayLauncher =
    std::function<std::unique_ptr<IRelayProcess>(const std::vector<std::string>& argv)>;

// RelayManager runs the relay command for an admitted session. The session's
// lease is held for exactly the lifetime of the process and released on
// every exit path.
//
// Exit classification:
// - End of stream with non-zero exit: the MAC is rotated for future requests.
// - Client disconnect or write error: the process is killed, no rotation.
// - Read error on the relay's output: the process is killed, no rotation.
// - Process could not be started: no rotation.
class RelayManager {
 public:
  // A null `launcher` spawns a ChildProcess.
  RelayManager(runtime::MacPool& mac_pool,
               std::shared_ptr<telemetry::MetricsExporter> metrics = nullptr,
               std::chrono::milliseconds poll_interval = std::chrono::milliseconds(200),
               RelayLauncher launcher = nullptr);

  RelayOutcome Relay(const std::vector<std::string>& argv, runtime::OccupancyLease lease,
                     IRelaySink& sink);

 private:
  void RecordExit(const std::string& portal_id, const char* status);

  runtime::MacPool& mac_pool_;
  std::shared_ptr<telemetry::MetricsExporter> metrics_;
  const std::chrono::milliseconds poll_interval_;
  RelayLauncher launcher_;
};

}  // namespace macreplay::relay

#endif  // MACREPLAY_RELAY_RELAY_MANAGER_H_
