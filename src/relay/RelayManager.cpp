// Repository: MacReplay-gateway
// Component: Relay Manager
// Purpose: Supervises one remux process per stream and pumps its output to the client.
// Copyright (c) 2025 MacReplay

#include "macreplay/relay/RelayManager.h"

#include <array>

#include "macreplay/relay/ChildProcess.h"
#include "macreplay/relay/CommandTemplate.h"
#include "macreplay/runtime/MacPool.h"
#include "macreplay/telemetry/MetricsExporter.h"
#include "macreplay/util/Logger.hpp"

namespace macreplay::relay {

using macreplay::util::Logger;

namespace {

// execvp failure in the child.
constexpr int kExecFailedStatus = 127;

std::string SessionContext(const runtime::StreamSession& session) {
  return "Portal(" + session.portal_id + "):MAC(" + session.mac + "):Channel(" +
         session.channel_id + ")";
}

}  // namespace

RelayManager::RelayManager(runtime::MacPool& mac_pool,
                           std::shared_ptr<telemetry::MetricsExporter> metrics,
                           std::chrono::milliseconds poll_interval, RelayLauncher launcher)
    : mac_pool_(mac_pool),
      metrics_(std::move(metrics)),
      poll_interval_(poll_interval),
      launcher_(std::move(launcher)) {
  if (!launcher_) {
    launcher_ = [](const std::vector<std::string>& argv) -> std::unique_ptr<IRelayProcess> {
      return ChildProcess::Spawn(argv, true);
    };
  }
}

void RelayManager::RecordExit(const std::string& portal_id, const char* status) {
  if (metrics_) {
    metrics_->RecordRelayExit(portal_id, status);
  }
}

RelayOutcome RelayManager::Relay(const std::vector<std::string>& argv,
                                 runtime::OccupancyLease lease, IRelaySink& sink) {
  RelayOutcome outcome;
  const runtime::StreamSession session = lease.session();
  const std::string context = SessionContext(session);

  Logger::Info("[RelayManager] " + context + ": starting relay for " + session.client);
  Logger::Debug("[RelayManager] " + context + ": " + JoinCommand(argv));

  std::unique_ptr<IRelayProcess> child = launcher_(argv);
  if (!child) {
    outcome.spawn_failed = true;
    RecordExit(session.portal_id, "spawn_failed");
    Logger::Error("[RelayManager] " + context + ": relay process could not be started");
    return outcome;
  }

  std::array<char, kRelayChunkSize> buffer{};
  try {
    while (true) {
      const ReadResult read = child->Read(buffer.data(), buffer.size(), poll_interval_);
      if (read.status == ReadStatus::kData) {
        if (!sink.Write(buffer.data(), read.bytes)) {
          outcome.client_disconnected = true;
          break;
        }
        outcome.bytes_relayed += read.bytes;
        continue;
      }
      if (read.status == ReadStatus::kTimeout) {
        if (!sink.IsConnected()) {
          outcome.client_disconnected = true;
          break;
        }
        continue;
      }
      if (read.status == ReadStatus::kError) {
        outcome.read_failed = true;
      }
      break;
    }
  } catch (const std::exception& e) {
    Logger::Error("[RelayManager] " + context + ": relay aborted: " + e.what());
    outcome.client_disconnected = true;
  }

  if (outcome.read_failed) {
    // The process may still be running; a plain Wait() could block forever.
    child->Kill();
    outcome.exit_status = child->Wait();
    RecordExit(session.portal_id, "error");
    Logger::Warn("[RelayManager] " + context + ": read from relay failed after " +
                 std::to_string(outcome.bytes_relayed) + " bytes, relay stopped");
    return outcome;
  }

  if (outcome.client_disconnected) {
    child->Kill();
    outcome.exit_status = child->Wait();
    RecordExit(session.portal_id, "killed");
    Logger::Info("[RelayManager] " + context + ": client " + session.client +
                 " disconnected after " + std::to_string(outcome.bytes_relayed) +
                 " bytes, relay stopped");
    return outcome;
  }

  outcome.exit_status = child->Wait();
  if (outcome.exit_status == 0) {
    RecordExit(session.portal_id, "ok");
    Logger::Info("[RelayManager] " + context + ": stream ended");
    return outcome;
  }

  if (outcome.exit_status == kExecFailedStatus) {
    outcome.spawn_failed = true;
    RecordExit(session.portal_id, "spawn_failed");
    Logger::Error("[RelayManager] " + context + ": relay executable " + argv.front() +
                  " could not be run");
    return outcome;
  }

  RecordExit(session.portal_id, "error");
  Logger::Error("[RelayManager] " + context + ": relay exited with status " +
                std::to_string(outcome.exit_status) + ", moving MAC to the back");
  // Release before rotating so the next request sees the MAC free.
  lease.Release();
  outcome.mac_rotated =
      mac_pool_.Rotate(session.portal_id, session.mac, runtime::RotationReason::kRelayExited);
  return outcome;
}

}  // namespace macreplay::relay
