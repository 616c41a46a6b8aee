// Repository: MacReplay-gateway
// Component: Stream Prober
// Purpose: Liveness check of a resolved upstream link before it is relayed.
// Copyright (c) 2025 MacReplay

#include "macreplay/relay/StreamProber.h"

#include "macreplay/relay/ChildProcess.h"
#include "macreplay/relay/CommandTemplate.h"
#include "macreplay/util/Logger.hpp"

namespace macreplay::relay {

using macreplay::util::Logger;

namespace {
constexpr int kWatchdogSlackSeconds = 5;
}

FfprobeStreamProber::FfprobeStreamProber(std::string ffprobe_path)
    : ffprobe_path_(std::move(ffprobe_path)) {}

bool FfprobeStreamProber::Probe(const ProbeRequest& request) {
  CommandContext context;
  context.url = request.link;
  context.proxy = request.proxy;
  context.timeout_seconds = request.timeout_seconds;

  auto child = ChildProcess::Spawn(BuildProbeCommand(ffprobe_path_, context), false);
  if (!child) {
    Logger::Error("[StreamProber] Could not start " + ffprobe_path_);
    return false;
  }

  const auto limit = std::chrono::seconds(request.timeout_seconds + kWatchdogSlackSeconds);
  auto status = child->WaitFor(std::chrono::duration_cast<std::chrono::milliseconds>(limit));
  if (!status) {
    Logger::Warn("[StreamProber] Probe of " + request.link + " timed out");
    child->Kill();
    return false;
  }
  if (*status != 0) {
    Logger::Debug("[StreamProber] Probe of " + request.link + " exited with " +
                  std::to_string(*status));
    return false;
  }
  return true;
}

}  // namespace macreplay::relay
