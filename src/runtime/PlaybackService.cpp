// Repository: MacReplay-gateway
// Component: Playback Service
// Purpose: Answers a channel request with a relayed stream, a redirect or an error.
// Copyright (c) 2025 MacReplay

#include "macreplay/runtime/PlaybackService.h"

#include "macreplay/relay/CommandTemplate.h"
#include "macreplay/util/Logger.hpp"

namespace macreplay::runtime {

using macreplay::util::Logger;

namespace {
constexpr const char* kStreamContentType = "application/octet-stream";
}

PlaybackService::PlaybackService(config::ConfigStore& store, StreamResolver& resolver,
                                 relay::RelayManager& relay_manager, PlaybackOptions options)
    : store_(store),
      resolver_(resolver),
      relay_manager_(relay_manager),
      options_(std::move(options)) {}

void PlaybackService::Play(const PlayRequest& request, IPlaybackResponder& responder) {
  ResolutionResult result = resolver_.Resolve(request);

  if (result.status == ResolutionResult::Status::kUnknownPortal) {
    responder.SendError(404, "Unknown portal");
    return;
  }
  if (result.status != ResolutionResult::Status::kResolved || !result.stream ||
      !result.lease) {
    responder.SendError(503, "No streams available");
    return;
  }

  const ResolvedStream& stream = *result.stream;
  const config::Settings settings = store_.GetSettings();

  relay::CommandContext context;
  context.url = stream.link;
  context.proxy = stream.proxy;
  context.timeout_seconds = settings.ffmpeg_timeout_s;

  std::vector<std::string> argv;
  if (request.web) {
    argv = relay::BuildWebRelayCommand(options_.ffmpeg_path, context);
  } else if (settings.stream_method != config::StreamMethod::kFfmpeg) {
    Logger::Info("[Playback] Redirect sent for Portal(" + stream.portal_id + "):Channel(" +
                 stream.channel_id + ")");
    result.lease.reset();
    responder.SendRedirect(stream.link);
    return;
  } else {
    auto built = relay::BuildRelayCommand(options_.ffmpeg_path, settings.ffmpeg_command,
                                          context);
    if (!built) {
      Logger::Error("[Playback] Configured ffmpeg command has no <url> placeholder");
      result.lease.reset();
      responder.SendError(500, "Invalid ffmpeg command");
      return;
    }
    argv = std::move(*built);
  }

  if (!responder.BeginStream(kStreamContentType)) {
    Logger::Warn("[Playback] Client " + request.client_address +
                 " went away before the stream started");
    return;
  }
  const relay::RelayOutcome outcome =
      relay_manager_.Relay(argv, std::move(*result.lease), responder);
  if (outcome.spawn_failed) {
    Logger::Error("[Playback] Relay for Portal(" + stream.portal_id + "):Channel(" +
                  stream.channel_id + ") never started");
  } else {
    Logger::Info("[Playback] Stream of Portal(" + stream.portal_id + "):Channel(" +
                 stream.channel_id + ") ended after " + std::to_string(outcome.bytes_relayed) +
                 " bytes");
  }
}

}  // namespace macreplay::runtime
