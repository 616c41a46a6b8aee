// Repository: MacReplay-gateway
// Component: Playback Service
// Purpose: Answers a channel request with a relayed stream, a redirect or an error.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_RUNTIME_PLAYBACK_SERVICE_H_
#define MACREPLAY_RUNTIME_PLAYBACK_SERVICE_H_

#include <string>

#include "macreplay/config/ConfigStore.h"
#include "macreplay/relay/RelayManager.h"
#include "macreplay/runtime/StreamResolver.h"

namespace macreplay::runtime {

// IPlaybackResponder is the HTTP response of one /play request. Exactly one
// of SendRedirect, SendError or BeginStream is called; stream bytes follow
// BeginStream through the IRelaySink interface.
class IPlaybackResponder : public relay::IRelaySink {
 public:
  virtual void SendRedirect(const std::string& location) = 0;
  virtual void SendError(int status, const std::string& body) = 0;
  virtual bool BeginStream(const std::string& content_type) = 0;
};

struct PlaybackOptions {
  std::string ffmpeg_path = "ffmpeg";
};

class PlaybackService {
 public:
  PlaybackService(config::ConfigStore& store, StreamResolver& resolver,
                  relay::RelayManager& relay_manager, PlaybackOptions options = {});

  // Blocks for the duration of a relayed stream.
  void Play(const PlayRequest& request, IPlaybackResponder& responder);

 private:
  config::ConfigStore& store_;
  StreamResolver& resolver_;
  relay::RelayManager& relay_manager_;
  const PlaybackOptions options_;
};

}  // namespace macreplay::runtime

#endif  // MACREPLAY_RUNTIME_PLAYBACK_SERVICE_H_
