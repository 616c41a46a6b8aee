// Repository: MacReplay-gateway
// Component: Stream Prober
// Purpose: Liveness check of a resolved upstream link before it is relayed.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_RELAY_STREAM_PROBER_H_
#define MACREPLAY_RELAY_STREAM_PROBER_H_

#include <string>

namespace macreplay::relay {

struct ProbeRequest {
  std::string link;
  std::string proxy;
  int timeout_seconds = 5;
};

class IStreamProber {
 public:
  virtual ~IStreamProber() = default;

  // True when the link opened and produced a readable stream.
  virtual bool Probe(const ProbeRequest& request) = 0;
};

// Runs ffprobe against the link; success iff it exits with status 0. A
// watchdog kills ffprobe if it outlives its own timeout by five seconds.
class FfprobeStreamProber : public IStreamProber {
 public:
  explicit FfprobeStreamProber(std::string ffprobe_path);

  bool Probe(const ProbeRequest& request) override;

 private:
  std::string ffprobe_path_;
};

}  // namespace macreplay::relay

#endif  // MACREPLAY_RELAY_STREAM_PROBER_H_
