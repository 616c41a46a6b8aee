// Repository: MacReplay-gateway
// Component: Fake Stream Prober
// Purpose: Probe double that accepts every link except the ones marked dead.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_TESTS_FIXTURES_FAKE_STREAM_PROBER_H_
#define MACREPLAY_TESTS_FIXTURES_FAKE_STREAM_PROBER_H_

#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "macreplay/relay/StreamProber.h"

namespace macreplay::tests::fixtures {

class FakeStreamProber : public relay::IStreamProber {
 public:
  void MarkDead(const std::string& link) {
    std::lock_guard<std::mutex> lock(mutex_);
    dead_links_.insert(link);
  }

  bool Probe(const relay::ProbeRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    probed_.push_back(request.link);
    return dead_links_.count(request.link) == 0;
  }

  std::vector<std::string> probed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probed_;
  }

 private:
  mutable std::mutex mutex_;
  std::set<std::string> dead_links_;
  std::vector<std::string> probed_;
};

}  // namespace macreplay::tests::fixtures

#endif  // MACREPLAY_TESTS_FIXTURES_FAKE_STREAM_PROBER_H_
