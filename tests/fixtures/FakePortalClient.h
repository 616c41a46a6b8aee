// Repository: MacReplay-gateway
// Component: Fake Portal Client
// Purpose: Scripted per-MAC portal behaviour for resolver, cache and registry tests.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_TESTS_FIXTURES_FAKE_PORTAL_CLIENT_H_
#define MACREPLAY_TESTS_FIXTURES_FAKE_PORTAL_CLIENT_H_

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "macreplay/portal/PortalClient.h"

namespace macreplay::tests::fixtures {

// What one (portal URL, MAC) pair answers.
struct FakeMacBehavior {
  bool handshake_ok = true;
  bool profile_ok = true;
  std::string expiry = "January 1, 2030";  // Empty: account info fails.
  bool channels_ok = true;
  std::vector<portal::Channel> channels;
  std::optional<portal::GenreMap> genres;
  std::optional<std::string> link;  // create_link answer.
  std::optional<portal::EpgData> epg;
};

inline portal::Channel MakeChannel(std::string id, std::string name, std::string number,
                                   std::string genre_id = "",
                                   std::string cmd = "ffmpeg http://localhost/ch/1") {
  portal::Channel channel;
  channel.id = std::move(id);
  channel.name = std::move(name);
  channel.number = std::move(number);
  channel.genre_id = std::move(genre_id);
  channel.cmd = std::move(cmd);
  return channel;
}

// FakePortalClient answers from FakeMacBehavior entries. Pairs without an
// entry fail every call. Call counts are kept per MAC.
class FakePortalClient : public portal::IPortalClient {
 public:
  void SetBehavior(const std::string& url, const std::string& mac, FakeMacBehavior behavior) {
    std::lock_guard<std::mutex> lock(mutex_);
    behaviors_[{url, mac}] = std::move(behavior);
  }

  void UpdateBehavior(const std::string& url, const std::string& mac,
                      const std::function<void(FakeMacBehavior&)>& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    update(behaviors_[{url, mac}]);
  }

  std::optional<std::string> Handshake(const portal::PortalEndpoint& endpoint) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++handshakes_[endpoint.mac];
    ++total_calls_;
    const FakeMacBehavior* behavior = Find(endpoint);
    if (!behavior || !behavior->handshake_ok) return std::nullopt;
    return "token-" + endpoint.mac;
  }

  std::optional<Json::Value> GetProfile(const portal::PortalEndpoint& endpoint,
                                        const std::string& token) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_calls_;
    const FakeMacBehavior* behavior = Find(endpoint);
    if (!behavior || !behavior->profile_ok || token != "token-" + endpoint.mac) {
      return std::nullopt;
    }
    Json::Value profile(Json::objectValue);
    profile["id"] = endpoint.mac;
    return profile;
  }

  std::optional<std::string> GetExpiry(const portal::PortalEndpoint& endpoint,
                                       const std::string& token) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_calls_;
    const FakeMacBehavior* behavior = Find(endpoint);
    if (!behavior || behavior->expiry.empty()) return std::nullopt;
    return behavior->expiry;
  }

  std::optional<std::vector<portal::Channel>> ListChannels(
      const portal::PortalEndpoint& endpoint, const std::string& token) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_calls_;
    ++channel_lists_[endpoint.mac];
    const FakeMacBehavior* behavior = Find(endpoint);
    if (!behavior || !behavior->channels_ok) return std::nullopt;
    return behavior->channels;
  }

  std::optional<portal::GenreMap> ListGenres(const portal::PortalEndpoint& endpoint,
                                             const std::string& token) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_calls_;
    const FakeMacBehavior* behavior = Find(endpoint);
    if (!behavior) return std::nullopt;
    return behavior->genres;
  }

  std::optional<std::string> CreateLink(const portal::PortalEndpoint& endpoint,
                                        const std::string& token,
                                        const std::string& cmd) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_calls_;
    created_links_.push_back(cmd);
    const FakeMacBehavior* behavior = Find(endpoint);
    if (!behavior) return std::nullopt;
    return behavior->link;
  }

  std::optional<portal::EpgData> GetEpg(const portal::PortalEndpoint& endpoint,
                                        const std::string& token, int period_hours) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_calls_;
    const FakeMacBehavior* behavior = Find(endpoint);
    if (!behavior) return std::nullopt;
    return behavior->epg;
  }

  int HandshakeCount(const std::string& mac) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handshakes_.find(mac);
    return it == handshakes_.end() ? 0 : it->second;
  }

  int ChannelListCount(const std::string& mac) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channel_lists_.find(mac);
    return it == channel_lists_.end() ? 0 : it->second;
  }

  int TotalCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_calls_;
  }

  std::vector<std::string> CreatedLinks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_links_;
  }

 private:
  const FakeMacBehavior* Find(const portal::PortalEndpoint& endpoint) const {
    auto it = behaviors_.find({endpoint.url, endpoint.mac});
    return it == behaviors_.end() ? nullptr : &it->second;
  }

  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, FakeMacBehavior> behaviors_;
  std::map<std::string, int> handshakes_;
  std::map<std::string, int> channel_lists_;
  std::vector<std::string> created_links_;
  int total_calls_ = 0;
};

}  // namespace macreplay::tests::fixtures

#endif  // MACREPLAY_TESTS_FIXTURES_FAKE_PORTAL_CLIENT_H_
