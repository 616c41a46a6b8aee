// Repository: MacReplay-gateway
// Component: Playback Service Contract Tests
// Purpose: /play outcomes from resolution through relay, redirect and errors.
// Copyright (c) 2025 MacReplay

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "fixtures/FakePortalClient.h"
#include "fixtures/FakeStreamProber.h"
#include "fixtures/RecordingResponder.h"
#include "fixtures/ShellScript.h"
#include "macreplay/config/ConfigStore.h"
#include "macreplay/relay/RelayManager.h"
#include "macreplay/relay/StreamProber.h"
#include "macreplay/runtime/MacPool.h"
#include "macreplay/runtime/OccupancyTable.h"
#include "macreplay/runtime/PlaybackService.h"
#include "macreplay/runtime/StreamResolver.h"
#include "timing/TestClock.h"

namespace macreplay::tests::contracts {
namespace {

using fixtures::FakeMacBehavior;
using fixtures::FakePortalClient;
using fixtures::FakeStreamProber;
using fixtures::MakeChannel;
using fixtures::RecordingResponder;
using fixtures::TestDirectory;
using fixtures::WriteShellScript;

constexpr const char* kUrl = "http://x.example/portal.php";
constexpr const char* kLink = "http://edge.example/live/1.ts";

class PlaybackServiceContractTest : public ::testing::Test {
 protected:
  PlaybackServiceContractTest()
      : store_(""),
        client_(std::make_shared<FakePortalClient>()),
        prober_(std::make_shared<FakeStreamProber>()),
        pool_(store_),
        occupancy_(std::make_shared<timing::TestClock>()),
        resolver_(store_, client_, pool_, occupancy_, prober_),
        relay_(pool_, nullptr, std::chrono::milliseconds(50)) {}

  void SetUp() override {
    // Prints its arguments, one per line, in place of ffmpeg.
    ffmpeg_ = WriteShellScript(dir_, "ffmpeg", "for arg in \"$@\"; do echo \"$arg\"; done");

    config::Portal portal;
    portal.id = "X";
    portal.name = "Portal X";
    portal.url = kUrl;
    portal.macs = {config::MacEntry{"A", "2030"}};
    ASSERT_TRUE(store_.UpsertPortal(portal));

    FakeMacBehavior behavior;
    behavior.channels = {MakeChannel("1", "News", "1")};
    behavior.link = kLink;
    client_->SetBehavior(kUrl, "A", behavior);
  }

  runtime::PlaybackService Service() {
    runtime::PlaybackOptions options;
    options.ffmpeg_path = ffmpeg_;
    return runtime::PlaybackService(store_, resolver_, relay_, options);
  }

  runtime::PlayRequest Request(const std::string& portal_id, bool web = false) const {
    runtime::PlayRequest request;
    request.portal_id = portal_id;
    request.channel_id = "1";
    request.client_address = "10.0.0.9";
    request.web = web;
    return request;
  }

  void UpdateSettings(const std::function<void(config::Settings&)>& update) {
    auto settings = store_.GetSettings();
    update(settings);
    ASSERT_TRUE(store_.UpdateSettings(settings));
  }

  TestDirectory dir_;
  std::string ffmpeg_;
  config::ConfigStore store_;
  std::shared_ptr<FakePortalClient> client_;
  std::shared_ptr<FakeStreamProber> prober_;
  runtime::MacPool pool_;
  runtime::OccupancyTable occupancy_;
  runtime::StreamResolver resolver_;
  relay::RelayManager relay_;
};

TEST_F(PlaybackServiceContractTest, RelaysStreamThroughConfiguredCommand) {
  RecordingResponder responder;
  Service().Play(Request("X"), responder);

  EXPECT_EQ(responder.error_status(), 0);
  EXPECT_EQ(responder.content_type(), "application/octet-stream");
  const std::string output = responder.data();
  EXPECT_NE(output.find(std::string("-i\n") + kLink + "\n"), std::string::npos) << output;
  EXPECT_NE(output.find("-timeout\n5000000\n"), std::string::npos);
  EXPECT_EQ(output.find("-http_proxy"), std::string::npos);
  EXPECT_EQ(occupancy_.TotalActive(), 0u);
}

TEST_F(PlaybackServiceContractTest, WebPlaybackUsesFragmentedMp4Remux) {
  RecordingResponder responder;
  Service().Play(Request("X", /*web=*/true), responder);

  EXPECT_NE(responder.data().find("frag_keyframe+empty_moov"), std::string::npos);
}

TEST_F(PlaybackServiceContractTest, RedirectModeAnswersWithLinkAndFreesSlot) {
  UpdateSettings([](config::Settings& s) { s.stream_method = config::StreamMethod::kRedirect; });
  RecordingResponder responder;
  Service().Play(Request("X"), responder);

  EXPECT_EQ(responder.redirect(), kLink);
  EXPECT_TRUE(responder.data().empty());
  EXPECT_EQ(occupancy_.TotalActive(), 0u);
}

TEST_F(PlaybackServiceContractTest, UnknownPortalIsNotFound) {
  RecordingResponder responder;
  Service().Play(Request("nope"), responder);
  EXPECT_EQ(responder.error_status(), 404);
}

TEST_F(PlaybackServiceContractTest, UnavailableChannelIsServiceUnavailable) {
  client_->UpdateBehavior(kUrl, "A", [](FakeMacBehavior& b) { b.handshake_ok = false; });
  RecordingResponder responder;
  Service().Play(Request("X"), responder);
  EXPECT_EQ(responder.error_status(), 503);
  EXPECT_TRUE(responder.content_type().empty());
}

TEST_F(PlaybackServiceContractTest, CommandWithoutUrlIsAServerError) {
  UpdateSettings([](config::Settings& s) { s.ffmpeg_command = "-re -f mpegts pipe:"; });
  RecordingResponder responder;
  Service().Play(Request("X"), responder);
  EXPECT_EQ(responder.error_status(), 500);
  EXPECT_EQ(occupancy_.TotalActive(), 0u);
}

TEST_F(PlaybackServiceContractTest, DisconnectDuringRelayStopsTheStream) {
  const std::string endless =
      WriteShellScript(dir_, "endless", "while true; do echo data; sleep 0.05; done");
  runtime::PlaybackOptions options;
  options.ffmpeg_path = endless;
  runtime::PlaybackService service(store_, resolver_, relay_, options);

  RecordingResponder responder;
  responder.set_disconnect_after_bytes(10);
  service.Play(Request("X"), responder);

  EXPECT_GE(responder.data().size(), 10u);
  EXPECT_EQ(occupancy_.TotalActive(), 0u);
  EXPECT_EQ(pool_.RotationOrder("X").front().mac, "A");
}

TEST(FfprobeStreamProberTest, SuccessIsExitStatusZero) {
  TestDirectory dir;
  relay::ProbeRequest request;
  request.link = "http://edge.example/live/1.ts";
  request.timeout_seconds = 1;

  relay::FfprobeStreamProber good(WriteShellScript(dir, "ffprobe-ok", "exit 0"));
  EXPECT_TRUE(good.Probe(request));

  relay::FfprobeStreamProber bad(WriteShellScript(dir, "ffprobe-bad", "exit 1"));
  EXPECT_FALSE(bad.Probe(request));

  relay::FfprobeStreamProber missing(dir.File("no-such-ffprobe"));
  EXPECT_FALSE(missing.Probe(request));
}

}  // namespace
}  // namespace macreplay::tests::contracts
