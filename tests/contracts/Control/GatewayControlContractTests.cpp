// Repository: MacReplay-gateway
// Component: GatewayControl Contract Tests
// Purpose: Operator RPCs called directly against in-memory gateway components.
// Copyright (c) 2025 MacReplay

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "fixtures/FakePortalClient.h"
#include "fixtures/ScriptedHttpTransport.h"
#include "gateway_control_service.h"
#include "macreplay/cache/ArtifactCache.h"
#include "macreplay/config/ConfigStore.h"
#include "macreplay/runtime/MacPool.h"
#include "macreplay/runtime/OccupancyTable.h"
#include "macreplay/runtime/PortalRegistry.h"
#include "timing/TestClock.h"

namespace macreplay::tests::contracts {
namespace {

using fixtures::FakeMacBehavior;
using fixtures::FakePortalClient;
using fixtures::MakeChannel;
using fixtures::ScriptedHttpTransport;

constexpr const char* kUrl = "http://x.example/portal.php";
constexpr const char* kNewUrl = "http://new.example/portal.php";
constexpr int64_t kNow = 1700000000;

class GatewayControlContractTest : public ::testing::Test {
 protected:
  GatewayControlContractTest()
      : store_(""),
        client_(std::make_shared<FakePortalClient>()),
        clock_(std::make_shared<timing::TestClock>()),
        occupancy_(clock_),
        pool_(store_),
        registry_(store_, std::make_shared<ScriptedHttpTransport>(), client_) {
    clock_->SetNowSeconds(kNow);
  }

  void SetUp() override {
    config::Portal portal;
    portal.id = "X";
    portal.name = "Portal X";
    portal.url = kUrl;
    portal.macs = {config::MacEntry{"A", "2030"}, config::MacEntry{"B", "2030"}};
    portal.enabled_channels = {"1", "2"};
    ASSERT_TRUE(store_.UpsertPortal(portal));

    FakeMacBehavior behavior;
    behavior.channels = {MakeChannel("1", "News", "1"), MakeChannel("2", "Sport", "2"),
                         MakeChannel("3", "Movies", "3")};
    behavior.genres = portal::GenreMap{};
    portal::Programme programme;
    programme.start_timestamp = kNow + 60;
    programme.stop_timestamp = kNow + 3660;
    programme.name = "Headlines";
    behavior.epg = portal::EpgData{{"1", {programme}}};
    client_->SetBehavior(kUrl, "A", behavior);

    cache::ArtifactCacheOptions options;
    options.lineup_host = "10.0.0.1:8001";
    cache_ = std::make_unique<cache::ArtifactCache>(store_, client_, clock_, options);
    service_ = std::make_unique<control::GatewayControlImpl>(store_, *cache_, occupancy_, pool_,
                                                             registry_, "10.0.0.1:8001");
  }

  control::PortalDefinition Definition(const std::string& name, const std::string& url,
                                       const std::vector<std::string>& macs) const {
    control::PortalDefinition definition;
    definition.set_name(name);
    definition.set_url(url);
    for (const auto& mac : macs) definition.add_macs(mac);
    return definition;
  }

  runtime::StreamSession Session(const std::string& portal_id, const std::string& mac) const {
    runtime::StreamSession session;
    session.portal_id = portal_id;
    session.portal_name = "Portal " + portal_id;
    session.mac = mac;
    session.channel_id = "1";
    session.channel_name = "News";
    session.client = "10.0.0.7";
    return session;
  }

  config::ConfigStore store_;
  std::shared_ptr<FakePortalClient> client_;
  std::shared_ptr<timing::TestClock> clock_;
  runtime::OccupancyTable occupancy_;
  runtime::MacPool pool_;
  runtime::PortalRegistry registry_;
  std::unique_ptr<cache::ArtifactCache> cache_;
  std::unique_ptr<control::GatewayControlImpl> service_;
};

TEST_F(GatewayControlContractTest, RefreshLineupReportsEnabledChannelCount) {
  control::RefreshLineupRequest request;
  control::RefreshLineupResponse response;
  ASSERT_TRUE(service_->RefreshLineup(nullptr, &request, &response).ok());
  EXPECT_TRUE(response.success());
  EXPECT_EQ(response.channel_count(), 2);
  EXPECT_EQ(cache_->Lineup().size(), 2u);
}

TEST_F(GatewayControlContractTest, RefreshEpgRebuildsGuide) {
  control::RefreshEpgRequest request;
  control::RefreshEpgResponse response;
  ASSERT_TRUE(service_->RefreshEpg(nullptr, &request, &response).ok());
  EXPECT_TRUE(response.success());
  EXPECT_GT(response.document_bytes(), 0);
  EXPECT_NE(cache_->Xmltv().find("Headlines"), std::string::npos);
}

TEST_F(GatewayControlContractTest, RegeneratePlaylistUsesRequestedOrAdvertisedHost) {
  control::RegeneratePlaylistRequest request;
  control::RegeneratePlaylistResponse response;
  ASSERT_TRUE(service_->RegeneratePlaylist(nullptr, &request, &response).ok());
  EXPECT_EQ(response.entry_count(), 2);
  EXPECT_NE(cache_->Playlist("10.0.0.1:8001").find("http://10.0.0.1:8001/play/X/1"),
            std::string::npos);

  request.set_host("tv.lan:9000");
  control::RegeneratePlaylistResponse custom;
  ASSERT_TRUE(service_->RegeneratePlaylist(nullptr, &request, &custom).ok());
  EXPECT_EQ(custom.entry_count(), 2);
  EXPECT_NE(cache_->Playlist("tv.lan:9000").find("http://tv.lan:9000/play/X/2"),
            std::string::npos);
}

TEST_F(GatewayControlContractTest, ListSessionsFiltersByPortal) {
  auto first = occupancy_.TryOccupy(Session("X", "A"), 0);
  auto second = occupancy_.TryOccupy(Session("X", "B"), 0);
  auto other = occupancy_.TryOccupy(Session("Y", "C"), 0);
  ASSERT_TRUE(first && second && other);

  control::ListSessionsRequest request;
  control::ListSessionsResponse all;
  ASSERT_TRUE(service_->ListSessions(nullptr, &request, &all).ok());
  EXPECT_EQ(all.sessions_size(), 3);

  request.set_portal_id("X");
  control::ListSessionsResponse filtered;
  ASSERT_TRUE(service_->ListSessions(nullptr, &request, &filtered).ok());
  ASSERT_EQ(filtered.sessions_size(), 2);
  for (const auto& session : filtered.sessions()) {
    EXPECT_EQ(session.portal_id(), "X");
    EXPECT_EQ(session.portal_name(), "Portal X");
    EXPECT_EQ(session.channel_name(), "News");
    EXPECT_EQ(session.client(), "10.0.0.7");
    EXPECT_EQ(session.start_time_utc_s(), kNow);
  }
}

TEST_F(GatewayControlContractTest, RotateMacMovesMacToTail) {
  control::RotateMacRequest request;
  request.set_portal_id("X");
  request.set_mac("A");
  control::RotateMacResponse response;
  ASSERT_TRUE(service_->RotateMac(nullptr, &request, &response).ok());
  EXPECT_TRUE(response.success());
  ASSERT_EQ(response.mac_order_size(), 2);
  EXPECT_EQ(response.mac_order(0), "B");
  EXPECT_EQ(response.mac_order(1), "A");
  EXPECT_EQ(pool_.RotationOrder("X")[0].mac, "B");
}

TEST_F(GatewayControlContractTest, RotateMacRejectsUnknownPortalOrMac) {
  control::RotateMacRequest request;
  request.set_portal_id("nope");
  request.set_mac("A");
  control::RotateMacResponse response;
  EXPECT_EQ(service_->RotateMac(nullptr, &request, &response).error_code(),
            grpc::StatusCode::NOT_FOUND);
  EXPECT_FALSE(response.success());

  request.set_portal_id("X");
  request.set_mac("Z");
  control::RotateMacResponse unknown_mac;
  EXPECT_EQ(service_->RotateMac(nullptr, &request, &unknown_mac).error_code(),
            grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(pool_.RotationOrder("X")[0].mac, "A");
}

TEST_F(GatewayControlContractTest, AddPortalStoresWorkingMacs) {
  client_->SetBehavior(kNewUrl, "C", FakeMacBehavior{});

  control::AddPortalRequest request;
  *request.mutable_portal() = Definition("New", kNewUrl, {"C", "D"});
  control::PortalChangeResponse response;
  ASSERT_TRUE(service_->AddPortal(nullptr, &request, &response).ok());
  EXPECT_TRUE(response.success());
  EXPECT_EQ(response.message(), "Portal(New) added");
  ASSERT_EQ(response.working_macs_size(), 1);
  EXPECT_EQ(response.working_macs(0), "C");
  ASSERT_EQ(response.dead_macs_size(), 1);
  EXPECT_EQ(response.dead_macs(0), "D");

  auto stored = store_.GetPortal(response.portal_id());
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->streams_per_mac, 1);
  EXPECT_TRUE(stored->enabled);
}

TEST_F(GatewayControlContractTest, AddPortalValidatesDefinition) {
  control::AddPortalRequest request;
  *request.mutable_portal() = Definition("", kNewUrl, {"C"});
  control::PortalChangeResponse missing_name;
  EXPECT_EQ(service_->AddPortal(nullptr, &request, &missing_name).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);

  *request.mutable_portal() = Definition("New", kNewUrl, {});
  control::PortalChangeResponse no_macs;
  EXPECT_EQ(service_->AddPortal(nullptr, &request, &no_macs).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(store_.GetPortals().size(), 1u);
}

TEST_F(GatewayControlContractTest, AddPortalWithoutWorkingMacFailsPrecondition) {
  control::AddPortalRequest request;
  *request.mutable_portal() = Definition("Dead", kNewUrl, {"D"});
  control::PortalChangeResponse response;
  const grpc::Status status = service_->AddPortal(nullptr, &request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(response.message(), "None of the MACs tested OK for Portal(Dead)");
  EXPECT_EQ(store_.GetPortals().size(), 1u);
}

TEST_F(GatewayControlContractTest, UpdatePortalKeepsKnownMacs) {
  control::UpdatePortalRequest request;
  request.set_portal_id("X");
  *request.mutable_portal() = Definition("Renamed", kUrl, {"A", "B"});
  request.mutable_portal()->set_streams_per_mac(3);
  control::PortalChangeResponse response;
  ASSERT_TRUE(service_->UpdatePortal(nullptr, &request, &response).ok());
  EXPECT_TRUE(response.success());

  auto stored = store_.GetPortal("X");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->name, "Renamed");
  EXPECT_EQ(stored->streams_per_mac, 3);
  EXPECT_EQ(stored->macs.size(), 2u);
  EXPECT_EQ(stored->enabled_channels.size(), 2u);
}

TEST_F(GatewayControlContractTest, UpdateUnknownPortalIsNotFound) {
  control::UpdatePortalRequest request;
  request.set_portal_id("nope");
  *request.mutable_portal() = Definition("Renamed", kUrl, {"A"});
  control::PortalChangeResponse response;
  EXPECT_EQ(service_->UpdatePortal(nullptr, &request, &response).error_code(),
            grpc::StatusCode::NOT_FOUND);
}

TEST_F(GatewayControlContractTest, RemovePortal) {
  control::RemovePortalRequest request;
  request.set_portal_id("nope");
  control::RemovePortalResponse missing;
  EXPECT_EQ(service_->RemovePortal(nullptr, &request, &missing).error_code(),
            grpc::StatusCode::NOT_FOUND);

  request.set_portal_id("X");
  control::RemovePortalResponse removed;
  ASSERT_TRUE(service_->RemovePortal(nullptr, &request, &removed).ok());
  EXPECT_TRUE(removed.success());
  EXPECT_FALSE(store_.GetPortal("X").has_value());
}

TEST_F(GatewayControlContractTest, GetVersion) {
  control::ApiVersionRequest request;
  control::ApiVersion response;
  ASSERT_TRUE(service_->GetVersion(nullptr, &request, &response).ok());
  EXPECT_EQ(response.version(), "1.0.0");
}

}  // namespace
}  // namespace macreplay::tests::contracts
