// Repository: MacReplay-gateway
// Component: Portal Client Contract Tests
// Purpose: Stalker request shape and response parsing over a scripted transport.
// Copyright (c) 2025 MacReplay

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>

#include "fixtures/ScriptedHttpTransport.h"
#include "macreplay/portal/HttpTransport.h"
#include "macreplay/portal/PortalClient.h"

namespace macreplay::tests::contracts {
namespace {

using fixtures::ScriptedHttpTransport;
using portal::PortalEndpoint;
using portal::StalkerPortalClient;

constexpr const char* kApiUrl = "http://alpha.example/stalker_portal/server/load.php";

bool HasPair(const std::vector<std::pair<std::string, std::string>>& pairs,
             const std::string& key, const std::string& value) {
  return std::find(pairs.begin(), pairs.end(), std::make_pair(key, value)) != pairs.end();
}

class PortalClientContractTest : public ::testing::Test {
 protected:
  PortalClientContractTest()
      : transport_(std::make_shared<ScriptedHttpTransport>()),
        client_(transport_),
        endpoint_{kApiUrl, "00:1A:79:00:00:01", "http://proxy.example:3128"} {}

  std::shared_ptr<ScriptedHttpTransport> transport_;
  StalkerPortalClient client_;
  PortalEndpoint endpoint_;
};

TEST_F(PortalClientContractTest, HandshakeSendsIdentityAndReturnsToken) {
  transport_->Respond("action=handshake", R"({"js":{"token":"ABC123"}})");

  auto token = client_.Handshake(endpoint_);
  ASSERT_TRUE(token.has_value());
  EXPECT_EQ(*token, "ABC123");

  const auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 1u);
  const auto& request = requests[0];
  EXPECT_EQ(request.url, std::string(kApiUrl) + "?type=stb&action=handshake&JsHttpRequest=1-xml");
  EXPECT_EQ(request.proxy, "http://proxy.example:3128");
  EXPECT_TRUE(HasPair(request.headers, "User-Agent", portal::kPortalUserAgent));
  EXPECT_TRUE(HasPair(request.cookies, "mac", "00:1A:79:00:00:01"));
  EXPECT_TRUE(HasPair(request.cookies, "stb_lang", "en"));
  EXPECT_TRUE(HasPair(request.cookies, "timezone", "Europe/London"));
  for (const auto& header : request.headers) {
    EXPECT_NE(header.first, "Authorization");
  }
}

TEST_F(PortalClientContractTest, HandshakeFailsOnMissingTokenOrBadJson) {
  transport_->Respond("action=handshake", R"({"js":{"token":""}})");
  EXPECT_FALSE(client_.Handshake(endpoint_).has_value());

  auto garbled = std::make_shared<ScriptedHttpTransport>();
  garbled->Respond("action=handshake", "<html>not json</html>");
  StalkerPortalClient garbled_client(garbled);
  EXPECT_FALSE(garbled_client.Handshake(endpoint_).has_value());

  auto failing = std::make_shared<ScriptedHttpTransport>();
  failing->Respond("action=handshake", R"({"js":{"token":"x"}})", 403);
  StalkerPortalClient failing_client(failing);
  EXPECT_FALSE(failing_client.Handshake(endpoint_).has_value());
}

TEST_F(PortalClientContractTest, AuthenticatedCallsCarryBearerToken) {
  transport_->Respond("action=get_profile", R"({"js":{"id":"42"}})");
  auto profile = client_.GetProfile(endpoint_, "TOKEN");
  ASSERT_TRUE(profile.has_value());
  EXPECT_EQ((*profile)["id"].asString(), "42");

  const auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_TRUE(HasPair(requests[0].headers, "Authorization", "Bearer TOKEN"));
}

TEST_F(PortalClientContractTest, ExpiryIsThePhoneField) {
  transport_->Respond("action=get_main_info", R"({"js":{"phone":"March 3, 2030"}})");
  EXPECT_EQ(client_.GetExpiry(endpoint_, "t").value_or(""), "March 3, 2030");

  auto empty = std::make_shared<ScriptedHttpTransport>();
  empty->Respond("action=get_main_info", R"({"js":{"phone":""}})");
  StalkerPortalClient empty_client(empty);
  EXPECT_FALSE(empty_client.GetExpiry(endpoint_, "t").has_value());
}

TEST_F(PortalClientContractTest, ChannelFieldsAreNormalizedToStrings) {
  transport_->Respond("action=get_all_channels", R"({"js":{"data":[
      {"id": 101, "name": "News", "number": "5", "tv_genre_id": 3,
       "logo": "http://logo/101.png", "cmd": "ffmpeg http://localhost/ch/101"},
      {"id": "102", "name": "Sports", "number": 7, "tv_genre_id": "4", "cmd": "x"},
      {"name": "No id"}
  ]}})");

  auto channels = client_.ListChannels(endpoint_, "t");
  ASSERT_TRUE(channels.has_value());
  ASSERT_EQ(channels->size(), 2u);
  EXPECT_EQ((*channels)[0].id, "101");
  EXPECT_EQ((*channels)[0].genre_id, "3");
  EXPECT_EQ((*channels)[0].logo, "http://logo/101.png");
  EXPECT_EQ((*channels)[0].cmd, "ffmpeg http://localhost/ch/101");
  EXPECT_EQ((*channels)[1].number, "7");
  EXPECT_EQ((*channels)[1].genre_id, "4");
  EXPECT_TRUE((*channels)[1].logo.empty());
}

TEST_F(PortalClientContractTest, ChannelListWithoutDataArrayFails) {
  transport_->Respond("action=get_all_channels", R"({"js":{"data":null}})");
  EXPECT_FALSE(client_.ListChannels(endpoint_, "t").has_value());
}

TEST_F(PortalClientContractTest, GenresMapIdToTitle) {
  transport_->Respond("action=get_genres",
                      R"({"js":[{"id":"*","title":"All"},{"id":3,"title":"News"},{"id":4}]})");
  auto genres = client_.ListGenres(endpoint_, "t");
  ASSERT_TRUE(genres.has_value());
  EXPECT_EQ(genres->size(), 2u);
  EXPECT_EQ(genres->at("3"), "News");

  auto empty = std::make_shared<ScriptedHttpTransport>();
  empty->Respond("action=get_genres", R"({"js":[]})");
  StalkerPortalClient empty_client(empty);
  EXPECT_FALSE(empty_client.ListGenres(endpoint_, "t").has_value());
}

TEST_F(PortalClientContractTest, CreateLinkReturnsLastWordOfCmd) {
  transport_->Respond("action=create_link",
                      R"({"js":{"cmd":"ffmpeg http://edge.example/live/101.ts?play_token=9"}})");
  auto link = client_.CreateLink(endpoint_, "t", "ffmpeg http://localhost/ch/101");
  ASSERT_TRUE(link.has_value());
  EXPECT_EQ(*link, "http://edge.example/live/101.ts?play_token=9");

  const auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_NE(requests[0].url.find("cmd=ffmpeg%20http://localhost/ch/101&series=0"),
            std::string::npos);
}

TEST_F(PortalClientContractTest, CreateLinkWithEmptyCmdFails) {
  transport_->Respond("action=create_link", R"({"js":{"cmd":"  "}})");
  EXPECT_FALSE(client_.CreateLink(endpoint_, "t", "ffmpeg x").has_value());
}

TEST_F(PortalClientContractTest, EpgIsGroupedByChannel) {
  transport_->Respond("action=get_epg_info", R"({"js":{"data":{
      "101": [
        {"start_timestamp": 1700000000, "stop_timestamp": "1700003600",
         "name": "Morning News", "descr": "Headlines"},
        {"name": "No times"}
      ],
      "102": []
  }}})");

  auto epg = client_.GetEpg(endpoint_, "t", 24);
  ASSERT_TRUE(epg.has_value());
  ASSERT_EQ(epg->count("101"), 1u);
  ASSERT_EQ(epg->at("101").size(), 1u);
  const auto& programme = epg->at("101")[0];
  EXPECT_EQ(programme.start_timestamp, 1700000000);
  EXPECT_EQ(programme.stop_timestamp, 1700003600);
  EXPECT_EQ(programme.name, "Morning News");
  EXPECT_EQ(programme.description, "Headlines");
  EXPECT_TRUE(epg->at("102").empty());

  EXPECT_EQ(transport_->CountRequests("period=24"), 1u);
}

TEST(PortalClientHelpersTest, ScalarConversionKeepsIntegralForm) {
  EXPECT_EQ(portal::JsonScalarToString(Json::Value(12)), "12");
  EXPECT_EQ(portal::JsonScalarToString(Json::Value(12.0)), "12");
  EXPECT_EQ(portal::JsonScalarToString(Json::Value("abc")), "abc");
  EXPECT_EQ(portal::JsonScalarToString(Json::Value(true)), "true");
  EXPECT_EQ(portal::JsonScalarToString(Json::Value()), "");
  EXPECT_EQ(portal::JsonScalarToString(Json::Value(Json::arrayValue)), "");
}

TEST(PortalClientHelpersTest, QueryEncodingEscapesSpacesOnly) {
  EXPECT_EQ(portal::EncodeQueryValue("ffmpeg http://a/b?c=1"), "ffmpeg%20http://a/b?c=1");
  EXPECT_EQ(portal::EncodeQueryValue("a#b"), "a%23b");
}

TEST(CurlHttpTransportTest, OnlyGatewayErrorsAreRetried) {
  for (long status : {500L, 502L, 503L, 504L}) {
    EXPECT_TRUE(portal::CurlHttpTransport::IsRetryableStatus(status)) << status;
  }
  for (long status : {200L, 301L, 403L, 404L, 501L}) {
    EXPECT_FALSE(portal::CurlHttpTransport::IsRetryableStatus(status)) << status;
  }
}

}  // namespace
}  // namespace macreplay::tests::contracts
