// Repository: MacReplay-gateway
// Component: Playlist and Lineup Contract Tests
// Purpose: Customization precedence, entry format and ordering of the M3U and lineup.
// Copyright (c) 2025 MacReplay

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include <json/json.h>

#include "fixtures/FakePortalClient.h"
#include "macreplay/cache/LineupBuilder.h"
#include "macreplay/cache/PlaylistBuilder.h"

namespace macreplay::tests::contracts {
namespace {

using cache::PlaylistEntry;
using fixtures::MakeChannel;

config::Portal MakePortal() {
  config::Portal portal;
  portal.id = "p1";
  portal.name = "Alpha";
  portal.enabled_channels = {"10", "11", "12"};
  return portal;
}

std::vector<portal::Channel> Channels() {
  return {MakeChannel("10", "News", "5", "3"), MakeChannel("11", "Kids", "3", "4"),
          MakeChannel("12", "Movies", "12", "99"), MakeChannel("13", "Hidden", "1", "3")};
}

PlaylistEntry Entry(const std::string& id, const std::string& name, const std::string& number,
                    const std::string& genre) {
  PlaylistEntry entry;
  entry.portal_id = "p1";
  entry.channel_id = id;
  entry.name = name;
  entry.number = number;
  entry.genre = genre;
  entry.epg_id = name;
  return entry;
}

TEST(PlaylistContractTest, OnlyEnabledChannelsWithCustomizations) {
  config::Portal portal = MakePortal();
  portal.custom_names["10"] = "News HD";
  portal.custom_numbers["11"] = "103";
  portal.custom_genres["12"] = "Cinema";
  portal.custom_epg_ids["11"] = "kids.uk";
  const portal::GenreMap genres = {{"3", "News"}, {"4", "Family"}};

  const auto entries = cache::CollectPlaylistEntries(portal, Channels(), genres);
  ASSERT_EQ(entries.size(), 3u);

  EXPECT_EQ(entries[0].name, "News HD");
  EXPECT_EQ(entries[0].epg_id, "News HD");
  EXPECT_EQ(entries[0].genre, "News");
  EXPECT_EQ(entries[0].number, "5");

  EXPECT_EQ(entries[1].number, "103");
  EXPECT_EQ(entries[1].epg_id, "kids.uk");
  EXPECT_EQ(entries[1].genre, "Family");

  EXPECT_EQ(entries[2].genre, "Cinema");
}

TEST(PlaylistContractTest, UnknownGenreIsEmpty) {
  config::Portal portal = MakePortal();
  const auto entries = cache::CollectPlaylistEntries(portal, Channels(), {});
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_TRUE(entries[0].genre.empty());
}

TEST(PlaylistContractTest, EntryFormatFollowsSettings) {
  config::Settings settings;
  const PlaylistEntry entry = Entry("10", "News", "5", "Kids");
  EXPECT_EQ(cache::FormatPlaylistEntry(entry, "gw:8001", settings),
            "#EXTINF:-1 tvg-id=\"News\" tvg-chno=\"5\" group-title=\"Kids\",News\n"
            "http://gw:8001/play/p1/10");

  settings.use_channel_numbers = false;
  settings.use_channel_genres = false;
  EXPECT_EQ(cache::FormatPlaylistEntry(entry, "gw:8001", settings),
            "#EXTINF:-1 tvg-id=\"News\",News\nhttp://gw:8001/play/p1/10");
}

TEST(PlaylistContractTest, RenderedPlaylistHasHeaderAndNoTrailingNewline) {
  config::Settings settings;
  settings.use_channel_numbers = false;
  settings.use_channel_genres = false;
  const std::string text = cache::RenderPlaylist(
      {Entry("1", "A", "1", ""), Entry("2", "B", "2", "")}, "h", settings);
  EXPECT_EQ(text,
            "#EXTM3U \n"
            "#EXTINF:-1 tvg-id=\"A\",A\nhttp://h/play/p1/1\n"
            "#EXTINF:-1 tvg-id=\"B\",B\nhttp://h/play/p1/2");

  EXPECT_EQ(cache::RenderPlaylist({}, "h", settings), "#EXTM3U \n");
}

TEST(PlaylistContractTest, NumberSortIsNumericAware) {
  config::Settings settings;
  const std::string text = cache::RenderPlaylist(
      {Entry("1", "Ten", "10", ""), Entry("2", "Nine", "9", ""), Entry("3", "Text", "x", "")},
      "h", settings);
  const size_t nine = text.find(",Nine");
  const size_t ten = text.find(",Ten");
  const size_t other = text.find(",Text");
  EXPECT_LT(nine, ten);
  EXPECT_LT(ten, other);
}

TEST(PlaylistContractTest, GenreSortWinsOverNumberSort) {
  config::Settings settings;
  settings.sort_by_genre = true;
  const std::string text = cache::RenderPlaylist(
      {Entry("1", "N2", "2", "News"), Entry("2", "K9", "9", "Kids"),
       Entry("3", "N1", "1", "News"), Entry("4", "K3", "3", "Kids")},
      "h", settings);
  const size_t k3 = text.find(",K3");
  const size_t k9 = text.find(",K9");
  const size_t n1 = text.find(",N1");
  const size_t n2 = text.find(",N2");
  EXPECT_LT(k3, k9);
  EXPECT_LT(k9, n1);
  EXPECT_LT(n1, n2);
}

TEST(PlaylistContractTest, NameSortWhenNumbersAreOff) {
  config::Settings settings;
  settings.use_channel_numbers = false;
  settings.sort_by_name = true;
  const std::string text = cache::RenderPlaylist(
      {Entry("1", "Zulu", "1", ""), Entry("2", "Alpha", "2", "")}, "h", settings);
  EXPECT_LT(text.find(",Alpha"), text.find(",Zulu"));
}

TEST(PlaylistContractTest, ChannelNumberOrdering) {
  EXPECT_TRUE(cache::ChannelNumberLess("2", "10"));
  EXPECT_FALSE(cache::ChannelNumberLess("10", "2"));
  EXPECT_TRUE(cache::ChannelNumberLess("99", "abc"));
  EXPECT_FALSE(cache::ChannelNumberLess("abc", "99"));
  EXPECT_TRUE(cache::ChannelNumberLess("a", "b"));
  EXPECT_FALSE(cache::ChannelNumberLess("5", "5"));
}

TEST(LineupContractTest, EntriesAreSortedAndUseLineupHost) {
  config::Portal portal = MakePortal();
  portal.custom_names["11"] = "Kids+";
  auto lineup = cache::CollectLineupEntries(portal, Channels(), "127.0.0.1:8001");
  cache::SortLineup(lineup);

  ASSERT_EQ(lineup.size(), 3u);
  EXPECT_EQ(lineup[0].guide_number, "3");
  EXPECT_EQ(lineup[0].guide_name, "Kids+");
  EXPECT_EQ(lineup[0].url, "http://127.0.0.1:8001/play/p1/11");
  EXPECT_EQ(lineup[1].guide_number, "5");
  EXPECT_EQ(lineup[2].guide_number, "12");
}

TEST(LineupContractTest, JsonUsesHdHomeRunFieldNames) {
  const std::vector<cache::LineupEntry> lineup = {
      cache::LineupEntry{"5", "News", "http://h/play/p1/10"}};
  const std::string text = cache::LineupToJson(lineup);

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  std::istringstream in(text);
  ASSERT_TRUE(Json::parseFromStream(builder, in, &root, &errors)) << errors;
  ASSERT_TRUE(root.isArray());
  ASSERT_EQ(root.size(), 1u);
  EXPECT_EQ(root[0]["GuideNumber"].asString(), "5");
  EXPECT_EQ(root[0]["GuideName"].asString(), "News");
  EXPECT_EQ(root[0]["URL"].asString(), "http://h/play/p1/10");
  EXPECT_EQ(text.find('\n'), std::string::npos);

  EXPECT_EQ(cache::LineupToJson({}), "[]");
}

}  // namespace
}  // namespace macreplay::tests::contracts
