// Repository: MacReplay-gateway
// Component: Artifact Cache
// Purpose: Process-wide cache of the playlist, lineup and XMLTV guide with
//          per-artifact invalidation.
// Copyright (c) 2025 MacReplay

#include "macreplay/cache/ArtifactCache.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "macreplay/cache/PlaylistBuilder.h"
#include "macreplay/cache/PortalCatalog.h"
#include "macreplay/cache/XmltvDocument.h"
#include "macreplay/util/Logger.hpp"

namespace macreplay::cache {

using macreplay::util::Logger;

ArtifactCache::ArtifactCache(config::ConfigStore& store,
                             std::shared_ptr<portal::IPortalClient> client,
                             std::shared_ptr<timing::Clock> clock, ArtifactCacheOptions options,
                             std::shared_ptr<telemetry::MetricsExporter> metrics)
    : store_(store),
      client_(std::move(client)),
      clock_(std::move(clock)),
      options_(std::move(options)),
      metrics_(std::move(metrics)) {}

ArtifactCache::~ArtifactCache() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    if (worker.joinable()) worker.join();
  }
}

void ArtifactCache::RecordRefresh(telemetry::Artifact artifact, bool success) {
  if (metrics_) {
    metrics_->RecordArtifactRefresh(artifact, success);
  }
}

// ---------------------------------------------------------------------------
// Playlist
// ---------------------------------------------------------------------------

std::string ArtifactCache::BuildPlaylist(const std::string& host) {
  Logger::Info("[ArtifactCache] Generating playlist.m3u for host " + host);
  const config::Settings settings = store_.GetSettings();

  std::vector<PlaylistEntry> entries;
  for (const auto& portal : store_.GetEnabledPortals()) {
    if (portal.enabled_channels.empty()) continue;

    CatalogRequest request;
    request.genres = true;
    auto catalog = FetchPortalCatalog(*client_, portal, request);
    if (!catalog) {
      Logger::Error("[ArtifactCache] Error making playlist for " + portal.name + ", skipping");
      RecordRefresh(telemetry::Artifact::kPlaylist, false);
      continue;
    }
    auto portal_entries = CollectPlaylistEntries(portal, catalog->channels, catalog->genres);
    entries.insert(entries.end(), std::make_move_iterator(portal_entries.begin()),
                   std::make_move_iterator(portal_entries.end()));
  }

  std::string text = RenderPlaylist(std::move(entries), host, settings);
  RecordRefresh(telemetry::Artifact::kPlaylist, true);
  Logger::Info("[ArtifactCache] Playlist generated and cached");
  return text;
}

std::string ArtifactCache::Playlist(const std::string& host) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (playlist_ && !playlist_->text.empty() && playlist_->host == host) {
      return playlist_->text;
    }
  }
  return RegeneratePlaylist(host);
}

std::string ArtifactCache::RegeneratePlaylist(const std::string& host) {
  auto slot = std::make_shared<PlaylistSlot>();
  slot->host = host;
  slot->text = BuildPlaylist(host);
  std::string text = slot->text;
  std::lock_guard<std::mutex> lock(mutex_);
  playlist_ = std::move(slot);
  return text;
}

// ---------------------------------------------------------------------------
// Lineup
// ---------------------------------------------------------------------------

std::vector<LineupEntry> ArtifactCache::BuildLineup() {
  Logger::Info("[ArtifactCache] Refreshing lineup");
  std::vector<LineupEntry> lineup;
  for (const auto& portal : store_.GetEnabledPortals()) {
    if (portal.enabled_channels.empty()) continue;

    auto catalog = FetchPortalCatalog(*client_, portal, CatalogRequest{});
    if (!catalog) {
      Logger::Error("[ArtifactCache] Error making lineup for " + portal.name + ", skipping");
      RecordRefresh(telemetry::Artifact::kLineup, false);
      continue;
    }
    auto entries = CollectLineupEntries(portal, catalog->channels, options_.lineup_host);
    lineup.insert(lineup.end(), std::make_move_iterator(entries.begin()),
                  std::make_move_iterator(entries.end()));
  }
  SortLineup(lineup);
  RecordRefresh(telemetry::Artifact::kLineup, true);
  Logger::Info("[ArtifactCache] Lineup refreshed with " + std::to_string(lineup.size()) +
               " channels");
  return lineup;
}

std::vector<LineupEntry> ArtifactCache::Lineup() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (lineup_ && !lineup_->empty()) {
      return *lineup_;
    }
  }
  return RefreshLineup();
}

std::string ArtifactCache::LineupJson() { return LineupToJson(Lineup()); }

std::vector<LineupEntry> ArtifactCache::RefreshLineup() {
  auto lineup = std::make_shared<const std::vector<LineupEntry>>(BuildLineup());
  std::lock_guard<std::mutex> lock(mutex_);
  lineup_ = lineup;
  return *lineup;
}

// ---------------------------------------------------------------------------
// XMLTV
// ---------------------------------------------------------------------------

std::string ArtifactCache::ReadEpgFile() const {
  if (options_.epg_cache_path.empty()) return "";
  std::ifstream in(options_.epg_cache_path, std::ios::binary);
  if (!in) return "";
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

void ArtifactCache::WriteEpgFile(const std::string& text) const {
  if (options_.epg_cache_path.empty()) return;
  std::error_code ec;
  const auto parent = std::filesystem::path(options_.epg_cache_path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      Logger::Error("[ArtifactCache] Cannot create " + parent.string() + ": " + ec.message());
      return;
    }
  }
  std::ofstream out(options_.epg_cache_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Logger::Error("[ArtifactCache] Cannot write guide cache " + options_.epg_cache_path);
    return;
  }
  out << text;
}

std::string ArtifactCache::BuildXmltv() {
  Logger::Info("[ArtifactCache] Refreshing XMLTV");
  const int64_t now = clock_->now_utc_s();
  const int64_t cutoff = now - kXmltvRetentionSeconds;

  XmltvListing listing;
  for (const auto& portal : store_.GetEnabledPortals()) {
    if (portal.enabled_channels.empty()) continue;
    Logger::Info("[ArtifactCache] Fetching EPG | Portal: " + portal.name +
                 " | offset: " + std::to_string(portal.epg_offset_hours));

    CatalogRequest request;
    request.epg = true;
    request.epg_period_hours = options_.epg_period_hours;
    auto catalog = FetchPortalCatalog(*client_, portal, request);
    if (!catalog) {
      Logger::Error("[ArtifactCache] Error making XMLTV for " + portal.name + ", skipping");
      RecordRefresh(telemetry::Artifact::kXmltv, false);
      continue;
    }
    AppendPortalListing(portal, catalog->channels, catalog->epg, now, cutoff, listing);
  }

  std::string previous = ReadEpgFile();
  if (previous.empty()) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (xmltv_) previous = xmltv_->text;
  }
  std::string text = BuildXmltvDocument(listing, previous, cutoff);
  WriteEpgFile(text);
  RecordRefresh(telemetry::Artifact::kXmltv, true);
  Logger::Info("[ArtifactCache] XMLTV cache updated");
  return text;
}

std::string ArtifactCache::PublishXmltvLocked() {
  auto slot = std::make_shared<XmltvSlot>();
  slot->text = BuildXmltv();
  slot->generated_at_s = clock_->now_utc_s();
  std::string text = slot->text;
  std::lock_guard<std::mutex> lock(mutex_);
  xmltv_ = std::move(slot);
  return text;
}

std::string ArtifactCache::RefreshXmltv() {
  std::lock_guard<std::mutex> refresh_lock(xmltv_refresh_mutex_);
  return PublishXmltvLocked();
}

std::string ArtifactCache::Xmltv() {
  auto fresh = [this]() -> std::shared_ptr<const XmltvSlot> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (xmltv_ && clock_->now_utc_s() - xmltv_->generated_at_s <= kXmltvMaxAgeSeconds) {
      return xmltv_;
    }
    return nullptr;
  };

  if (auto slot = fresh()) return slot->text;

  std::lock_guard<std::mutex> refresh_lock(xmltv_refresh_mutex_);
  // Another request may have rebuilt the guide while this one waited.
  if (auto slot = fresh()) return slot->text;
  return PublishXmltvLocked();
}

void ArtifactCache::InvalidateXmltv() {
  std::lock_guard<std::mutex> lock(mutex_);
  xmltv_.reset();
}

void ArtifactCache::StartBackgroundRefresh() {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  workers_.emplace_back([this] { RefreshLineup(); });
  workers_.emplace_back([this] { RefreshXmltv(); });
}

}  // namespace macreplay::cache
