// Repository: MacReplay-gateway
// Component: Artifact Cache
// Purpose: Process-wide cache of the playlist, lineup and XMLTV guide with
//          per-artifact invalidation.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_CACHE_ARTIFACT_CACHE_H_
#define MACREPLAY_CACHE_ARTIFACT_CACHE_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "macreplay/cache/LineupBuilder.h"
#include "macreplay/config/ConfigStore.h"
#include "macreplay/portal/PortalClient.h"
#include "macreplay/telemetry/MetricsExporter.h"
#include "macreplay/timing/Clock.h"

namespace macreplay::cache {

// Guide regeneration age.
inline constexpr int64_t kXmltvMaxAgeSeconds = 900;
// Programmes ending before now minus this are dropped from the guide.
inline constexpr int64_t kXmltvRetentionSeconds = 2 * 24 * 3600;

struct ArtifactCacheOptions {
  std::string lineup_host = "127.0.0.1:8001";  // Host used in lineup URLs.
  std::string epg_cache_path;                  // Empty: the guide is not mirrored on disk.
  int epg_period_hours = 24;
};

// ArtifactCache publishes each artifact as an immutable value swapped in under
// a mutex. Builders run outside the lock; readers never see a partial build.
// Only EPG refreshes are serialized, since they read and rewrite the disk file.
class ArtifactCache {
 public:
  ArtifactCache(config::ConfigStore& store, std::shared_ptr<portal::IPortalClient> client,
                std::shared_ptr<timing::Clock> clock, ArtifactCacheOptions options,
                std::shared_ptr<telemetry::MetricsExporter> metrics = nullptr);
  ~ArtifactCache();

  ArtifactCache(const ArtifactCache&) = delete;
  ArtifactCache& operator=(const ArtifactCache&) = delete;

  // Cached playlist; rebuilt when empty or when `host` differs from the host
  // it was built for.
  std::string Playlist(const std::string& host);
  std::string RegeneratePlaylist(const std::string& host);

  // Cached lineup; built on first use.
  std::vector<LineupEntry> Lineup();
  std::string LineupJson();
  std::vector<LineupEntry> RefreshLineup();

  // Cached guide; rebuilt when missing or older than kXmltvMaxAgeSeconds.
  std::string Xmltv();
  std::string RefreshXmltv();
  // Forgets the cached guide so the next request rebuilds it.
  void InvalidateXmltv();

  // Refreshes lineup and guide on worker threads. The threads are joined by
  // the destructor.
  void StartBackgroundRefresh();

 private:
  struct PlaylistSlot {
    std::string host;
    std::string text;
  };
  struct XmltvSlot {
    std::string text;
    int64_t generated_at_s = 0;
  };

  std::string BuildPlaylist(const std::string& host);
  std::vector<LineupEntry> BuildLineup();
  std::string BuildXmltv();
  // Caller holds xmltv_refresh_mutex_.
  std::string PublishXmltvLocked();

  std::string ReadEpgFile() const;
  void WriteEpgFile(const std::string& text) const;
  void RecordRefresh(telemetry::Artifact artifact, bool success);

  config::ConfigStore& store_;
  std::shared_ptr<portal::IPortalClient> client_;
  std::shared_ptr<timing::Clock> clock_;
  const ArtifactCacheOptions options_;
  std::shared_ptr<telemetry::MetricsExporter> metrics_;

  mutable std::mutex mutex_;
  std::shared_ptr<const PlaylistSlot> playlist_;
  std::shared_ptr<const std::vector<LineupEntry>> lineup_;
  std::shared_ptr<const XmltvSlot> xmltv_;

  std::mutex xmltv_refresh_mutex_;

  std::mutex workers_mutex_;
  std::vector<std::thread> workers_;
};

}  // namespace macreplay::cache

#endif  // MACREPLAY_CACHE_ARTIFACT_CACHE_H_
