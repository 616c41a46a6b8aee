// Repository: MacReplay-gateway
// Component: Metrics Exporter
// Purpose: Collects gateway counters and renders them in Prometheus text format.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_TELEMETRY_METRICS_EXPORTER_H_
#define MACREPLAY_TELEMETRY_METRICS_EXPORTER_H_

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace macreplay::telemetry {

// Derived artifacts tracked by regeneration counters.
enum class Artifact {
  kPlaylist = 0,
  kLineup = 1,
  kXmltv = 2,
};

const char* ArtifactToString(Artifact artifact);

// MetricsExporter holds counters updated by the resolver, relay manager and
// artifact cache. The HTTP server renders them at /metrics.
//
// Metrics Exported:
// - macreplay_active_sessions{portal="ID"} - gauge
// - macreplay_mac_rotations_total{portal="ID",reason="R"} - counter
// - macreplay_resolutions_total{portal="ID",result="R"} - counter
// - macreplay_relay_exits_total{portal="ID",status="ok|error|killed"} - counter
// - macreplay_artifact_regenerations_total{artifact="A",result="ok|error"} - counter
class MetricsExporter {
 public:
  // Returns active session counts keyed by portal id.
  using SessionSource = std::function<std::map<std::string, size_t>()>;

  MetricsExporter() = default;

  MetricsExporter(const MetricsExporter&) = delete;
  MetricsExporter& operator=(const MetricsExporter&) = delete;

  void SetSessionSource(SessionSource source);

  void RecordRotation(const std::string& portal_id, const std::string& reason);
  void RecordResolution(const std::string& portal_id, const std::string& result);
  void RecordRelayExit(const std::string& portal_id, const std::string& status);
  void RecordArtifactRefresh(Artifact artifact, bool success);

  uint64_t RotationCount(const std::string& portal_id) const;
  uint64_t ResolutionCount(const std::string& portal_id, const std::string& result) const;
  uint64_t RelayExitCount(const std::string& portal_id, const std::string& status) const;
  uint64_t ArtifactRefreshCount(Artifact artifact, bool success) const;

  // Generates Prometheus-format metrics text.
  std::string GenerateMetricsText() const;

 private:
  using LabelPair = std::pair<std::string, std::string>;

  mutable std::mutex mutex_;
  SessionSource session_source_;
  std::map<LabelPair, uint64_t> rotations_;
  std::map<LabelPair, uint64_t> resolutions_;
  std::map<LabelPair, uint64_t> relay_exits_;
  std::map<std::pair<Artifact, bool>, uint64_t> artifact_refreshes_;
};

}  // namespace macreplay::telemetry

#endif  // MACREPLAY_TELEMETRY_METRICS_EXPORTER_H_
