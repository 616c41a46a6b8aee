// Repository: MacReplay-gateway
// Component: Metrics Exporter
// Purpose: Collects gateway counters and renders them in Prometheus text format.
// Copyright (c) 2025 MacReplay

#include "macreplay/telemetry/MetricsExporter.h"

#include <sstream>

namespace macreplay::telemetry {

namespace {

// Label values come from configuration; quote and backslash must be escaped.
std::string EscapeLabel(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

}  // namespace

const char* ArtifactToString(Artifact artifact) {
  switch (artifact) {
    case Artifact::kPlaylist:
      return "playlist";
    case Artifact::kLineup:
      return "lineup";
    case Artifact::kXmltv:
      return "xmltv";
  }
  return "unknown";
}

void MetricsExporter::SetSessionSource(SessionSource source) {
  std::lock_guard<std::mutex> lock(mutex_);
  session_source_ = std::move(source);
}

void MetricsExporter::RecordRotation(const std::string& portal_id, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++rotations_[{portal_id, reason}];
}

void MetricsExporter::RecordResolution(const std::string& portal_id,
                                       const std::string& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++resolutions_[{portal_id, result}];
}

void MetricsExporter::RecordRelayExit(const std::string& portal_id, const std::string& status) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++relay_exits_[{portal_id, status}];
}

void MetricsExporter::RecordArtifactRefresh(Artifact artifact, bool success) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++artifact_refreshes_[{artifact, success}];
}

uint64_t MetricsExporter::RotationCount(const std::string& portal_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t total = 0;
  for (const auto& [labels, count] : rotations_) {
    if (labels.first == portal_id) total += count;
  }
  return total;
}

uint64_t MetricsExporter::ResolutionCount(const std::string& portal_id,
                                          const std::string& result) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = resolutions_.find({portal_id, result});
  return it == resolutions_.end() ? 0 : it->second;
}

uint64_t MetricsExporter::RelayExitCount(const std::string& portal_id,
                                         const std::string& status) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = relay_exits_.find({portal_id, status});
  return it == relay_exits_.end() ? 0 : it->second;
}

uint64_t MetricsExporter::ArtifactRefreshCount(Artifact artifact, bool success) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = artifact_refreshes_.find({artifact, success});
  return it == artifact_refreshes_.end() ? 0 : it->second;
}

std::string MetricsExporter::GenerateMetricsText() const {
  SessionSource source;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    source = session_source_;
  }
  // The source takes the occupancy lock; never call it under mutex_.
  const std::map<std::string, size_t> sessions =
      source ? source() : std::map<std::string, size_t>{};

  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream oss;

  oss << "# HELP macreplay_active_sessions Relay sessions currently holding a MAC\n";
  oss << "# TYPE macreplay_active_sessions gauge\n";
  for (const auto& [portal_id, count] : sessions) {
    oss << "macreplay_active_sessions{portal=\"" << EscapeLabel(portal_id) << "\"} " << count
        << "\n";
  }

  oss << "\n# HELP macreplay_mac_rotations_total MACs moved to the tail of their portal\n";
  oss << "# TYPE macreplay_mac_rotations_total counter\n";
  for (const auto& [labels, count] : rotations_) {
    oss << "macreplay_mac_rotations_total{portal=\"" << EscapeLabel(labels.first)
        << "\",reason=\"" << EscapeLabel(labels.second) << "\"} " << count << "\n";
  }

  oss << "\n# HELP macreplay_resolutions_total Channel resolution results\n";
  oss << "# TYPE macreplay_resolutions_total counter\n";
  for (const auto& [labels, count] : resolutions_) {
    oss << "macreplay_resolutions_total{portal=\"" << EscapeLabel(labels.first)
        << "\",result=\"" << EscapeLabel(labels.second) << "\"} " << count << "\n";
  }

  oss << "\n# HELP macreplay_relay_exits_total Relay process terminations\n";
  oss << "# TYPE macreplay_relay_exits_total counter\n";
  for (const auto& [labels, count] : relay_exits_) {
    oss << "macreplay_relay_exits_total{portal=\"" << EscapeLabel(labels.first)
        << "\",status=\"" << EscapeLabel(labels.second) << "\"} " << count << "\n";
  }

  oss << "\n# HELP macreplay_artifact_regenerations_total Playlist, lineup and XMLTV rebuilds\n";
  oss << "# TYPE macreplay_artifact_regenerations_total counter\n";
  for (const auto& [labels, count] : artifact_refreshes_) {
    oss << "macreplay_artifact_regenerations_total{artifact=\"" << ArtifactToString(labels.first)
        << "\",result=\"" << (labels.second ? "ok" : "error") << "\"} " << count << "\n";
  }

  return oss.str();
}

}  // namespace macreplay::telemetry
