// Repository: MacReplay-gateway
// Component: Occupancy Table
// Purpose: Per-MAC admission control for concurrent relay sessions.
// Copyright (c) 2025 MacReplay

#include "macreplay/runtime/OccupancyTable.h"

#include <algorithm>

#include "macreplay/util/Logger.hpp"

namespace macreplay::runtime {

using macreplay::util::Logger;

OccupancyLease::OccupancyLease(OccupancyTable* table, StreamSession session)
    : table_(table), session_(std::move(session)) {}

OccupancyLease::~OccupancyLease() { Release(); }

OccupancyLease::OccupancyLease(OccupancyLease&& other) noexcept
    : table_(other.table_), session_(std::move(other.session_)) {
  other.table_ = nullptr;
}

OccupancyLease& OccupancyLease::operator=(OccupancyLease&& other) noexcept {
  if (this != &other) {
    Release();
    table_ = other.table_;
    session_ = std::move(other.session_);
    other.table_ = nullptr;
  }
  return *this;
}

void OccupancyLease::SetChannelName(const std::string& name) {
  session_.channel_name = name;
  if (table_) {
    table_->Rename(session_.portal_id, session_.session_id, name);
  }
}

void OccupancyLease::Release() {
  if (!table_) return;
  table_->Release(session_.portal_id, session_.session_id);
  table_ = nullptr;
}

OccupancyTable::OccupancyTable(std::shared_ptr<timing::Clock> clock)
    : clock_(std::move(clock)) {}

size_t OccupancyTable::CountForLocked(const std::string& portal_id,
                                      const std::string& mac) const {
  auto it = sessions_.find(portal_id);
  if (it == sessions_.end()) return 0;
  return static_cast<size_t>(
      std::count_if(it->second.begin(), it->second.end(),
                    [&](const StreamSession& session) { return session.mac == mac; }));
}

bool OccupancyTable::IsFree(const std::string& portal_id, const std::string& mac,
                            int cap) const {
  if (cap <= 0) return true;
  std::lock_guard<std::mutex> lock(mutex_);
  return CountForLocked(portal_id, mac) < static_cast<size_t>(cap);
}

std::optional<OccupancyLease> OccupancyTable::TryOccupy(StreamSession session, int cap) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cap > 0 && CountForLocked(session.portal_id, session.mac) >= static_cast<size_t>(cap)) {
    return std::nullopt;
  }
  session.session_id = next_session_id_++;
  session.start_utc_s = clock_->now_utc_s();
  sessions_[session.portal_id].push_back(session);
  Logger::Debug("[Occupancy] Portal(" + session.portal_id + "):MAC(" + session.mac +
                "): occupied by " + session.client);
  return OccupancyLease(this, std::move(session));
}

size_t OccupancyTable::CountFor(const std::string& portal_id, const std::string& mac) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CountForLocked(portal_id, mac);
}

std::map<std::string, std::vector<StreamSession>> OccupancyTable::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_;
}

std::map<std::string, size_t> OccupancyTable::ActiveCounts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, size_t> counts;
  for (const auto& [portal_id, sessions] : sessions_) {
    counts[portal_id] = sessions.size();
  }
  return counts;
}

size_t OccupancyTable::TotalActive() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t total = 0;
  for (const auto& [portal_id, sessions] : sessions_) {
    total += sessions.size();
  }
  return total;
}

void OccupancyTable::Release(const std::string& portal_id, uint64_t session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(portal_id);
  if (it == sessions_.end()) return;
  auto& list = it->second;
  list.erase(std::remove_if(list.begin(), list.end(),
                            [&](const StreamSession& s) { return s.session_id == session_id; }),
             list.end());
  if (list.empty()) {
    sessions_.erase(it);
  }
  Logger::Debug("[Occupancy] Portal(" + portal_id + "): session " +
                std::to_string(session_id) + " released");
}

void OccupancyTable::Rename(const std::string& portal_id, uint64_t session_id,
                            const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(portal_id);
  if (it == sessions_.end()) return;
  for (auto& session : it->second) {
    if (session.session_id == session_id) {
      session.channel_name = name;
      return;
    }
  }
}

}  // namespace macreplay::runtime
