// Repository: MacReplay-gateway
// Component: Occupancy Table
// Purpose: Per-MAC admission control for concurrent relay sessions.
// Copyright (c) 2025 MacReplay

#ifndef MACREPLAY_RUNTIME_OCCUPANCY_TABLE_H_
#define MACREPLAY_RUNTIME_OCCUPANCY_TABLE_H_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "macreplay/timing/Clock.h"

namespace macreplay::runtime {

struct StreamSession {
  uint64_t session_id = 0;  // Assigned by the table.
  std::string portal_id;
  std::string portal_name;
  std::string mac;
  std::string channel_id;
  std::string channel_name;
  std::string client;
  int64_t start_utc_s = 0;  // Assigned by the table.
};

class OccupancyTable;

// OccupancyLease holds one admitted session. Destroying the lease releases
// the slot, so every exit path of a relay gives its MAC back.
class OccupancyLease {
 public:
  OccupancyLease() = default;
  ~OccupancyLease();

  OccupancyLease(OccupancyLease&& other) noexcept;
  OccupancyLease& operator=(OccupancyLease&& other) noexcept;

  OccupancyLease(const OccupancyLease&) = delete;
  OccupancyLease& operator=(const OccupancyLease&) = delete;

  bool active() const { return table_ != nullptr; }
  const StreamSession& session() const { return session_; }

  // Updates the channel name shown for the session once it is known.
  void SetChannelName(const std::string& name);

  // Releases early. Safe to call more than once.
  void Release();

 private:
  friend class OccupancyTable;
  OccupancyLease(OccupancyTable* table, StreamSession session);

  OccupancyTable* table_ = nullptr;
  StreamSession session_;
};

// OccupancyTable maps portal id to its active sessions. The capacity check
// and the insert happen under one mutex, so concurrent admissions for the
// same MAC never exceed the cap.
class OccupancyTable {
 public:
  explicit OccupancyTable(std::shared_ptr<timing::Clock> clock = timing::MakeSystemClock());

  OccupancyTable(const OccupancyTable&) = delete;
  OccupancyTable& operator=(const OccupancyTable&) = delete;

  // True when `cap` is 0 or fewer than `cap` sessions use this MAC.
  bool IsFree(const std::string& portal_id, const std::string& mac, int cap) const;

  // Admits `session` if its MAC is free under `cap`.
  std::optional<OccupancyLease> TryOccupy(StreamSession session, int cap);

  size_t CountFor(const std::string& portal_id, const std::string& mac) const;

  std::map<std::string, std::vector<StreamSession>> Snapshot() const;
  std::map<std::string, size_t> ActiveCounts() const;
  size_t TotalActive() const;

 private:
  friend class OccupancyLease;

  void Release(const std::string& portal_id, uint64_t session_id);
  void Rename(const std::string& portal_id, uint64_t session_id, const std::string& name);
  size_t CountForLocked(const std::string& portal_id, const std::string& mac) const;

  std::shared_ptr<timing::Clock> clock_;
  mutable std::mutex mutex_;
  uint64_t next_session_id_ = 1;
  std::map<std::string, std::vector<StreamSession>> sessions_;
};

}  // namespace macreplay::runtime

#endif  // MACREPLAY_RUNTIME_OCCUPANCY_TABLE_H_
