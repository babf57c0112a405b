// Repository: Retrovue-scribe
// Component: Timestamp Cache
// Purpose: Pre-rendered "now" bytes refreshed on a fixed cadence.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_TIMING_TIMESTAMP_CACHE_HPP_
#define SCRIBE_TIMING_TIMESTAMP_CACHE_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "scribe/time/ITimeSource.hpp"

namespace scribe::timing {

// TimestampCache renders the current time once per refresh and hands out an
// immutable snapshot, so writers append a timestamp without formatting it.
//
// Layout of a snapshot: "YYYY/MM/DD hh:mm:ss " (UTC, trailing space).
//
// Refresh cadence is owned here: either call Refresh() from your own loop or
// Start() the internal refresh thread. Current() is safe from any thread.
class TimestampCache {
 public:
  static constexpr std::chrono::milliseconds kDefaultRefreshInterval{1000};

  explicit TimestampCache(std::shared_ptr<const time::ITimeSource> source,
                          std::chrono::milliseconds refresh_interval = kDefaultRefreshInterval);
  ~TimestampCache();

  TimestampCache(const TimestampCache&) = delete;
  TimestampCache& operator=(const TimestampCache&) = delete;

  // Latest rendered timestamp. Never null.
  std::shared_ptr<const std::string> Current() const;

  // Re-renders from the time source now.
  void Refresh();

  // Starts the refresh thread. Returns false if it is already running.
  bool Start();

  // Stops and joins the refresh thread. Safe to call multiple times.
  void Stop();

  bool IsRunning() const;

  std::chrono::milliseconds RefreshInterval() const { return refresh_interval_; }

  // Renders utc_ms in the snapshot layout.
  static std::string Render(int64_t utc_ms);

 private:
  void RefreshLoop();

  std::shared_ptr<const time::ITimeSource> source_;
  std::chrono::milliseconds refresh_interval_;

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const std::string> snapshot_;

  mutable std::mutex thread_mutex_;
  std::condition_variable stop_cv_;
  std::thread refresh_thread_;
  bool stop_requested_ = false;
  bool running_ = false;
};

}  // namespace scribe::timing

#endif  // SCRIBE_TIMING_TIMESTAMP_CACHE_HPP_
