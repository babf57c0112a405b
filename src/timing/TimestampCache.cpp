// Repository: Retrovue-scribe
// Component: Timestamp Cache
// Purpose: Pre-rendered "now" bytes refreshed on a fixed cadence.
// Copyright (c) 2025 RetroVue

#include "scribe/timing/TimestampCache.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

#include "scribe/util/Diagnostics.hpp"

namespace scribe::timing {

TimestampCache::TimestampCache(std::shared_ptr<const time::ITimeSource> source,
                               std::chrono::milliseconds refresh_interval)
    : source_(std::move(source)), refresh_interval_(refresh_interval) {
  if (!source_) {
    throw std::invalid_argument("TimestampCache: time source must not be null");
  }
  if (refresh_interval_.count() <= 0) {
    refresh_interval_ = kDefaultRefreshInterval;
  }
  Refresh();
}

TimestampCache::~TimestampCache() {
  Stop();
}

std::shared_ptr<const std::string> TimestampCache::Current() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

void TimestampCache::Refresh() {
  auto rendered = std::make_shared<const std::string>(Render(source_->NowUtcMs()));
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(rendered);
}

bool TimestampCache::Start() {
  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (running_) return false;
  stop_requested_ = false;
  running_ = true;
  refresh_thread_ = std::thread(&TimestampCache::RefreshLoop, this);
  util::Diagnostics::Debug("TimestampCache: refresh thread started (interval_ms=" +
                           std::to_string(refresh_interval_.count()) + ")");
  return true;
}

void TimestampCache::Stop() {
  {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (!running_) return;
    stop_requested_ = true;
    stop_cv_.notify_all();
  }
  if (refresh_thread_.joinable()) {
    refresh_thread_.join();
  }
  std::lock_guard<std::mutex> lock(thread_mutex_);
  running_ = false;
  util::Diagnostics::Debug("TimestampCache: refresh thread stopped");
}

bool TimestampCache::IsRunning() const {
  std::lock_guard<std::mutex> lock(thread_mutex_);
  return running_;
}

void TimestampCache::RefreshLoop() {
  while (true) {
    std::unique_lock<std::mutex> lock(thread_mutex_);
    if (stop_cv_.wait_for(lock, refresh_interval_, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    Refresh();
  }
}

std::string TimestampCache::Render(int64_t utc_ms) {
  time_t s = static_cast<time_t>(time::FloorToUtcSeconds(utc_ms));
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) {
    return "0000/00/00 00:00:00 ";
  }
  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d/%02d/%02d %02d:%02d:%02d ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) {
    return "0000/00/00 00:00:00 ";
  }
  return std::string(buf, static_cast<size_t>(n));
}

}  // namespace scribe::timing
