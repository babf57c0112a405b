// Repository: Retrovue-scribe
// Component: Time Source
// Purpose: Production time source backed by the system wall clock.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_TIME_SYSTEM_TIME_SOURCE_HPP_
#define SCRIBE_TIME_SYSTEM_TIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

#include "scribe/time/ITimeSource.hpp"

namespace scribe::time {

// Reads std::chrono::system_clock, so NTP or manual clock changes reach the
// log at the next timestamp refresh. Stateless; one instance can back any
// number of TimestampCaches.
class SystemTimeSource final : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

}  // namespace scribe::time

#endif  // SCRIBE_TIME_SYSTEM_TIME_SOURCE_HPP_
