// Repository: Retrovue-scribe
// Component: Time Source
// Purpose: Wall-clock reading behind every rendered log timestamp.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_TIME_I_TIME_SOURCE_HPP_
#define SCRIBE_TIME_I_TIME_SOURCE_HPP_

#include <cstdint>

namespace scribe::time {

// ITimeSource is read by timing::TimestampCache, once at construction and
// once per refresh (by default every second, from the refresh thread when it
// runs). Writers never call it directly, so a log line carries the time of
// the last refresh, not the time of the write.
//
// Implementations must be safe to call from any thread. Readings are UTC
// milliseconds since the Unix epoch and need not be monotonic: a clock step
// simply shows up in the next refresh.
class ITimeSource {
 public:
  virtual ~ITimeSource() = default;

  virtual int64_t NowUtcMs() const = 0;
};

// Second containing utc_ms, rounding toward the past so instants before the
// epoch do not render one second late.
inline int64_t FloorToUtcSeconds(int64_t utc_ms) {
  int64_t seconds = utc_ms / 1000;
  if (utc_ms < 0 && utc_ms % 1000 != 0) --seconds;
  return seconds;
}

}  // namespace scribe::time

#endif  // SCRIBE_TIME_I_TIME_SOURCE_HPP_
