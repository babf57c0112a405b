// Repository: Retrovue-scribe
// Component: IByteSink Interface
// Purpose: Destination that accepts the bytes a buffered stream drains.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_OUTPUT_IBYTE_SINK_HPP_
#define SCRIBE_OUTPUT_IBYTE_SINK_HPP_

#include <cstddef>
#include <string>

namespace scribe::output {

// IByteSink is the final consumer of rendered log bytes (file, socket,
// console, memory).
//
// IByteSink responsibilities:
// - Accept bytes in order and report how many were accepted
// - Release its underlying resource on destruction
//
// IByteSink explicitly does NOT:
// - Buffer on behalf of the writer (BufferedStream does that)
// - Retry failed writes (callers decide whether to flush again)
// - Synchronize concurrent callers (the owning writer serializes access)
class IByteSink {
 public:
  virtual ~IByteSink() = default;

  // Writes up to len bytes. Returns the number accepted; anything less than
  // len means the sink failed and the remainder was not written.
  virtual size_t Write(const char* data, size_t len) = 0;

  // Returns a human-readable name for this sink (for diagnostics).
  virtual std::string GetName() const = 0;
};

}  // namespace scribe::output

#endif  // SCRIBE_OUTPUT_IBYTE_SINK_HPP_
