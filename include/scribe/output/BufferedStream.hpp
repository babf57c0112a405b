// Repository: Retrovue-scribe
// Component: BufferedStream
// Purpose: Fixed-capacity accumulation buffer drained into an IByteSink.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_OUTPUT_BUFFERED_STREAM_HPP_
#define SCRIBE_OUTPUT_BUFFERED_STREAM_HPP_

#include <cstdint>
#include <string_view>
#include <vector>

#include "scribe/output/IByteSink.hpp"

namespace scribe::output {

// BufferedStream copies appended bytes into a fixed buffer and hands them to
// the sink in bulk.
//
// - Append() drains the buffer first when the bytes do not fit, and writes
//   straight through when they are at least as large as the whole buffer.
// - Flush() writes everything buffered. On a short sink write the accepted
//   prefix is dropped from the buffer and the rest stays for the next Flush().
// - Mark()/Rollback() let a caller undo a partially appended record.
//
// Not thread-safe: the owning FormattingWriter serializes every call.
// The sink is borrowed; the caller keeps it alive while it is bound.
class BufferedStream {
 public:
  // Position in the logical byte sequence, for Rollback().
  struct Checkpoint {
    uint64_t appended = 0;
  };

  // Throws std::invalid_argument if sink is null or capacity is zero.
  BufferedStream(IByteSink* sink, size_t capacity);

  BufferedStream(const BufferedStream&) = delete;
  BufferedStream& operator=(const BufferedStream&) = delete;

  // Returns false if a drain needed to make room failed. In that case none of
  // `data` was buffered, except for the straight-through path, where the
  // sink may have accepted a prefix.
  bool Append(const char* data, size_t len);
  bool Append(std::string_view bytes) { return Append(bytes.data(), bytes.size()); }
  bool AppendByte(char c) { return Append(&c, 1); }

  // Returns true once the buffer is empty.
  bool Flush();

  // Discards buffered bytes and binds a new sink. Capacity is kept.
  // Callers that must not lose bytes Flush() first.
  void Reset(IByteSink* sink);

  Checkpoint Mark() const { return Checkpoint{appended_total_}; }

  // Removes everything appended after cp that is still buffered. Returns
  // false if some of those bytes had already reached the sink.
  bool Rollback(const Checkpoint& cp);

  size_t Buffered() const { return len_; }
  size_t Available() const { return buf_.size() - len_; }
  size_t Capacity() const { return buf_.size(); }
  IByteSink* sink() const { return sink_; }

  uint64_t TotalAppended() const { return appended_total_; }
  uint64_t TotalDrained() const { return drained_total_; }

 private:
  IByteSink* sink_;
  std::vector<char> buf_;
  size_t len_ = 0;

  // appended_total_ - drained_total_ == len_ at all times.
  uint64_t appended_total_ = 0;
  uint64_t drained_total_ = 0;
};

}  // namespace scribe::output

#endif  // SCRIBE_OUTPUT_BUFFERED_STREAM_HPP_
