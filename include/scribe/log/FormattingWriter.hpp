// Repository: Retrovue-scribe
// Component: Formatting Writer
// Purpose: Thread-safe leveled writer rendering lines into a buffered sink.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_LOG_FORMATTING_WRITER_HPP_
#define SCRIBE_LOG_FORMATTING_WRITER_HPP_

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "scribe/log/FormatArg.hpp"
#include "scribe/log/Level.hpp"
#include "scribe/log/LevelGate.hpp"
#include "scribe/log/WriterConfig.hpp"
#include "scribe/output/BufferedStream.hpp"
#include "scribe/output/IByteSink.hpp"
#include "scribe/timing/TimestampCache.hpp"

namespace scribe::log {

// FormattingWriter appends one line per call to a buffered view over its
// destination:
//
//   timestamp ++ level prefix ++ body ++ '\n'
//
// and returns exactly the number of bytes appended for that line.
//
// Every operation that touches the buffer or the destination holds one
// mutex for its whole duration, so lines from concurrent callers never
// interleave and a destination swap only happens between lines. The level
// threshold lives in an atomic LevelGate outside that mutex.
//
// Writes only copy into memory unless the buffer is full, in which case the
// calling thread drains it to the destination synchronously.
//
// Errors:
//   FormatError        bad format/arguments; nothing appended.
//   SinkError          destination failed while making room; line rolled back.
//   WriterClosedError  Write/WriteFormatted/Flush/ResetDestination after Close().
//   Flush/ResetDestination/Close return false when the destination fails.
class FormattingWriter {
 public:
  static constexpr char kEndOfLine = '\n';

  // Throws std::invalid_argument if destination or timestamps is null.
  FormattingWriter(std::unique_ptr<output::IByteSink> destination,
                   std::shared_ptr<const timing::TimestampCache> timestamps,
                   const WriterConfig& config = WriterConfig());

  // Closes the writer if the caller has not.
  ~FormattingWriter();

  FormattingWriter(const FormattingWriter&) = delete;
  FormattingWriter& operator=(const FormattingWriter&) = delete;

  // Flushes, then releases the buffer and the destination. Returns false if
  // the final flush failed (the unflushed bytes are dropped and reported via
  // util::Diagnostics). Calling Close() again is a no-op returning true.
  bool Close();

  Level GetLevel() const { return level_.Get(); }
  void SetLevel(Level level) { level_.Set(level); }

  // Appends the message verbatim; no placeholder interpretation.
  size_t Write(Level level, std::string_view message);

  // Renders format against args, e.g.
  //   writer.WriteFormatted(Level::kInfo, "hello %s, you are %d", name, 3);
  template <typename... Args>
  size_t WriteFormatted(Level level, std::string_view format, const Args&... args) {
    const std::array<FormatArg, sizeof...(Args)> packed{{FormatArg(args)...}};
    return WriteFormattedArgs(level, format, packed.data(), packed.size());
  }

  size_t WriteFormattedArgs(Level level, std::string_view format,
                            const FormatArg* args, size_t count);
  size_t WriteFormattedArgs(Level level, std::string_view format,
                            const std::vector<FormatArg>& args) {
    return WriteFormattedArgs(level, format, args.data(), args.size());
  }

  // Drains buffered bytes to the destination. Idempotent. On failure the
  // bytes the destination did not accept stay buffered for the next Flush().
  bool Flush();

  // Flushes into the current destination, then binds the buffer to
  // `destination` and releases the old one. If that flush fails the old
  // destination and its buffered bytes are kept and false is returned.
  // Throws std::invalid_argument if destination is null.
  bool ResetDestination(std::unique_ptr<output::IByteSink> destination);

  bool IsClosed() const;
  size_t BufferCapacity() const { return buffer_capacity_; }
  // Bytes currently held in the buffer; 0 once closed.
  size_t Buffered() const;
  // GetName() of the current destination; empty once closed.
  std::string DestinationName() const;

 private:
  void EnsureOpenLocked(const char* operation) const;
  size_t AppendLocked(std::string_view bytes, const output::BufferedStream::Checkpoint& cp);
  size_t AppendHeaderLocked(Level level, const output::BufferedStream::Checkpoint& cp);

  LevelGate level_;
  std::shared_ptr<const timing::TimestampCache> timestamps_;
  const size_t buffer_capacity_;

  mutable std::mutex mutex_;
  std::unique_ptr<output::IByteSink> destination_;
  std::unique_ptr<output::BufferedStream> stream_;  // null once closed
  std::string scratch_;                             // one rendered value
};

}  // namespace scribe::log

#endif  // SCRIBE_LOG_FORMATTING_WRITER_HPP_
