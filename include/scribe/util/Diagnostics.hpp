// Repository: Retrovue-scribe
// Component: Library Diagnostics
// Purpose: Mutex-protected emission of the library's own operational messages.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_UTIL_DIAGNOSTICS_HPP_
#define SCRIBE_UTIL_DIAGNOSTICS_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace scribe::util {

// Diagnostics reports problems inside scribe itself (sink write failures,
// bytes dropped on close, refresh thread lifecycle). It never goes through a
// FormattingWriter: the writer may be the thing that is broken.
//
// Each call acquires one static mutex and writes the full line plus '\n' to
// stderr, so concurrent diagnostics never interleave.
//
// Debug → stderr only when SCRIBE_DEBUG env is set
// Warn  → stderr (degraded but recoverable: a sink rejected bytes)
// Error → stderr (data loss: bytes dropped on close)
//
// Test-only: SetCaptureSink installs a callback that receives every Warn()
// and Error() line in addition to stderr.
class Diagnostics {
 public:
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Test-only: call with nullptr to clear.
  static void SetCaptureSink(std::function<void(const std::string&)> sink);

 private:
  static void Emit(const char* tag, const std::string& line, bool capture);

  static std::mutex mutex_;
  static std::function<void(const std::string&)> capture_sink_;
};

}  // namespace scribe::util

#endif  // SCRIBE_UTIL_DIAGNOSTICS_HPP_
