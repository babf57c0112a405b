// Repository: Retrovue-scribe
// Component: Log Façade
// Purpose: Named-severity entry points gated by the writer's threshold.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_LOG_LOG_HPP_
#define SCRIBE_LOG_LOG_HPP_

#include <memory>
#include <string_view>

#include "scribe/log/FormattingWriter.hpp"
#include "scribe/log/Level.hpp"

namespace scribe::log {

// Log is the call-site API. It owns no state of its own: the threshold and
// the output both belong to the shared FormattingWriter, so several Log
// handles can front one writer.
//
// A call is emitted only when its level is >= the writer's threshold;
// suppressed calls never take the writer's lock and never format.
// Errors from the writer (FormatError, SinkError, WriterClosedError) propagate.
class Log {
 public:
  // Throws std::invalid_argument if writer is null.
  explicit Log(std::shared_ptr<FormattingWriter> writer);

  bool Enabled(Level level) const { return level >= writer_->GetLevel(); }

  void Debug(std::string_view message) { Emit(Level::kDebug, message); }
  void Trace(std::string_view message) { Emit(Level::kTrace, message); }
  void Info(std::string_view message) { Emit(Level::kInfo, message); }
  void Warn(std::string_view message) { Emit(Level::kWarn, message); }
  void Error(std::string_view message) { Emit(Level::kError, message); }
  void Critical(std::string_view message) { Emit(Level::kCritical, message); }

  template <typename... Args>
  void Debugf(std::string_view format, const Args&... args) { Emitf(Level::kDebug, format, args...); }
  template <typename... Args>
  void Tracef(std::string_view format, const Args&... args) { Emitf(Level::kTrace, format, args...); }
  template <typename... Args>
  void Infof(std::string_view format, const Args&... args) { Emitf(Level::kInfo, format, args...); }
  template <typename... Args>
  void Warnf(std::string_view format, const Args&... args) { Emitf(Level::kWarn, format, args...); }
  template <typename... Args>
  void Errorf(std::string_view format, const Args&... args) { Emitf(Level::kError, format, args...); }
  template <typename... Args>
  void Criticalf(std::string_view format, const Args&... args) {
    Emitf(Level::kCritical, format, args...);
  }

  FormattingWriter& writer() const { return *writer_; }

 private:
  void Emit(Level level, std::string_view message) {
    if (Enabled(level)) writer_->Write(level, message);
  }

  template <typename... Args>
  void Emitf(Level level, std::string_view format, const Args&... args) {
    if (Enabled(level)) writer_->WriteFormatted(level, format, args...);
  }

  std::shared_ptr<FormattingWriter> writer_;
};

}  // namespace scribe::log

#endif  // SCRIBE_LOG_LOG_HPP_
