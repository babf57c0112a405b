// Repository: Retrovue-scribe
// Component: Writer Errors
// Purpose: Exceptions surfaced by FormattingWriter calls.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_LOG_WRITER_ERRORS_HPP_
#define SCRIBE_LOG_WRITER_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace scribe::log {

// A placeholder could not be resolved against the supplied arguments
// (count mismatch, bad modifiers, verb not applicable to the argument).
// The call appended nothing; the writer remains usable.
class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

// The sink failed while a write needed room in the buffer. The message was
// rolled back out of the buffer; see FormattingWriter::Write.
class SinkError : public std::runtime_error {
 public:
  explicit SinkError(const std::string& what) : std::runtime_error(what) {}
};

// Write, WriteFormatted, Flush or ResetDestination called after Close().
class WriterClosedError : public std::logic_error {
 public:
  explicit WriterClosedError(const std::string& what) : std::logic_error(what) {}
};

}  // namespace scribe::log

#endif  // SCRIBE_LOG_WRITER_ERRORS_HPP_
