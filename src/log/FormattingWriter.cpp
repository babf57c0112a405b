// Repository: Retrovue-scribe
// Component: Formatting Writer
// Purpose: Thread-safe leveled writer rendering lines into a buffered sink.
// Copyright (c) 2025 RetroVue

#include "scribe/log/FormattingWriter.hpp"

#include <stdexcept>

#include "scribe/log/PlaceholderScanner.hpp"
#include "scribe/log/ValueFormatter.hpp"
#include "scribe/log/WriterErrors.hpp"
#include "scribe/util/Diagnostics.hpp"

namespace scribe::log {

namespace {

constexpr std::string_view kEscapeMarker("\\", 1);

// Resolves every placeholder against args without producing output, so a
// bad call is rejected before any byte reaches the buffer.
void ValidateArguments(std::string_view format, const FormatArg* args, size_t count) {
  size_t placeholders = 0;
  PlaceholderScanner(format).Scan(
      [](std::string_view) {},
      [&](const Placeholder& p) {
        if (p.ordinal >= count) {
          throw FormatError("missing argument for \"" + std::string(p.text) + "\" at offset " +
                            std::to_string(p.offset) + " (" + std::to_string(count) +
                            " supplied)");
        }
        const FormatSpec spec = ParseFormatSpec(p.text);
        if (!VerbAccepts(spec.verb, args[p.ordinal].kind())) {
          throw FormatError("\"" + std::string(p.text) + "\" at offset " +
                            std::to_string(p.offset) + " cannot render a " +
                            args[p.ordinal].TypeName() + " argument");
        }
        ++placeholders;
      });
  if (placeholders != count) {
    throw FormatError("format has " + std::to_string(placeholders) + " placeholders but " +
                      std::to_string(count) + " arguments were supplied");
  }
}

}  // namespace

FormattingWriter::FormattingWriter(std::unique_ptr<output::IByteSink> destination,
                                   std::shared_ptr<const timing::TimestampCache> timestamps,
                                   const WriterConfig& config)
    : level_(config.level),
      timestamps_(std::move(timestamps)),
      buffer_capacity_(config.buffer_capacity > 0 ? config.buffer_capacity
                                                  : DefaultBufferCapacity()),
      destination_(std::move(destination)) {
  if (!destination_) {
    throw std::invalid_argument("FormattingWriter: destination must not be null");
  }
  if (!timestamps_) {
    throw std::invalid_argument("FormattingWriter: timestamp cache must not be null");
  }
  stream_ = std::make_unique<output::BufferedStream>(destination_.get(), buffer_capacity_);
}

FormattingWriter::~FormattingWriter() {
  Close();
}

bool FormattingWriter::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!stream_) {
    return true;
  }
  const bool flushed = stream_->Flush();
  if (!flushed) {
    util::Diagnostics::Error("FormattingWriter: dropped " + std::to_string(stream_->Buffered()) +
                             " buffered bytes closing " + destination_->GetName());
  }
  stream_.reset();
  destination_.reset();
  return flushed;
}

size_t FormattingWriter::Write(Level level, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpenLocked("Write");

  const auto checkpoint = stream_->Mark();
  size_t size = AppendHeaderLocked(level, checkpoint);
  size += AppendLocked(message, checkpoint);
  size += AppendLocked(std::string_view(&kEndOfLine, 1), checkpoint);
  return size;
}

size_t FormattingWriter::WriteFormattedArgs(Level level, std::string_view format,
                                            const FormatArg* args, size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpenLocked("WriteFormatted");
  ValidateArguments(format, args, count);

  const auto checkpoint = stream_->Mark();
  size_t size = AppendHeaderLocked(level, checkpoint);
  try {
    PlaceholderScanner(format).Scan(
        [&](std::string_view literal) { size += AppendLocked(literal, checkpoint); },
        [&](const Placeholder& p) {
          for (size_t i = 0; i < p.escaped_markers; ++i) {
            size += AppendLocked(kEscapeMarker, checkpoint);
          }
          scratch_.clear();
          FormatValue(ParseFormatSpec(p.text), args[p.ordinal], &scratch_);
          size += AppendLocked(scratch_, checkpoint);
        });
  } catch (const FormatError&) {
    stream_->Rollback(checkpoint);
    throw;
  }
  size += AppendLocked(std::string_view(&kEndOfLine, 1), checkpoint);
  return size;
}

bool FormattingWriter::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpenLocked("Flush");
  return stream_->Flush();
}

bool FormattingWriter::ResetDestination(std::unique_ptr<output::IByteSink> destination) {
  if (!destination) {
    throw std::invalid_argument("FormattingWriter: destination must not be null");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpenLocked("ResetDestination");

  if (!stream_->Flush()) {
    util::Diagnostics::Warn("FormattingWriter: keeping " + destination_->GetName() + ", " +
                            std::to_string(stream_->Buffered()) +
                            " bytes could not be flushed before switching to " +
                            destination->GetName());
    return false;
  }

  // Released at scope exit, after the stream stops pointing at it.
  std::unique_ptr<output::IByteSink> previous = std::move(destination_);
  destination_ = std::move(destination);
  stream_->Reset(destination_.get());
  return true;
}

bool FormattingWriter::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_ == nullptr;
}

size_t FormattingWriter::Buffered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_ ? stream_->Buffered() : 0;
}

std::string FormattingWriter::DestinationName() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return destination_ ? destination_->GetName() : std::string();
}

void FormattingWriter::EnsureOpenLocked(const char* operation) const {
  if (!stream_) {
    throw WriterClosedError(std::string(operation) + " called on a closed FormattingWriter");
  }
}

size_t FormattingWriter::AppendLocked(std::string_view bytes,
                                      const output::BufferedStream::Checkpoint& cp) {
  if (!stream_->Append(bytes)) {
    const bool clean = stream_->Rollback(cp);
    throw SinkError("FormattingWriter: destination " + destination_->GetName() +
                    " failed while draining the buffer" +
                    (clean ? std::string() : std::string("; part of the line was delivered")));
  }
  return bytes.size();
}

size_t FormattingWriter::AppendHeaderLocked(Level level,
                                            const output::BufferedStream::Checkpoint& cp) {
  const std::shared_ptr<const std::string> timestamp = timestamps_->Current();
  size_t size = AppendLocked(*timestamp, cp);
  size += AppendLocked(LevelPrefix(level), cp);
  return size;
}

}  // namespace scribe::log
