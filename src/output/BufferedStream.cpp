// Repository: Retrovue-scribe
// Component: BufferedStream Implementation
// Purpose: Fixed-capacity accumulation buffer drained into an IByteSink.
// Copyright (c) 2025 RetroVue

#include "scribe/output/BufferedStream.hpp"

#include <cstring>
#include <stdexcept>

namespace scribe::output {

BufferedStream::BufferedStream(IByteSink* sink, size_t capacity)
    : sink_(sink) {
  if (sink_ == nullptr) {
    throw std::invalid_argument("BufferedStream: sink must not be null");
  }
  if (capacity == 0) {
    throw std::invalid_argument("BufferedStream: capacity must be positive");
  }
  buf_.resize(capacity);
}

bool BufferedStream::Append(const char* data, size_t len) {
  if (len == 0) {
    return true;
  }

  if (len > Available()) {
    if (!Flush()) {
      return false;
    }
  }

  if (len >= buf_.size()) {
    // Buffer is empty here; copying would only add a second pass.
    size_t n = sink_->Write(data, len);
    if (n > len) n = len;
    appended_total_ += n;
    drained_total_ += n;
    return n == len;
  }

  std::memcpy(buf_.data() + len_, data, len);
  len_ += len;
  appended_total_ += len;
  return true;
}

bool BufferedStream::Flush() {
  if (len_ == 0) {
    return true;
  }

  size_t n = sink_->Write(buf_.data(), len_);
  if (n > len_) n = len_;
  drained_total_ += n;

  if (n < len_) {
    std::memmove(buf_.data(), buf_.data() + n, len_ - n);
    len_ -= n;
    return false;
  }
  len_ = 0;
  return true;
}

void BufferedStream::Reset(IByteSink* sink) {
  if (sink == nullptr) {
    throw std::invalid_argument("BufferedStream: sink must not be null");
  }
  drained_total_ += len_;
  len_ = 0;
  sink_ = sink;
}

bool BufferedStream::Rollback(const Checkpoint& cp) {
  if (cp.appended >= drained_total_) {
    size_t excess = static_cast<size_t>(appended_total_ - cp.appended);
    len_ -= excess;
    appended_total_ = cp.appended;
    return true;
  }
  // Every buffered byte belongs to the record being undone.
  appended_total_ -= len_;
  len_ = 0;
  return false;
}

}  // namespace scribe::output
