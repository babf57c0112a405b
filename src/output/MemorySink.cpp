// Repository: Retrovue-scribe
// Component: MemorySink Implementation
// Purpose: IByteSink that accumulates bytes in a shared in-memory buffer.
// Copyright (c) 2025 RetroVue

#include "scribe/output/MemorySink.hpp"

#include <stdexcept>

namespace scribe::output {

void MemoryBuffer::Append(const char* data, size_t len) {
  std::lock_guard<std::mutex> lock(mutex_);
  data_.append(data, len);
  ++write_calls_;
}

std::string MemoryBuffer::Contents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_;
}

size_t MemoryBuffer::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.size();
}

uint64_t MemoryBuffer::WriteCalls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return write_calls_;
}

void MemoryBuffer::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  data_.clear();
  write_calls_ = 0;
}

MemorySink::MemorySink(std::shared_ptr<MemoryBuffer> buffer, std::string name)
    : buffer_(std::move(buffer)), name_(std::move(name)) {
  if (!buffer_) {
    throw std::invalid_argument("MemorySink: buffer must not be null");
  }
}

size_t MemorySink::Write(const char* data, size_t len) {
  buffer_->Append(data, len);
  return len;
}

}  // namespace scribe::output
