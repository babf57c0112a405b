// Repository: Retrovue-scribe
// Component: MemorySink
// Purpose: IByteSink that accumulates bytes in a shared in-memory buffer.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_OUTPUT_MEMORY_SINK_HPP_
#define SCRIBE_OUTPUT_MEMORY_SINK_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "scribe/output/IByteSink.hpp"

namespace scribe::output {

// MemoryBuffer outlives the sink that fills it, so callers can inspect what
// was delivered after the writer has swapped or closed the sink.
class MemoryBuffer {
 public:
  void Append(const char* data, size_t len);

  std::string Contents() const;
  size_t Size() const;
  uint64_t WriteCalls() const;
  void Clear();

 private:
  mutable std::mutex mutex_;
  std::string data_;
  uint64_t write_calls_ = 0;
};

class MemorySink : public IByteSink {
 public:
  explicit MemorySink(std::shared_ptr<MemoryBuffer> buffer, std::string name = "memory");

  size_t Write(const char* data, size_t len) override;
  std::string GetName() const override { return name_; }

  const std::shared_ptr<MemoryBuffer>& buffer() const { return buffer_; }

 private:
  std::shared_ptr<MemoryBuffer> buffer_;
  std::string name_;
};

}  // namespace scribe::output

#endif  // SCRIBE_OUTPUT_MEMORY_SINK_HPP_
