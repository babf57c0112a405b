// Repository: Retrovue-scribe
// Component: Formatting Writer Configuration
// Purpose: Configuration structure for FormattingWriter.
// Copyright (c) 2025 RetroVue

#include "scribe/log/WriterConfig.hpp"

#include <cstdlib>
#include <string>

#include <unistd.h>

#include "scribe/util/Diagnostics.hpp"

namespace scribe::log {

namespace {

constexpr size_t kFallbackPageSize = 4096;

}  // namespace

size_t DefaultBufferCapacity() {
  long page = sysconf(_SC_PAGESIZE);
  return page > 0 ? static_cast<size_t>(page) : kFallbackPageSize;
}

WriterConfig WriterConfig::FromEnvironment() {
  WriterConfig config;

  if (const char* level = std::getenv("SCRIBE_LEVEL")) {
    if (auto parsed = ParseLevel(level)) {
      config.level = *parsed;
    } else {
      util::Diagnostics::Warn(std::string("WriterConfig: ignoring SCRIBE_LEVEL=") + level);
    }
  }

  if (const char* bytes = std::getenv("SCRIBE_BUFFER_BYTES")) {
    char* end = nullptr;
    unsigned long long value = std::strtoull(bytes, &end, 10);
    if (end != bytes && *end == '\0' && value > 0 && bytes[0] != '-') {
      config.buffer_capacity = static_cast<size_t>(value);
    } else {
      util::Diagnostics::Warn(std::string("WriterConfig: ignoring SCRIBE_BUFFER_BYTES=") + bytes);
    }
  }

  return config;
}

}  // namespace scribe::log
