// Repository: Retrovue-scribe
// Component: Formatting Writer Configuration
// Purpose: Configuration structure for FormattingWriter.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_LOG_WRITER_CONFIG_HPP_
#define SCRIBE_LOG_WRITER_CONFIG_HPP_

#include <cstddef>

#include "scribe/log/Level.hpp"

namespace scribe::log {

// Host memory-page size, the default buffer capacity.
size_t DefaultBufferCapacity();

// Configuration for FormattingWriter
// POD struct - read once at construction
struct WriterConfig {
  size_t buffer_capacity = DefaultBufferCapacity();  // 0 also selects the default
  Level level = Level::kDebug;                       // initial threshold (most verbose)

  // Defaults overlaid with SCRIBE_LEVEL (level name) and SCRIBE_BUFFER_BYTES
  // (positive integer). Unparseable values are ignored with a warning.
  static WriterConfig FromEnvironment();
};

}  // namespace scribe::log

#endif  // SCRIBE_LOG_WRITER_CONFIG_HPP_
