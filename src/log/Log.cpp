// Repository: Retrovue-scribe
// Component: Log Façade
// Purpose: Named-severity entry points gated by the writer's threshold.
// Copyright (c) 2025 RetroVue

#include "scribe/log/Log.hpp"

#include <stdexcept>

namespace scribe::log {

Log::Log(std::shared_ptr<FormattingWriter> writer) : writer_(std::move(writer)) {
  if (!writer_) {
    throw std::invalid_argument("Log: writer must not be null");
  }
}

}  // namespace scribe::log
