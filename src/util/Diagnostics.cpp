// Repository: Retrovue-scribe
// Component: Library Diagnostics
// Purpose: Mutex-protected emission of the library's own operational messages.
// Copyright (c) 2025 RetroVue

#include "scribe/util/Diagnostics.hpp"

#include <cstdlib>
#include <iostream>

namespace scribe::util {

std::mutex Diagnostics::mutex_;
std::function<void(const std::string&)> Diagnostics::capture_sink_;

void Diagnostics::SetCaptureSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  capture_sink_ = std::move(sink);
}

void Diagnostics::Debug(const std::string& line) {
  if (std::getenv("SCRIBE_DEBUG") == nullptr) return;
  Emit("DEBUG", line, false);
}

void Diagnostics::Warn(const std::string& line) {
  Emit("WARN", line, true);
}

void Diagnostics::Error(const std::string& line) {
  Emit("ERROR", line, true);
}

void Diagnostics::Emit(const char* tag, const std::string& line, bool capture) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (capture && capture_sink_) {
    capture_sink_(line);
  }
  std::cerr << "[scribe " << tag << "] " << line << '\n';
  std::cerr.flush();
}

}  // namespace scribe::util
