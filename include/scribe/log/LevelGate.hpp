// Repository: Retrovue-scribe
// Component: Level Gate
// Purpose: Holds the severity threshold of a writer.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_LOG_LEVEL_GATE_HPP_
#define SCRIBE_LOG_LEVEL_GATE_HPP_

#include <atomic>

#include "scribe/log/Level.hpp"

namespace scribe::log {

// LevelGate stores and reports a threshold. It does not decide whether a
// particular call is emitted; the Log façade compares against Get().
//
// The threshold is read on every façade call and written rarely, so it is an
// atomic scalar rather than living under the writer's mutex.
class LevelGate {
 public:
  explicit LevelGate(Level initial = Level::kDebug) : level_(initial) {}

  LevelGate(const LevelGate&) = delete;
  LevelGate& operator=(const LevelGate&) = delete;

  Level Get() const { return level_.load(std::memory_order_acquire); }
  void Set(Level level) { level_.store(level, std::memory_order_release); }

  // True when a message at `level` passes the threshold.
  bool Allows(Level level) const { return level >= Get(); }

 private:
  std::atomic<Level> level_;
};

}  // namespace scribe::log

#endif  // SCRIBE_LOG_LEVEL_GATE_HPP_
