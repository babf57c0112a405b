// Repository: Retrovue-scribe
// Component: Level Catalog
// Purpose: Ordered severities and their stable line prefixes.
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_LOG_LEVEL_HPP_
#define SCRIBE_LOG_LEVEL_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace scribe::log {

// Severity of a message. Declaration order is the total order:
// kDebug < kTrace < kInfo < kWarn < kError < kCritical.
enum class Level : uint8_t {
  kDebug,
  kTrace,
  kInfo,
  kWarn,
  kError,
  kCritical,
};

inline constexpr std::array<Level, 6> kAllLevels = {
    Level::kDebug, Level::kTrace, Level::kInfo,
    Level::kWarn,  Level::kError, Level::kCritical,
};

// Upper-case name ("DEBUG", "INFO", ...).
std::string_view LevelName(Level level);

// Bytes written in front of every message body, e.g. "[INFO] ".
// The returned view refers to static storage.
std::string_view LevelPrefix(Level level);

// Case-insensitive name lookup; "warning" is accepted for kWarn.
std::optional<Level> ParseLevel(std::string_view name);

}  // namespace scribe::log

#endif  // SCRIBE_LOG_LEVEL_HPP_
