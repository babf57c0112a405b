// Repository: Retrovue-scribe
// Component: Level Catalog
// Purpose: Ordered severities and their stable line prefixes.
// Copyright (c) 2025 RetroVue

#include "scribe/log/Level.hpp"

#include <cctype>

namespace scribe::log {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) !=
        std::toupper(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string_view LevelName(Level level) {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kTrace: return "TRACE";
    case Level::kInfo: return "INFO";
    case Level::kWarn: return "WARN";
    case Level::kError: return "ERROR";
    case Level::kCritical: return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string_view LevelPrefix(Level level) {
  switch (level) {
    case Level::kDebug: return "[DEBUG] ";
    case Level::kTrace: return "[TRACE] ";
    case Level::kInfo: return "[INFO] ";
    case Level::kWarn: return "[WARN] ";
    case Level::kError: return "[ERROR] ";
    case Level::kCritical: return "[CRITICAL] ";
  }
  return "[UNKNOWN] ";
}

std::optional<Level> ParseLevel(std::string_view name) {
  for (Level level : kAllLevels) {
    if (EqualsIgnoreCase(name, LevelName(level))) {
      return level;
    }
  }
  if (EqualsIgnoreCase(name, "WARNING")) {
    return Level::kWarn;
  }
  return std::nullopt;
}

}  // namespace scribe::log
