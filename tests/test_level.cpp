// Repository: Retrovue-scribe
// Component: Level catalog and gate unit tests

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>

#include "scribe/log/Level.hpp"
#include "scribe/log/LevelGate.hpp"

namespace scribe::log {
namespace {

TEST(LevelTest, DeclarationOrderIsSeverityOrder) {
  for (size_t i = 1; i < kAllLevels.size(); ++i) {
    EXPECT_LT(kAllLevels[i - 1], kAllLevels[i]);
  }
  EXPECT_EQ(kAllLevels.front(), Level::kDebug);
  EXPECT_EQ(kAllLevels.back(), Level::kCritical);
}

TEST(LevelTest, PrefixesAreBracketedNamesWithTrailingSpace) {
  EXPECT_EQ(LevelPrefix(Level::kDebug), "[DEBUG] ");
  EXPECT_EQ(LevelPrefix(Level::kTrace), "[TRACE] ");
  EXPECT_EQ(LevelPrefix(Level::kInfo), "[INFO] ");
  EXPECT_EQ(LevelPrefix(Level::kWarn), "[WARN] ");
  EXPECT_EQ(LevelPrefix(Level::kError), "[ERROR] ");
  EXPECT_EQ(LevelPrefix(Level::kCritical), "[CRITICAL] ");

  for (Level level : kAllLevels) {
    EXPECT_EQ(LevelPrefix(level), "[" + std::string(LevelName(level)) + "] ");
  }
}

TEST(LevelTest, ParseIsCaseInsensitive) {
  EXPECT_EQ(ParseLevel("debug"), Level::kDebug);
  EXPECT_EQ(ParseLevel("Trace"), Level::kTrace);
  EXPECT_EQ(ParseLevel("INFO"), Level::kInfo);
  EXPECT_EQ(ParseLevel("warn"), Level::kWarn);
  EXPECT_EQ(ParseLevel("Warning"), Level::kWarn);
  EXPECT_EQ(ParseLevel("error"), Level::kError);
  EXPECT_EQ(ParseLevel("CRITICAL"), Level::kCritical);
}

TEST(LevelTest, ParseRejectsUnknownNames) {
  EXPECT_FALSE(ParseLevel("").has_value());
  EXPECT_FALSE(ParseLevel("fatal").has_value());
  EXPECT_FALSE(ParseLevel("info ").has_value());
}

TEST(LevelGateTest, DefaultsToMostVerbose) {
  LevelGate gate;
  EXPECT_EQ(gate.Get(), Level::kDebug);
  for (Level level : kAllLevels) {
    EXPECT_TRUE(gate.Allows(level));
  }
}

TEST(LevelGateTest, AllowsOnlyLevelsAtOrAboveThreshold) {
  LevelGate gate(Level::kWarn);
  EXPECT_FALSE(gate.Allows(Level::kDebug));
  EXPECT_FALSE(gate.Allows(Level::kTrace));
  EXPECT_FALSE(gate.Allows(Level::kInfo));
  EXPECT_TRUE(gate.Allows(Level::kWarn));
  EXPECT_TRUE(gate.Allows(Level::kError));
  EXPECT_TRUE(gate.Allows(Level::kCritical));

  gate.Set(Level::kCritical);
  EXPECT_EQ(gate.Get(), Level::kCritical);
  EXPECT_FALSE(gate.Allows(Level::kError));
}

// Readers only ever observe values that some writer stored.
TEST(LevelGateTest, ConcurrentSetAndGetSeeOnlyStoredValues) {
  LevelGate gate(Level::kInfo);
  std::atomic<bool> stop{false};
  std::atomic<int> bad_reads{0};

  std::thread writer([&] {
    for (int i = 0; i < 20000; ++i) {
      gate.Set(i % 2 == 0 ? Level::kInfo : Level::kError);
    }
    stop.store(true);
  });
  std::thread reader([&] {
    while (!stop.load()) {
      Level l = gate.Get();
      if (l != Level::kInfo && l != Level::kError) bad_reads.fetch_add(1);
    }
  });
  writer.join();
  reader.join();
  EXPECT_EQ(bad_reads.load(), 0);
}

}  // namespace
}  // namespace scribe::log
