// Repository: Retrovue-scribe
// Component: FormattingWriter unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "scribe/log/FormattingWriter.hpp"
#include "scribe/log/WriterErrors.hpp"
#include "scribe/output/MemorySink.hpp"
#include "support/WriterTestUtils.hpp"

namespace scribe::log {
namespace {

using scribe::test::kPinnedStamp;
using scribe::test::kPinnedStampSize;
using scribe::test::Line;
using scribe::test::MakeMemoryWriter;
using scribe::test::MakePinnedTimestamps;
using scribe::test::MemoryDestination;

class FormattingWriterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    buffer_ = std::make_shared<output::MemoryBuffer>();
    writer_ = MakeMemoryWriter(buffer_);
  }

  std::string Flushed() {
    EXPECT_TRUE(writer_->Flush());
    return buffer_->Contents();
  }

  std::shared_ptr<output::MemoryBuffer> buffer_;
  std::unique_ptr<FormattingWriter> writer_;
};

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------
TEST(FormattingWriterConstructionTest, RejectsNullCollaborators) {
  auto buffer = std::make_shared<output::MemoryBuffer>();
  EXPECT_THROW({ FormattingWriter writer(nullptr, MakePinnedTimestamps()); },
               std::invalid_argument);
  EXPECT_THROW({ FormattingWriter writer(MemoryDestination(buffer), nullptr); },
               std::invalid_argument);
}

TEST(FormattingWriterConstructionTest, ZeroCapacitySelectsDefault) {
  auto buffer = std::make_shared<output::MemoryBuffer>();
  WriterConfig config;
  config.buffer_capacity = 0;
  config.level = Level::kError;
  FormattingWriter writer(MemoryDestination(buffer, "mem0"), MakePinnedTimestamps(), config);
  EXPECT_EQ(writer.BufferCapacity(), DefaultBufferCapacity());
  EXPECT_EQ(writer.GetLevel(), Level::kError);
  EXPECT_EQ(writer.DestinationName(), "mem0");
  EXPECT_FALSE(writer.IsClosed());
}

// -----------------------------------------------------------------------------
// Plain writes
// -----------------------------------------------------------------------------
TEST_F(FormattingWriterTest, WriteFramesMessageWithTimestampAndPrefix) {
  const size_t n = writer_->Write(Level::kInfo, "hello");
  EXPECT_EQ(n, kPinnedStampSize + 7 + 5 + 1);
  EXPECT_EQ(Flushed(), std::string(kPinnedStamp) + "[INFO] hello\n");
}

TEST_F(FormattingWriterTest, ReturnedSizeMatchesBytesProduced) {
  size_t total = 0;
  for (Level level : kAllLevels) {
    total += writer_->Write(level, "m");
  }
  EXPECT_EQ(total, buffer_->Size() + writer_->Buffered());
  EXPECT_EQ(Flushed().size(), total);
}

TEST_F(FormattingWriterTest, WriteDoesNotInterpretPlaceholders) {
  writer_->Write(Level::kWarn, "50% done, %d left \\% ok");
  EXPECT_EQ(Flushed(), Line("[WARN] ", "50% done, %d left \\% ok"));
}

TEST_F(FormattingWriterTest, EmptyMessageStillProducesALine) {
  EXPECT_EQ(writer_->Write(Level::kDebug, ""), kPinnedStampSize + 8 + 1);
  EXPECT_EQ(Flushed(), Line("[DEBUG] ", ""));
}

TEST_F(FormattingWriterTest, WritesAreBufferedUntilFlush) {
  writer_->Write(Level::kInfo, "pending");
  EXPECT_EQ(buffer_->Size(), 0u);
  EXPECT_EQ(writer_->Buffered(), Line("[INFO] ", "pending").size());
  EXPECT_EQ(Flushed(), Line("[INFO] ", "pending"));
  EXPECT_EQ(writer_->Buffered(), 0u);
}

TEST_F(FormattingWriterTest, WriteIgnoresTheThreshold) {
  writer_->SetLevel(Level::kCritical);
  writer_->Write(Level::kDebug, "still written");
  EXPECT_EQ(Flushed(), Line("[DEBUG] ", "still written"));
}

TEST_F(FormattingWriterTest, LevelRoundTrips) {
  EXPECT_EQ(writer_->GetLevel(), Level::kDebug);
  writer_->SetLevel(Level::kWarn);
  EXPECT_EQ(writer_->GetLevel(), Level::kWarn);
}

// -----------------------------------------------------------------------------
// Formatted writes
// -----------------------------------------------------------------------------
TEST_F(FormattingWriterTest, FormatsPositionalArguments) {
  const size_t n = writer_->WriteFormatted(Level::kInfo, "hello %s, you are %d", "bob", 3);
  EXPECT_EQ(n, kPinnedStampSize + std::string("[INFO] hello bob, you are 3\n").size());
  EXPECT_EQ(Flushed(), Line("[INFO] ", "hello bob, you are 3"));
}

TEST_F(FormattingWriterTest, FormatsMixedArgumentKinds) {
  const std::string who = "svc";
  writer_->WriteFormatted(Level::kError, "%s failed after %v (code=%#x, retry=%t, load=%.1f)",
                          who, std::chrono::milliseconds(1500), 255, false, 0.7);
  EXPECT_EQ(Flushed(),
            Line("[ERROR] ", "svc failed after 1.5s (code=0xff, retry=false, load=0.7)"));
}

TEST_F(FormattingWriterTest, FormatWithoutPlaceholdersNeedsNoArguments) {
  writer_->WriteFormatted(Level::kInfo, "static text");
  EXPECT_EQ(Flushed(), Line("[INFO] ", "static text"));
}

TEST_F(FormattingWriterTest, EscapedPercentIsLiteral) {
  writer_->WriteFormatted(Level::kInfo, "%d\\% complete", 40);
  EXPECT_EQ(Flushed(), Line("[INFO] ", "40% complete"));
}

TEST_F(FormattingWriterTest, DoubledEscapeInsidePlaceholderEmitsBackslashBeforeValue) {
  writer_->WriteFormatted(Level::kInfo, "path=%\\\\s", "tmp");
  EXPECT_EQ(Flushed(), Line("[INFO] ", "path=\\tmp"));
}

TEST_F(FormattingWriterTest, DoubledEscapeBeforePlaceholderKeepsOneBackslash) {
  writer_->WriteFormatted(Level::kInfo, "dir=C:\\\\%s done", "logs");
  EXPECT_EQ(Flushed(), Line("[INFO] ", "dir=C:\\logs done"));
}

TEST_F(FormattingWriterTest, UnterminatedPlaceholderIsCopiedVerbatim) {
  writer_->WriteFormatted(Level::kInfo, "%d items at 50%", 3);
  EXPECT_EQ(Flushed(), Line("[INFO] ", "3 items at 50%"));
}

TEST_F(FormattingWriterTest, ArgumentVectorOverload) {
  std::vector<FormatArg> args{FormatArg("x"), FormatArg(1.5)};
  const size_t n = writer_->WriteFormattedArgs(Level::kTrace, "%s=%v", args);
  EXPECT_EQ(n, Line("[TRACE] ", "x=1.5").size());
  EXPECT_EQ(Flushed(), Line("[TRACE] ", "x=1.5"));
}

// -----------------------------------------------------------------------------
// Format errors append nothing
// -----------------------------------------------------------------------------
TEST_F(FormattingWriterTest, MissingArgumentIsFormatError) {
  writer_->Write(Level::kInfo, "before");
  const size_t buffered = writer_->Buffered();
  EXPECT_THROW(writer_->WriteFormatted(Level::kInfo, "%d and %d", 1), FormatError);
  EXPECT_EQ(writer_->Buffered(), buffered);
  EXPECT_EQ(Flushed(), Line("[INFO] ", "before"));
}

TEST_F(FormattingWriterTest, SurplusArgumentIsFormatError) {
  EXPECT_THROW(writer_->WriteFormatted(Level::kInfo, "%d", 1, 2), FormatError);
  EXPECT_THROW(writer_->WriteFormatted(Level::kInfo, "no placeholders", 1), FormatError);
  EXPECT_EQ(writer_->Buffered(), 0u);
}

TEST_F(FormattingWriterTest, InapplicableVerbIsFormatError) {
  EXPECT_THROW(writer_->WriteFormatted(Level::kInfo, "ok %s then %d", "a", "b"), FormatError);
  EXPECT_THROW(writer_->WriteFormatted(Level::kInfo, "%zd", 1), FormatError);
  EXPECT_EQ(writer_->Buffered(), 0u);
}

TEST_F(FormattingWriterTest, WriterStaysUsableAfterFormatError) {
  EXPECT_THROW(writer_->WriteFormatted(Level::kInfo, "%d"), FormatError);
  writer_->WriteFormatted(Level::kInfo, "%d", 7);
  EXPECT_EQ(Flushed(), Line("[INFO] ", "7"));
}

// -----------------------------------------------------------------------------
// Flush and buffer sizing
// -----------------------------------------------------------------------------
TEST_F(FormattingWriterTest, FlushIsIdempotent) {
  writer_->Write(Level::kInfo, "once");
  EXPECT_TRUE(writer_->Flush());
  EXPECT_TRUE(writer_->Flush());
  EXPECT_EQ(buffer_->Contents(), Line("[INFO] ", "once"));
  EXPECT_EQ(buffer_->WriteCalls(), 1u);
}

TEST(FormattingWriterSizingTest, FullBufferDrainsWithoutExplicitFlush) {
  auto buffer = std::make_shared<output::MemoryBuffer>();
  const size_t line = Line("[INFO] ", "0123456789").size();
  auto writer = MakeMemoryWriter(buffer, line * 2);

  writer->Write(Level::kInfo, "0123456789");
  writer->Write(Level::kInfo, "0123456789");
  EXPECT_EQ(buffer->Size(), 0u);

  writer->Write(Level::kInfo, "0123456789");
  EXPECT_EQ(buffer->Size(), line * 2);
  EXPECT_EQ(writer->Buffered(), line);
}

TEST(FormattingWriterSizingTest, MessageLargerThanBufferIsDelivered) {
  auto buffer = std::make_shared<output::MemoryBuffer>();
  auto writer = MakeMemoryWriter(buffer, 64);

  const std::string big(500, 'x');
  const size_t n = writer->Write(Level::kInfo, big);
  EXPECT_EQ(n, Line("[INFO] ", big).size());
  ASSERT_TRUE(writer->Flush());
  EXPECT_EQ(buffer->Contents(), Line("[INFO] ", big));
}

// -----------------------------------------------------------------------------
// Close
// -----------------------------------------------------------------------------
TEST_F(FormattingWriterTest, CloseDeliversBufferedLinesExactlyOnce) {
  writer_->Write(Level::kInfo, "last words");
  EXPECT_TRUE(writer_->Close());
  EXPECT_EQ(buffer_->Contents(), Line("[INFO] ", "last words"));
  EXPECT_TRUE(writer_->IsClosed());
  EXPECT_EQ(writer_->Buffered(), 0u);
  EXPECT_EQ(writer_->DestinationName(), "");

  EXPECT_TRUE(writer_->Close());
  EXPECT_EQ(buffer_->Contents(), Line("[INFO] ", "last words"));
}

TEST_F(FormattingWriterTest, UseAfterCloseThrows) {
  ASSERT_TRUE(writer_->Close());
  auto other = std::make_shared<output::MemoryBuffer>();

  EXPECT_THROW(writer_->Write(Level::kInfo, "x"), WriterClosedError);
  EXPECT_THROW(writer_->WriteFormatted(Level::kInfo, "%d", 1), WriterClosedError);
  EXPECT_THROW(writer_->Flush(), WriterClosedError);
  EXPECT_THROW(writer_->ResetDestination(MemoryDestination(other)), WriterClosedError);
  EXPECT_EQ(buffer_->Size(), 0u);
  EXPECT_EQ(other->Size(), 0u);

  writer_->SetLevel(Level::kError);
  EXPECT_EQ(writer_->GetLevel(), Level::kError);
}

TEST(FormattingWriterLifetimeTest, DestructorFlushes) {
  auto buffer = std::make_shared<output::MemoryBuffer>();
  {
    auto writer = MakeMemoryWriter(buffer);
    writer->Write(Level::kCritical, "going down");
  }
  EXPECT_EQ(buffer->Contents(), Line("[CRITICAL] ", "going down"));
}

}  // namespace
}  // namespace scribe::log
