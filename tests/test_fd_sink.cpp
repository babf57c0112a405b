// Repository: Retrovue-scribe
// Component: FdSink unit tests

#include <gtest/gtest.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include "scribe/log/FormattingWriter.hpp"
#include "scribe/log/WriterErrors.hpp"
#include "scribe/output/FdSink.hpp"
#include "scribe/util/Diagnostics.hpp"
#include "support/WriterTestUtils.hpp"

namespace scribe::output {
namespace {

std::string MakeTempDir() {
  std::string root = "/tmp/scribe_fd_sink_test_" + std::to_string(getpid());
  if (mkdir(root.c_str(), 0755) != 0 && errno != EEXIST) {
    root = "/tmp";  // fallback
  }
  return root;
}

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::string ReadAvailable(int fd, size_t expected) {
  std::string out;
  char buf[256];
  while (out.size() < expected) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n <= 0) break;
    out.append(buf, static_cast<size_t>(n));
  }
  return out;
}

// Ignores SIGPIPE for the scope, the way scribe_cat runs.
class ScopedIgnoreSigpipe {
 public:
  ScopedIgnoreSigpipe() {
    struct sigaction ignore = {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    installed_ = ::sigaction(SIGPIPE, &ignore, &previous_) == 0;
  }
  ~ScopedIgnoreSigpipe() {
    if (installed_) ::sigaction(SIGPIPE, &previous_, nullptr);
  }

  bool installed() const { return installed_; }

 private:
  struct sigaction previous_ = {};
  bool installed_ = false;
};

class CapturedDiagnostics {
 public:
  CapturedDiagnostics() {
    util::Diagnostics::SetCaptureSink([this](const std::string& line) { lines_.push_back(line); });
  }
  ~CapturedDiagnostics() { util::Diagnostics::SetCaptureSink(nullptr); }

  const std::vector<std::string>& lines() const { return lines_; }

 private:
  std::vector<std::string> lines_;
};

// -----------------------------------------------------------------------------
// Files
// -----------------------------------------------------------------------------
TEST(FdSinkTest, OpenFileCreatesAndAppends) {
  const std::string path = MakeTempDir() + "/append.log";
  ::unlink(path.c_str());

  {
    auto sink = FdSink::OpenFile(path);
    EXPECT_EQ(sink->GetName(), "file:" + path);
    EXPECT_EQ(sink->Write("first\n", 6), 6u);
    EXPECT_EQ(sink->GetBytesWritten(), 6u);
    EXPECT_EQ(sink->GetWriteErrors(), 0u);
  }
  {
    auto sink = FdSink::OpenFile(path);
    EXPECT_EQ(sink->Write("second\n", 7), 7u);
  }

  EXPECT_EQ(ReadFile(path), "first\nsecond\n");

  struct stat st;
  ASSERT_EQ(::stat(path.c_str(), &st), 0);
  EXPECT_TRUE(S_ISREG(st.st_mode));
}

TEST(FdSinkTest, OpenFileFailureThrows) {
  EXPECT_THROW(FdSink::OpenFile("/nonexistent-dir/scribe/x.log"), std::runtime_error);
}

TEST(FdSinkTest, RejectsNegativeDescriptor) {
  EXPECT_THROW({ FdSink sink(-1, false, "bad"); }, std::invalid_argument);
}

TEST(FdSinkTest, StandardStreamsAreNotOwned) {
  {
    auto out = FdSink::Stdout();
    auto err = FdSink::Stderr();
    EXPECT_EQ(out->GetName(), "stdout");
    EXPECT_EQ(err->GetName(), "stderr");
    EXPECT_EQ(out->fd(), STDOUT_FILENO);
  }
  // Still open after the sinks are gone.
  EXPECT_NE(::fcntl(STDOUT_FILENO, F_GETFD), -1);
}

// -----------------------------------------------------------------------------
// Pipes and sockets
// -----------------------------------------------------------------------------
TEST(FdSinkTest, OwnedDescriptorIsClosedOnDestruction) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  {
    FdSink sink(fds[1], true, "pipe");
    EXPECT_EQ(sink.Write("abc", 3), 3u);
  }
  EXPECT_EQ(ReadAvailable(fds[0], 3), "abc");
  char c;
  EXPECT_EQ(::read(fds[0], &c, 1), 0) << "write end should be closed";
  ::close(fds[0]);
}

TEST(FdSinkTest, ClosedPeerIsReportedOnceAndCounted) {
  int fds[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
  ::close(fds[1]);

  CapturedDiagnostics diagnostics;
  FdSink sink(fds[0], true, "peerless", FdKind::kSocket);

  EXPECT_EQ(sink.Write("lost", 4), 0u);
  EXPECT_EQ(sink.Write("lost", 4), 0u);
  EXPECT_EQ(sink.GetWriteErrors(), 2u);
  EXPECT_EQ(sink.GetBytesWritten(), 0u);

  ASSERT_EQ(diagnostics.lines().size(), 1u);
  EXPECT_NE(diagnostics.lines()[0].find("peerless"), std::string::npos);
}

TEST(FdSinkTest, BrokenPipeIsAWriteErrorWhenSigpipeIgnored) {
  ScopedIgnoreSigpipe sigpipe;
  ASSERT_TRUE(sigpipe.installed());

  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  ::close(fds[0]);

  CapturedDiagnostics diagnostics;
  FdSink sink(fds[1], true, "pipe:head");
  EXPECT_EQ(sink.Write("gone\n", 5), 0u);
  EXPECT_EQ(sink.GetWriteErrors(), 1u);
  ASSERT_EQ(diagnostics.lines().size(), 1u);
  EXPECT_NE(diagnostics.lines()[0].find("pipe:head"), std::string::npos);
}

TEST(FdSinkTest, WriterOverBrokenPipeRaisesSinkError) {
  ScopedIgnoreSigpipe sigpipe;
  ASSERT_TRUE(sigpipe.installed());

  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  ::close(fds[0]);

  CapturedDiagnostics diagnostics;
  log::FormattingWriter writer(std::make_unique<FdSink>(fds[1], true, "pipe:head"),
                               test::MakePinnedTimestamps(), test::ConfigWithCapacity(64));
  EXPECT_THROW(writer.Write(log::Level::kInfo, std::string(100, 'x')), log::SinkError);

  writer.Write(log::Level::kInfo, "x");
  EXPECT_FALSE(writer.Flush());
  EXPECT_FALSE(writer.Close());
}

TEST(FdSinkTest, ConnectUnixDeliversBytes) {
  const std::string path = MakeTempDir() + "/sink.sock";
  ::unlink(path.c_str());

  int listener = ::socket(AF_UNIX, SOCK_STREAM, 0);
  ASSERT_GE(listener, 0);
  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  ASSERT_EQ(::bind(listener, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);
  ASSERT_EQ(::listen(listener, 1), 0);

  auto sink = FdSink::ConnectUnix(path);
  EXPECT_EQ(sink->GetName(), "unix:" + path);
  int peer = ::accept(listener, nullptr, nullptr);
  ASSERT_GE(peer, 0);

  EXPECT_EQ(sink->Write("over unix\n", 10), 10u);
  EXPECT_EQ(ReadAvailable(peer, 10), "over unix\n");

  sink.reset();
  char c;
  EXPECT_EQ(::read(peer, &c, 1), 0) << "peer should see EOF";

  ::close(peer);
  ::close(listener);
  ::unlink(path.c_str());
}

TEST(FdSinkTest, ConnectUnixFailureThrows) {
  EXPECT_THROW(FdSink::ConnectUnix(MakeTempDir() + "/missing.sock"), std::runtime_error);
}

TEST(FdSinkTest, ConnectTcpDeliversBytes) {
  int listener = ::socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(listener, 0);
  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  ASSERT_EQ(::bind(listener, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);
  ASSERT_EQ(::listen(listener, 1), 0);
  socklen_t len = sizeof(addr);
  ASSERT_EQ(::getsockname(listener, reinterpret_cast<struct sockaddr*>(&addr), &len), 0);
  const uint16_t port = ntohs(addr.sin_port);

  auto sink = FdSink::ConnectTcp("127.0.0.1", port);
  EXPECT_EQ(sink->GetName(), "tcp:127.0.0.1:" + std::to_string(port));
  int peer = ::accept(listener, nullptr, nullptr);
  ASSERT_GE(peer, 0);

  EXPECT_EQ(sink->Write("over tcp\n", 9), 9u);
  EXPECT_EQ(ReadAvailable(peer, 9), "over tcp\n");

  ::close(peer);
  ::close(listener);
}

}  // namespace
}  // namespace scribe::output
