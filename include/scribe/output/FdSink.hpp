// Repository: Retrovue-scribe
// Component: FdSink
// Purpose: IByteSink over a POSIX descriptor (file, console, socket).
// Copyright (c) 2025 RetroVue

#ifndef SCRIBE_OUTPUT_FD_SINK_HPP_
#define SCRIBE_OUTPUT_FD_SINK_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "scribe/output/IByteSink.hpp"

namespace scribe::output {

// How an FdSink hands bytes to the kernel.
enum class FdKind {
  kFile,    // write(2)
  kSocket,  // send(2) with MSG_NOSIGNAL, so a closed peer yields EPIPE, not SIGPIPE
};

// FdSink writes synchronously to a descriptor, looping over short writes
// and EINTR. It blocks for as long as the kernel blocks.
//
// The first failed write per sink is reported through util::Diagnostics;
// later failures are only counted.
class FdSink : public IByteSink {
 public:
  // owns_fd: close the descriptor on destruction.
  FdSink(int fd, bool owns_fd, std::string name, FdKind kind = FdKind::kFile);
  ~FdSink() override;

  FdSink(const FdSink&) = delete;
  FdSink& operator=(const FdSink&) = delete;

  // Opens path for appending, creating it with mode 0644.
  // Throws std::runtime_error if the file cannot be opened.
  static std::unique_ptr<FdSink> OpenFile(const std::string& path);

  // Non-owning sinks over the process's standard streams.
  static std::unique_ptr<FdSink> Stdout();
  static std::unique_ptr<FdSink> Stderr();

  // Connects a stream socket. Throws std::runtime_error on failure.
  static std::unique_ptr<FdSink> ConnectTcp(const std::string& host, uint16_t port);
  static std::unique_ptr<FdSink> ConnectUnix(const std::string& path);

  size_t Write(const char* data, size_t len) override;
  std::string GetName() const override { return name_; }

  int fd() const { return fd_; }
  uint64_t GetBytesWritten() const { return bytes_written_.load(std::memory_order_relaxed); }
  uint64_t GetWriteErrors() const { return write_errors_.load(std::memory_order_relaxed); }

 private:
  void ReportWriteFailure(int err);

  int fd_;
  bool owns_fd_;
  std::string name_;
  FdKind kind_;

  std::atomic<uint64_t> bytes_written_{0};
  std::atomic<uint64_t> write_errors_{0};
};

}  // namespace scribe::output

#endif  // SCRIBE_OUTPUT_FD_SINK_HPP_
