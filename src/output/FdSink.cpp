// Repository: Retrovue-scribe
// Component: FdSink Implementation
// Purpose: IByteSink over a POSIX descriptor (file, console, socket).
// Copyright (c) 2025 RetroVue

#include "scribe/output/FdSink.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "scribe/util/Diagnostics.hpp"

namespace scribe::output {

namespace {

std::string ErrnoText(int err) {
  return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

}  // namespace

FdSink::FdSink(int fd, bool owns_fd, std::string name, FdKind kind)
    : fd_(fd), owns_fd_(owns_fd), name_(std::move(name)), kind_(kind) {
  if (fd_ < 0) {
    throw std::invalid_argument("FdSink: invalid descriptor for " + name_);
  }
}

FdSink::~FdSink() {
  if (owns_fd_ && fd_ >= 0) {
    if (kind_ == FdKind::kSocket) {
      ::shutdown(fd_, SHUT_WR);  // Signal EOF to peer
    }
    ::close(fd_);
    fd_ = -1;
  }
}

std::unique_ptr<FdSink> FdSink::OpenFile(const std::string& path) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw std::runtime_error("FdSink: cannot open " + path + ": " + ErrnoText(errno));
  }
  return std::make_unique<FdSink>(fd, true, "file:" + path, FdKind::kFile);
}

std::unique_ptr<FdSink> FdSink::Stdout() {
  return std::make_unique<FdSink>(STDOUT_FILENO, false, "stdout", FdKind::kFile);
}

std::unique_ptr<FdSink> FdSink::Stderr() {
  return std::make_unique<FdSink>(STDERR_FILENO, false, "stderr", FdKind::kFile);
}

std::unique_ptr<FdSink> FdSink::ConnectTcp(const std::string& host, uint16_t port) {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* result = nullptr;
  const std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    throw std::runtime_error("FdSink: cannot resolve " + host + ": " + gai_strerror(rc));
  }

  int last_errno = 0;
  int fd = -1;
  for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      last_errno = errno;
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    last_errno = errno;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(result);

  if (fd < 0) {
    throw std::runtime_error("FdSink: cannot connect to " + host + ":" + service + ": " +
                             ErrnoText(last_errno));
  }
  return std::make_unique<FdSink>(fd, true, "tcp:" + host + ":" + service, FdKind::kSocket);
}

std::unique_ptr<FdSink> FdSink::ConnectUnix(const std::string& path) {
  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (path.size() >= sizeof(addr.sun_path)) {
    throw std::runtime_error("FdSink: unix socket path too long: " + path);
  }
  std::memcpy(addr.sun_path, path.c_str(), path.size());

  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    throw std::runtime_error("FdSink: socket() failed: " + ErrnoText(errno));
  }
  if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
    int err = errno;
    ::close(fd);
    throw std::runtime_error("FdSink: cannot connect to " + path + ": " + ErrnoText(err));
  }
  return std::make_unique<FdSink>(fd, true, "unix:" + path, FdKind::kSocket);
}

size_t FdSink::Write(const char* data, size_t len) {
  size_t written = 0;
  while (written < len) {
    ssize_t n;
    if (kind_ == FdKind::kSocket) {
#if defined(__linux__)
      n = ::send(fd_, data + written, len - written, MSG_NOSIGNAL);
#else
      n = ::send(fd_, data + written, len - written, 0);
#endif
    } else {
      n = ::write(fd_, data + written, len - written);
    }

    if (n < 0) {
      if (errno == EINTR) continue;
      ReportWriteFailure(errno);
      break;
    }
    if (n == 0) {
      ReportWriteFailure(EIO);
      break;
    }
    written += static_cast<size_t>(n);
  }
  bytes_written_.fetch_add(written, std::memory_order_relaxed);
  return written;
}

void FdSink::ReportWriteFailure(int err) {
  // Log once per sink; afterwards only count.
  uint64_t prior = write_errors_.fetch_add(1, std::memory_order_relaxed);
  if (prior != 0) return;
  util::Diagnostics::Warn("[FdSink:" + name_ + "] first write failure fd=" +
                          std::to_string(fd_) + ": " + ErrnoText(err));
}

}  // namespace scribe::output
