#pragma once
/*
 * UniqueFd
 *
 * Purpose: owning POSIX file descriptor; closes on destruction.
 * Extra: write_all() retries short writes and EINTR.
 */
#include <unistd.h>
#include <cerrno>
#include <cstddef>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close_if_needed(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close_if_needed(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) { close_if_needed(); fd_ = fd; }

  bool write_all(const char* p, size_t len) const {
    while (len > 0) {
      ssize_t w = ::write(fd_, p, len);
      if (w < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      p += w;
      len -= static_cast<size_t>(w);
    }
    return true;
  }

  /*close() reports deferred write errors; the descriptor is released either way*/
  bool close() {
    if (fd_ < 0) return true;
    int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
  }

private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};
