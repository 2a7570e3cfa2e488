#pragma once
/*
 * UniqueFd
 *
 * Purpose: owning file descriptor (log file, wake pipe, rc file).
 * open_pipe: non-blocking, close-on-exec pipe pair; false with msg on failure.
 */
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <string>
#include "error.hpp"

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) reset(other.release());
    return *this;
  }
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int release() { int fd = fd_; fd_ = -1; return fd; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }
private:
  int fd_;
};

inline bool open_pipe(UniqueFd& rd, UniqueFd& wr, Error& err) {
  int p[2];
  if (::pipe(p) != 0) { err = errno_error("pipe", errno); return false; }
  rd.reset(p[0]);
  wr.reset(p[1]);
  for (int fd : p) {
    int fl = ::fcntl(fd, F_GETFL);
    if (fl < 0 || ::fcntl(fd, F_SETFL, fl | O_NONBLOCK) != 0 || ::fcntl(fd, F_SETFD, FD_CLOEXEC) != 0) {
      err = errno_error("fcntl", errno);
      return false;
    }
  }
  return true;
}
