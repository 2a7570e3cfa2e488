#include "tty_key_source.hpp"
#include <poll.h>
#include <cerrno>
#include <utility>

TtyKeySource::TtyKeySource(int fd, std::chrono::milliseconds esc_delay, KeyMap keys)
    : fd_(fd), esc_delay_(esc_delay), keys_(std::move(keys)) {}

void TtyKeySource::wake() {
  char c = 1;
  // EAGAIN means a wake-up is already pending
  (void)::write(wake_wr_.get(), &c, 1);
}

TtyKeySource::Poll TtyKeySource::wait_input(int timeout_ms, Error& err) {
  for (;;) {
    struct pollfd fds[2] = {{fd_, POLLIN, 0}, {wake_rd_.get(), POLLIN, 0}};
    int r = ::poll(fds, 2, timeout_ms);
    if (r < 0) {
      if (errno == EINTR) continue;
      err = errno_error("poll", errno);
      return Poll::Failed;
    }
    if (r == 0) return Poll::Timeout;
    if (fds[1].revents & POLLIN) {
      char drain[64];
      while (::read(wake_rd_.get(), drain, sizeof(drain)) > 0) {}
      return Poll::Woken;
    }
    if (fds[0].revents & POLLNVAL) { err = Error{EBADF, "input fd is not open"}; return Poll::Failed; }
    return Poll::Input;
  }
}

bool TtyKeySource::fill(Error& err) {
  char tmp[256];
  for (;;) {
    ssize_t n = ::read(fd_, tmp, sizeof(tmp));
    if (n > 0) { buf_.append(tmp, static_cast<size_t>(n)); return true; }
    if (n == 0) { err = Error{EIO, "input closed"}; return false; }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
    err = errno_error("read input", errno);
    return false;
  }
}

KeyRead TtyKeySource::read_key(std::stop_token st, KeyMsg& out, Error& err) {
  if (!wake_rd_.valid() && !open_pipe(wake_rd_, wake_wr_, err)) return KeyRead::Failed;
  std::stop_callback on_stop(st, [this] { wake(); });
  for (;;) {
    if (st.stop_requested()) return KeyRead::Stopped;
    if (!buf_.empty()) {
      size_t n = keys_.decode(buf_, out, true);
      if (n == 0) {
        // incomplete sequence: give the rest esc_delay to arrive
        Poll p = wait_input(static_cast<int>(esc_delay_.count()), err);
        if (p == Poll::Failed) return KeyRead::Failed;
        if (p == Poll::Woken) continue;
        if (p == Poll::Input) {
          if (!fill(err)) return KeyRead::Failed;
          continue;
        }
        n = keys_.decode(buf_, out, false);
      }
      buf_.erase(0, n);
      if (out.type == KeyType::Unknown) continue;
      return KeyRead::Key;
    }
    Poll p = wait_input(-1, err);
    if (p == Poll::Failed) return KeyRead::Failed;
    if (p == Poll::Input && !fill(err)) return KeyRead::Failed;
  }
}
