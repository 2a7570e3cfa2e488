#pragma once
/*
 * TtyKeySource
 *
 * Purpose: IKeySource reading raw bytes from a tty fd and decoding keys.
 * Note: poll()s the fd together with a wake pipe so a stop request unblocks
 *       the read; a lone ESC waits esc_delay for a following byte.
 */
#include <chrono>
#include <string>
#include "ikey_source.hpp"
#include "posix_fd.hpp"

class TtyKeySource : public IKeySource {
public:
  // keys: terminal-specific sequences tried before the built-in decoding
  TtyKeySource(int fd, std::chrono::milliseconds esc_delay, KeyMap keys = {});
  KeyRead read_key(std::stop_token st, KeyMsg& out, Error& err) override;

private:
  enum class Poll { Input, Timeout, Woken, Failed };
  Poll wait_input(int timeout_ms, Error& err);
  bool fill(Error& err);
  void wake();

  int fd_;
  std::chrono::milliseconds esc_delay_;
  KeyMap keys_;
  UniqueFd wake_rd_;
  UniqueFd wake_wr_;
  std::string buf_;
};
