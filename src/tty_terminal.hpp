#pragma once
/*
 * TtyTerminal
 *
 * Purpose: ITerminal over a real tty: termios raw mode, escape strings from
 *          the terminfo database (ncurses low-level interface).
 * Note: capabilities missing from terminfo fall back to ANSI sequences.
 *       key_map() holds the terminal's input key sequences for TtyKeySource.
 */
#include <termios.h>
#include <string>
#include <string_view>
#include "iterminal.hpp"
#include "key.hpp"

struct term; // TERMINAL from <term.h>

class TtyTerminal : public ITerminal {
public:
  // term_name empty: use $TERM
  TtyTerminal(int in_fd, int out_fd, const std::string& term_name);
  ~TtyTerminal() override;
  TtyTerminal(const TtyTerminal&) = delete;
  TtyTerminal& operator=(const TtyTerminal&) = delete;

  bool enter_raw_mode(Error& err) override;
  void restore() override;
  void clear_lines(int n) override;
  void enter_alt_screen() override;
  void exit_alt_screen() override;
  void write(std::string_view s) override;

  bool has_terminfo() const { return terminfo_; }
  const KeyMap& key_map() const { return keys_; }

private:
  void write_all(std::string_view s);

  int in_fd_;
  int out_fd_;
  struct termios saved_{};
  bool raw_ = false;
  bool alt_ = false;
  bool terminfo_ = false;
  struct term* term_ = nullptr;
  KeyMap keys_;
  std::string cr_, el_, cuu1_, smcup_, rmcup_, civis_, cnorm_;
};
