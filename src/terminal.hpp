#pragma once
/*
 * Terminal
 *
 * Purpose: RAII raw-mode scope over an ITerminal session.
 * Usage: acquire() at program start; destructor restores the terminal once,
 *        and only if raw mode was actually entered.
 */
#include "error.hpp"
#include "iterminal.hpp"

class Terminal {
public:
  explicit Terminal(ITerminal& term) : term_(term) {}
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  bool acquire(Error& err);
  void release();
  bool active() const { return active_; }

private:
  ITerminal& term_;
  bool active_ = false;
};
