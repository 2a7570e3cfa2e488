#pragma once
/*
 * ITerminal
 *
 * Purpose: terminal session consumed by the runtime (raw mode, output,
 *          line clearing, alternate screen).
 * Goal: decouple from concrete impls (tty/headless), enable testing.
 * Note: restore() must also leave the alternate screen if it is active.
 */
#include <string_view>
#include "error.hpp"

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual bool enter_raw_mode(Error& err) = 0;
  virtual void restore() = 0;
  // Clear the current line and the n lines above it; cursor ends at column 0.
  virtual void clear_lines(int n) = 0;
  virtual void enter_alt_screen() = 0;
  virtual void exit_alt_screen() = 0;
  virtual void write(std::string_view s) = 0;
};
