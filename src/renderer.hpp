#pragma once
/*
 * Renderer
 *
 * Purpose: differential frame output; writes only when the frame changed.
 * Redraw: clear as many lines as the previous frame had line breaks, then
 *         write the new frame with "\n" turned into "\r\n".
 * Lock: one mutex covers terminal output and the frame cache; alt-screen
 *       toggles go through it too.
 */
#include <mutex>
#include <string>
#include <string_view>
#include "iterminal.hpp"

class Renderer {
public:
  explicit Renderer(ITerminal& term) : term_(term) {}

  // true if the frame was written
  bool render(const std::string& frame);
  void enter_alt_screen();
  void exit_alt_screen();
  std::string last_frame() const;

  static int count_line_breaks(std::string_view s);
  static std::string to_crlf(std::string_view s);

private:
  ITerminal& term_;
  mutable std::mutex mu_;
  std::string current_;
};
