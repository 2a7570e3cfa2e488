#include "renderer.hpp"
#include <algorithm>

int Renderer::count_line_breaks(std::string_view s) {
  return static_cast<int>(std::count(s.begin(), s.end(), '\n'));
}

std::string Renderer::to_crlf(std::string_view s) {
  std::string out;
  out.reserve(s.size() + static_cast<size_t>(count_line_breaks(s)));
  for (char c : s) {
    if (c == '\n') out += '\r';
    out += c;
  }
  return out;
}

bool Renderer::render(const std::string& frame) {
  std::lock_guard<std::mutex> lk(mu_);
  if (frame == current_) return false;
  int lines = count_line_breaks(current_);
  if (lines > 0) term_.clear_lines(lines);
  term_.write(to_crlf(frame));
  current_ = frame;
  return true;
}

// A new screen buffer holds none of the old frame; drop the cache so the
// next render draws in full.
void Renderer::enter_alt_screen() {
  std::lock_guard<std::mutex> lk(mu_);
  term_.enter_alt_screen();
  current_.clear();
}

void Renderer::exit_alt_screen() {
  std::lock_guard<std::mutex> lk(mu_);
  term_.exit_alt_screen();
  current_.clear();
}

std::string Renderer::last_frame() const {
  std::lock_guard<std::mutex> lk(mu_);
  return current_;
}
