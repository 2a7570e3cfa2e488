#include "terminal.hpp"

Terminal::~Terminal() {
  release();
}

bool Terminal::acquire(Error& err) {
  if (active_) return true;
  if (!term_.enter_raw_mode(err)) return false;
  active_ = true;
  return true;
}

void Terminal::release() {
  if (!active_) return;
  active_ = false;
  term_.restore();
}
