#include "tty_terminal.hpp"
#include <unistd.h>
#include <cerrno>
// last: term.h defines capability macros with common names
#define NCURSES_NOMACROS
#include <curses.h>
#include <term.h>

static std::string capability(bool loaded, const char* id, const char* fallback) {
  if (!loaded) return fallback;
  char* s = tigetstr(const_cast<char*>(id));
  if (s == nullptr || s == reinterpret_cast<char*>(-1)) return fallback;
  return s;
}

// input key sequences; absent ones are simply not mapped
static void map_key(KeyMap& keys, bool loaded, const char* id, KeyType type) {
  std::string seq = capability(loaded, id, "");
  if (!seq.empty()) keys.add(std::move(seq), type);
}

TtyTerminal::TtyTerminal(int in_fd, int out_fd, const std::string& term_name)
    : in_fd_(in_fd), out_fd_(out_fd) {
  int status = 0;
  const char* name = term_name.empty() ? nullptr : term_name.c_str();
  terminfo_ = setupterm(const_cast<char*>(name), out_fd_, &status) == OK;
  // setupterm replaces cur_term; keep our own entry to free it later
  if (terminfo_) term_ = cur_term;
  cr_ = capability(terminfo_, "cr", "\r");
  el_ = capability(terminfo_, "el", "\x1b[K");
  cuu1_ = capability(terminfo_, "cuu1", "\x1b[A");
  smcup_ = capability(terminfo_, "smcup", "\x1b[?1049h");
  rmcup_ = capability(terminfo_, "rmcup", "\x1b[?1049l");
  civis_ = capability(terminfo_, "civis", "\x1b[?25l");
  cnorm_ = capability(terminfo_, "cnorm", "\x1b[?25h");
  map_key(keys_, terminfo_, "kcuu1", KeyType::Up);
  map_key(keys_, terminfo_, "kcud1", KeyType::Down);
  map_key(keys_, terminfo_, "kcuf1", KeyType::Right);
  map_key(keys_, terminfo_, "kcub1", KeyType::Left);
  map_key(keys_, terminfo_, "khome", KeyType::Home);
  map_key(keys_, terminfo_, "kend", KeyType::End);
  map_key(keys_, terminfo_, "kpp", KeyType::PageUp);
  map_key(keys_, terminfo_, "knp", KeyType::PageDown);
  map_key(keys_, terminfo_, "kdch1", KeyType::Delete);
  map_key(keys_, terminfo_, "kich1", KeyType::Insert);
}

TtyTerminal::~TtyTerminal() {
  restore();
  if (term_ != nullptr) del_curterm(term_);
}

bool TtyTerminal::enter_raw_mode(Error& err) {
  if (raw_) return true;
  if (::tcgetattr(in_fd_, &saved_) != 0) { err = errno_error("tcgetattr", errno); return false; }
  struct termios raw = saved_;
  ::cfmakeraw(&raw);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(in_fd_, TCSANOW, &raw) != 0) { err = errno_error("tcsetattr", errno); return false; }
  raw_ = true;
  write_all(civis_);
  return true;
}

void TtyTerminal::restore() {
  if (alt_) exit_alt_screen();
  if (!raw_) return;
  write_all(cnorm_);
  (void)::tcsetattr(in_fd_, TCSANOW, &saved_);
  raw_ = false;
}

void TtyTerminal::clear_lines(int n) {
  std::string s = cr_ + el_;
  for (int i = 0; i < n; ++i) s += cuu1_ + el_;
  write_all(s);
}

void TtyTerminal::enter_alt_screen() {
  if (alt_) return;
  alt_ = true;
  write_all(smcup_);
}

void TtyTerminal::exit_alt_screen() {
  if (!alt_) return;
  alt_ = false;
  write_all(rmcup_);
}

void TtyTerminal::write(std::string_view s) { write_all(s); }

void TtyTerminal::write_all(std::string_view s) {
  const char* p = s.data();
  size_t remain = s.size();
  while (remain > 0) {
    ssize_t w = ::write(out_fd_, p, remain);
    if (w < 0) {
      if (errno == EINTR) continue;
      return;
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
}
