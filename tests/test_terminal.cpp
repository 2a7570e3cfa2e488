#include "headless_terminal.hpp"
#include "input_feeder.hpp"
#include "terminal.hpp"
#include "tty_key_source.hpp"
#include "tty_terminal.hpp"
#include <cassert>
#include <cerrno>
#include <chrono>
#include <memory>
#include <thread>
#include <unistd.h>

static void test_raw_mode_scope() {
  HeadlessTerminal term;
  {
    Terminal session(term);
    Error err;
    assert(session.acquire(err));
    assert(session.acquire(err));
    assert(term.raw() && term.raw_entries() == 1);
  }
  assert(!term.raw());
  assert(term.restores() == 1);

  term.fail_setup(Error{ENOTTY, "not a tty"});
  {
    Terminal session(term);
    Error err;
    assert(!session.acquire(err));
    assert(err.code == ENOTTY);
    assert(!session.active());
  }
  assert(term.restores() == 1);
}

static void test_feeder_forwards_keys_then_error() {
  ScriptedKeySource keys;
  auto stream = std::make_shared<MessageStream>();
  Logger log;
  InputFeeder feeder(keys, stream, log);
  keys.push_bytes("a\x1b[A");
  feeder.start();
  std::optional<Msg> m;
  Error err;
  assert(stream->wait(m, err) == MessageStream::Wait::Message);
  assert(m->key() && m->key()->rune == U'a');
  m.reset();
  assert(stream->wait(m, err) == MessageStream::Wait::Message);
  assert(m->key() && m->key()->type == KeyType::Up);

  keys.push_error(Error{EIO, "read failed"});
  assert(stream->wait(m, err) == MessageStream::Wait::Error);
  assert(err == (Error{EIO, "read failed"}));
  feeder.stop();
}

static void test_feeder_stops_while_blocked() {
  ScriptedKeySource keys;
  auto stream = std::make_shared<MessageStream>();
  Logger log;
  InputFeeder feeder(keys, stream, log);
  feeder.start();
  while (keys.reads() == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  feeder.stop();
  assert(!feeder.running());
  assert(stream->pending() == 0);
}

static void test_tty_key_source_on_pipe() {
  int p[2];
  assert(::pipe(p) == 0);
  TtyKeySource src(p[0], std::chrono::milliseconds(10));
  std::stop_source ss;
  KeyMsg k;
  Error err;

  assert(::write(p[1], "a\x1b[A", 4) == 4);
  assert(src.read_key(ss.get_token(), k, err) == KeyRead::Key && k.rune == U'a');
  assert(src.read_key(ss.get_token(), k, err) == KeyRead::Key && k.type == KeyType::Up);

  // lone ESC resolves after the escape delay
  assert(::write(p[1], "\x1b", 1) == 1);
  assert(src.read_key(ss.get_token(), k, err) == KeyRead::Key && k.type == KeyType::Escape);

  // a stop request unblocks a pending read
  std::thread stopper([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ss.request_stop();
  });
  assert(src.read_key(ss.get_token(), k, err) == KeyRead::Stopped);
  stopper.join();

  // end of input is a read failure
  std::stop_source ss2;
  ::close(p[1]);
  assert(src.read_key(ss2.get_token(), k, err) == KeyRead::Failed);
  assert(err.code == EIO);
  ::close(p[0]);
}

static void test_tty_terminal_on_pipe() {
  int p[2];
  assert(::pipe(p) == 0);
  {
    TtyTerminal t(p[0], p[1], "dumb");
    Error err;
    assert(!t.enter_raw_mode(err));
    assert(err.code == ENOTTY);
    t.clear_lines(2);
    t.write("hi");
  }
  char buf[256];
  ssize_t n = ::read(p[0], buf, sizeof(buf));
  assert(n > 2);
  std::string out(buf, static_cast<size_t>(n));
  assert(out[0] == '\r');
  assert(out.substr(out.size() - 2) == "hi");
  ::close(p[0]);
  ::close(p[1]);
}

static void test_tty_key_source_uses_key_map() {
  int p[2];
  assert(::pipe(p) == 0);
  KeyMap map;
  map.add("\x1b[[A", KeyType::Up);
  TtyKeySource src(p[0], std::chrono::milliseconds(500), map);
  std::stop_source ss;
  KeyMsg k;
  Error err;
  // split across writes: the prefix waits for the rest
  assert(::write(p[1], "\x1b[[", 3) == 3);
  std::thread writer([&] { assert(::write(p[1], "Ab", 2) == 2); });
  assert(src.read_key(ss.get_token(), k, err) == KeyRead::Key && k.type == KeyType::Up);
  writer.join();
  assert(src.read_key(ss.get_token(), k, err) == KeyRead::Key && k.rune == U'b');
  ::close(p[0]);
  ::close(p[1]);
}

static void test_tty_terminals_own_their_terminfo() {
  int p[2];
  assert(::pipe(p) == 0);
  auto first = std::make_unique<TtyTerminal>(p[0], p[1], "xterm");
  auto second = std::make_unique<TtyTerminal>(p[0], p[1], "dumb");
  // freed in creation order: each releases its own entry
  first.reset();
  second->write("x");
  second.reset();

  TtyTerminal xterm(p[0], p[1], "xterm");
  if (xterm.has_terminfo()) {
    assert(!xterm.key_map().empty());
    KeyMsg k;
    assert(xterm.key_map().decode("\x1b[3~", k, false) == 4 && k.type == KeyType::Delete);
  }
  ::close(p[0]);
  ::close(p[1]);
}

int main() {
  test_raw_mode_scope();
  test_feeder_forwards_keys_then_error();
  test_feeder_stops_while_blocked();
  test_tty_key_source_on_pipe();
  test_tty_terminal_on_pipe();
  test_tty_key_source_uses_key_map();
  test_tty_terminals_own_their_terminfo();
  return 0;
}
