#include "renderer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>
#include <thread>
#include <vector>

static void test_unchanged_frame_is_not_written() {
  HeadlessTerminal term;
  Renderer r(term);
  assert(r.render("hello\n"));
  assert(!r.render("hello\n"));
  assert(term.writes().size() == 1);
  assert(term.clears().empty());
  assert(r.last_frame() == "hello\n");
}

static void test_clears_previous_line_count() {
  HeadlessTerminal term;
  Renderer r(term);
  assert(r.render("a\nb\nc\n"));
  assert(r.render("x\n"));
  assert(r.render("y"));
  // no line breaks in "y": nothing to clear before the next frame
  assert(r.render("z\n"));
  assert((term.clears() == std::vector<int>{3, 1}));
  auto w = term.writes();
  assert(w.size() == 4);
  assert(w[0] == "a\r\nb\r\nc\r\n");
  assert(w[1] == "x\r\n");
  assert(w[3] == "z\r\n");
}

static void test_line_helpers() {
  assert(Renderer::count_line_breaks("") == 0);
  assert(Renderer::count_line_breaks("a\nb\n") == 2);
  assert(Renderer::to_crlf("a\nb") == "a\r\nb");
  assert(Renderer::to_crlf("\n\n") == "\r\n\r\n");
}

static void test_alt_screen_resets_cache() {
  HeadlessTerminal term;
  Renderer r(term);
  assert(r.render("frame\n"));
  r.enter_alt_screen();
  assert(term.alt_screen());
  assert(r.last_frame().empty());
  // same frame is drawn again on the new buffer, without clearing
  assert(r.render("frame\n"));
  r.exit_alt_screen();
  assert(!term.alt_screen());
  assert(term.writes().size() == 2);
  assert(term.clears().empty());
}

static void test_concurrent_toggles_and_renders() {
  HeadlessTerminal term;
  Renderer r(term);
  std::thread toggler([&] {
    for (int i = 0; i < 200; ++i) {
      r.enter_alt_screen();
      r.exit_alt_screen();
    }
  });
  for (int i = 0; i < 200; ++i) r.render(std::to_string(i) + "\n");
  toggler.join();
  assert(r.render("done\n"));
  assert(r.last_frame() == "done\n");
  assert(!term.alt_screen());
}

int main() {
  test_unchanged_frame_is_not_written();
  test_clears_previous_line_count();
  test_line_helpers();
  test_alt_screen_resets_cache();
  test_concurrent_toggles_and_renders();
  return 0;
}
