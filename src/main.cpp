#include "program.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

/*
 * mtea_counter
 *
 * Demo: a counter driven by keys and a once-per-second tick.
 * Keys: +/k/up increment, -/j/down decrement, a toggles the alt screen,
 *       q/esc/ctrl+c quit. Settings are read from ~/.mtearc when present.
 */

struct Counter {
  int value = 0;
  int ticks = 0;
  bool alt = false;
};

struct Tick {};

static Cmd every_second() {
  return tick(std::chrono::milliseconds(1000), [] { return make_msg(Tick{}); });
}

static void load_rc(ProgramOptions& opts) {
  const char* home = std::getenv("HOME");
  if (!home) return;
  auto p = std::filesystem::path(home) / ".mtearc";
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) return;
  std::string msg;
  if (!load_options(p, opts, msg)) std::cerr << "mtea_counter: " << msg << "\n";
}

int main() {
  ProgramOptions opts;
  load_rc(opts);
  apply_env(opts);

  Program<Counter>* self = nullptr;
  Program<Counter> prog(
      [] { return std::pair<Counter, Cmd>{Counter{}, every_second()}; },
      [&self](const Msg& msg, Counter c) -> std::pair<Counter, Cmd> {
        if (msg.as<Tick>()) {
          c.ticks++;
          return {c, every_second()};
        }
        const KeyMsg* k = msg.key();
        if (!k) return {c, Cmd{}};
        std::string name = key_name(*k);
        if (name == "q" || name == "esc" || name == "ctrl+c") return {c, quit()};
        if (name == "+" || name == "k" || name == "up") c.value++;
        if (name == "-" || name == "j" || name == "down") c.value--;
        if (name == "a") {
          c.alt = !c.alt;
          if (c.alt) self->enter_alt_screen(); else self->exit_alt_screen();
        }
        return {c, Cmd{}};
      },
      [](const Counter& c) {
        return "count: " + std::to_string(c.value) + "   (" + std::to_string(c.ticks) + "s)\n" +
               "+/- to change, a for alt screen, q to quit\n";
      },
      opts);
  self = &prog;

  if (auto err = prog.start()) {
    std::cerr << "mtea_counter: " << err->message << "\n";
    return 1;
  }
  return 0;
}
