#include "executor.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <set>
#include <thread>

static bool wait_until(const std::function<bool()>& pred) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

static Cmd yield_int(int n) {
  return [n](std::stop_token) -> std::optional<Msg> { return make_msg(n); };
}

static void test_empty_command_rejected() {
  auto stream = std::make_shared<MessageStream>();
  Logger log;
  CommandExecutor ex(stream, log);
  assert(!ex.submit(Cmd{}));
  assert(ex.running() == 0);
  assert(ex.executed() == 0);
  assert(stream->pending() == 0);
}

static void test_batch_results_multiset() {
  auto stream = std::make_shared<MessageStream>();
  Logger log;
  CommandExecutor ex(stream, log);
  auto silent_runs = std::make_shared<std::atomic<int>>(0);
  Cmd silent = [silent_runs](std::stop_token) -> std::optional<Msg> { (*silent_runs)++; return std::nullopt; };
  BatchMsg b{{yield_int(1), silent, yield_int(3), yield_int(3)}};
  assert(ex.expand(b) == 4);

  std::multiset<int> got;
  for (int i = 0; i < 3; ++i) {
    std::optional<Msg> m;
    Error err;
    assert(stream->wait(m, err) == MessageStream::Wait::Message);
    got.insert(*m->as<int>());
  }
  assert((got == std::multiset<int>{1, 3, 3}));
  assert(wait_until([&] { return ex.executed() == 4; }));
  assert(silent_runs->load() == 1);
  assert(stream->pending() == 0);
}

static void test_shutdown_stops_and_drops() {
  auto stream = std::make_shared<MessageStream>();
  Logger log;
  CommandExecutor ex(stream, log);
  auto saw_stop = std::make_shared<std::atomic<bool>>(false);
  ex.submit([saw_stop](std::stop_token st) -> std::optional<Msg> {
    while (!st.stop_requested()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    *saw_stop = true;
    return make_msg(9);
  });
  assert(wait_until([&] { return ex.running() == 1; }));
  stream->close();
  assert(ex.shutdown(std::chrono::seconds(5)) == 0);
  assert(saw_stop->load());
  assert(stream->pending() == 0);
  // submission after termination is a drop, not a block
  assert(!ex.submit(yield_int(1)));
  assert(ex.executed() == 1);
}

static void test_straggler_outlives_executor() {
  auto stream = std::make_shared<MessageStream>();
  auto done = std::make_shared<std::atomic<bool>>(false);
  Logger log;
  {
    CommandExecutor ex(stream, log);
    ex.submit([done](std::stop_token) -> std::optional<Msg> {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      *done = true;
      return make_msg(1);
    });
    stream->close();
    assert(ex.shutdown(std::chrono::milliseconds(0)) == 1);
  }
  assert(wait_until([&] { return done->load(); }));
  assert(stream->pending() == 0);
}

int main() {
  test_empty_command_rejected();
  test_batch_results_multiset();
  test_shutdown_stops_and_drops();
  test_straggler_outlives_executor();
  return 0;
}
