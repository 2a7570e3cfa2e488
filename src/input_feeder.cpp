#include "input_feeder.hpp"

InputFeeder::InputFeeder(IKeySource& keys, std::shared_ptr<MessageStream> out, Logger& log)
    : keys_(keys), out_(std::move(out)), log_(log) {}

InputFeeder::~InputFeeder() { stop(); }

void InputFeeder::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

void InputFeeder::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

void InputFeeder::run(std::stop_token st) {
  for (;;) {
    KeyMsg key;
    Error err;
    switch (keys_.read_key(st, key, err)) {
      case KeyRead::Key:
        if (!out_->push(Msg(key))) return;
        break;
      case KeyRead::Failed:
        log_.error("input failed: " + err.message);
        out_->fail(std::move(err));
        return;
      case KeyRead::Stopped:
        return;
    }
  }
}
