#include "runtime.hpp"

Runtime::Runtime(std::shared_ptr<MessageStream> stream, IKeySource& keys, Logger& log,
                 std::chrono::milliseconds shutdown_grace)
    : stream_(stream), log_(log), grace_(shutdown_grace),
      exec_(stream, log), feeder_(keys, stream, log) {}

Runtime::~Runtime() { terminate(); }

void Runtime::schedule(Cmd cmd) {
  if (!cmd || state_ == State::Terminated) return;
  exec_.submit(std::move(cmd));
}

void Runtime::start_input() {
  if (state_ == State::Running) feeder_.start();
}

Runtime::Step Runtime::next(std::optional<Msg>& msg, Error& err) {
  for (;;) {
    if (state_ == State::Terminated) return Step::Quit;
    std::optional<Msg> m;
    switch (stream_->wait(m, err)) {
      case MessageStream::Wait::Closed:
        terminate();
        return Step::Quit;
      case MessageStream::Wait::Error:
        log_.error("terminating on input error: " + err.message);
        terminate();
        return Step::Failed;
      case MessageStream::Wait::Message:
        break;
    }
    if (m->is_quit()) {
      terminate();
      return Step::Quit;
    }
    if (const BatchMsg* b = m->batch()) {
      exec_.expand(*b);
      continue;
    }
    msg = std::move(m);
    return Step::Message;
  }
}

void Runtime::terminate() {
  if (state_ == State::Terminated) return;
  state_ = State::Terminated;
  stream_->close();
  exec_.shutdown(grace_);
  feeder_.stop();
}
