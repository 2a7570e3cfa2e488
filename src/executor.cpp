#include "executor.hpp"
#include <string>
#include <system_error>
#include <thread>

CommandExecutor::CommandExecutor(std::shared_ptr<MessageStream> out, Logger& log)
    : out_(std::move(out)), tasks_(std::make_shared<Tasks>()), log_(log) {}

CommandExecutor::~CommandExecutor() {
  shutdown(std::chrono::milliseconds(0));
}

bool CommandExecutor::submit(Cmd cmd) {
  if (!cmd) return false;
  {
    std::lock_guard<std::mutex> lk(tasks_->mu);
    if (closed_) {
      log_.debug("command dropped: executor shut down");
      return false;
    }
    tasks_->running++;
  }
  try {
    std::thread([tasks = tasks_, out = out_, st = stop_.get_token(), cmd = std::move(cmd)] {
      std::optional<Msg> result = cmd(st);
      if (result) out->push(std::move(*result));
      std::lock_guard<std::mutex> lk(tasks->mu);
      tasks->running--;
      tasks->executed++;
      tasks->cv.notify_all();
    }).detach();
  } catch (const std::system_error& e) {
    {
      std::lock_guard<std::mutex> lk(tasks_->mu);
      tasks_->running--;
    }
    log_.error(std::string("can not start command task: ") + e.what());
    throw;
  }
  return true;
}

size_t CommandExecutor::expand(const BatchMsg& b) {
  size_t n = 0;
  for (const auto& c : b.cmds) {
    if (submit(c)) n++;
  }
  return n;
}

size_t CommandExecutor::shutdown(std::chrono::milliseconds grace) {
  {
    std::lock_guard<std::mutex> lk(tasks_->mu);
    if (closed_) return tasks_->running;
    closed_ = true;
  }
  stop_.request_stop();
  std::unique_lock<std::mutex> lk(tasks_->mu);
  tasks_->cv.wait_for(lk, grace, [this] { return tasks_->running == 0; });
  size_t left = tasks_->running;
  if (left > 0) log_.info(std::to_string(left) + " command(s) still running at shutdown; results will be dropped");
  return left;
}

size_t CommandExecutor::running() const {
  std::lock_guard<std::mutex> lk(tasks_->mu);
  return tasks_->running;
}

size_t CommandExecutor::executed() const {
  std::lock_guard<std::mutex> lk(tasks_->mu);
  return tasks_->executed;
}
