#pragma once
/*
 * CommandExecutor
 *
 * Purpose: run each non-empty Cmd on its own task and deliver its result to
 *          the message stream; expand batch messages into submissions.
 * Note: one stop_source per run; shutdown() requests stop, refuses further
 *       submissions and waits up to a grace period for running commands.
 *       Tasks share ownership of the stream, so stragglers stay safe.
 */
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stop_token>
#include "logger.hpp"
#include "message_stream.hpp"
#include "msg.hpp"

class CommandExecutor {
public:
  CommandExecutor(std::shared_ptr<MessageStream> out, Logger& log);
  ~CommandExecutor();
  CommandExecutor(const CommandExecutor&) = delete;
  CommandExecutor& operator=(const CommandExecutor&) = delete;

  // false: empty command, or executor already shut down (command dropped)
  bool submit(Cmd cmd);
  // Submit every command of the batch in list order; returns number submitted.
  size_t expand(const BatchMsg& b);
  // Returns number of commands still running when the grace period ended.
  size_t shutdown(std::chrono::milliseconds grace);

  size_t running() const;
  size_t executed() const;

private:
  struct Tasks {
    mutable std::mutex mu;
    std::condition_variable cv;
    size_t running = 0;
    size_t executed = 0;
  };

  std::shared_ptr<MessageStream> out_;
  std::shared_ptr<Tasks> tasks_;
  Logger& log_;
  std::stop_source stop_;
  bool closed_ = false;
};
