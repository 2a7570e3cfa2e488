#pragma once
/*
 * Runtime
 *
 * Purpose: dispatch engine of one program run: owns the command executor and
 *          the input feeder, and turns the message stream into loop steps.
 * States: Running -> Terminated. Quit and input failure terminate; batch
 *         messages are expanded here and never surface as steps.
 * Note: terminate() closes the stream, stops every task and is idempotent.
 */
#include <chrono>
#include <memory>
#include <optional>
#include "error.hpp"
#include "executor.hpp"
#include "ikey_source.hpp"
#include "input_feeder.hpp"
#include "logger.hpp"
#include "message_stream.hpp"
#include "msg.hpp"

class Runtime {
public:
  enum class State { Running, Terminated };
  enum class Step { Message, Quit, Failed };

  Runtime(std::shared_ptr<MessageStream> stream, IKeySource& keys, Logger& log,
          std::chrono::milliseconds shutdown_grace);
  ~Runtime();
  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  void schedule(Cmd cmd);
  void start_input();
  // Blocks for the next message the application must see.
  Step next(std::optional<Msg>& msg, Error& err);
  void terminate();

  State state() const { return state_; }
  const CommandExecutor& executor() const { return exec_; }

private:
  std::shared_ptr<MessageStream> stream_;
  Logger& log_;
  std::chrono::milliseconds grace_;
  CommandExecutor exec_;
  InputFeeder feeder_;
  State state_ = State::Running;
};
