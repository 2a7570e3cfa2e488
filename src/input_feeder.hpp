#pragma once
/*
 * InputFeeder
 *
 * Purpose: long-lived task turning key reads into KeyMsg deliveries.
 * Failure: the read error goes to the stream's error lane, then the task ends.
 * Stop: stop() requests stop on the task and joins it.
 */
#include <memory>
#include <thread>
#include "ikey_source.hpp"
#include "logger.hpp"
#include "message_stream.hpp"

class InputFeeder {
public:
  InputFeeder(IKeySource& keys, std::shared_ptr<MessageStream> out, Logger& log);
  ~InputFeeder();
  InputFeeder(const InputFeeder&) = delete;
  InputFeeder& operator=(const InputFeeder&) = delete;

  void start();
  void stop();
  bool running() const { return thread_.joinable(); }

private:
  void run(std::stop_token st);

  IKeySource& keys_;
  std::shared_ptr<MessageStream> out_;
  Logger& log_;
  std::jthread thread_;
};
