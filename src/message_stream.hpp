#pragma once
/*
 * MessageStream
 *
 * Purpose: the loop's inbox; a message lane plus an error lane.
 * Producers: input feeder, command tasks, Program::send.
 * Note: pushes never block; after close() they are dropped.
 *       A pending error is reported before queued messages.
 */
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include "error.hpp"
#include "msg.hpp"

class MessageStream {
public:
  enum class Wait { Message, Error, Closed };

  bool push(Msg m);
  bool fail(Error e);
  Wait wait(std::optional<Msg>& msg, Error& err);
  void close();
  bool closed() const;
  size_t pending() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Msg> msgs_;
  std::optional<Error> err_;
  bool closed_ = false;
};
