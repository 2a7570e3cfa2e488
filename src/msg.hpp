#pragma once
/*
 * Msg / Cmd
 *
 * Purpose: message variant driving transitions, and deferred commands.
 * Msg: closed variant {Quit, Batch, Key, App}; the loop handles Quit/Batch
 *      itself, Key/App reach the application's update function.
 * Cmd: callable yielding at most one Msg; an empty Cmd is the no-op command.
 *      The stop_token is requested when the program terminates.
 */
#include <any>
#include <chrono>
#include <functional>
#include <optional>
#include <stop_token>
#include <utility>
#include <variant>
#include <vector>
#include "key.hpp"

class Msg;

using Cmd = std::function<std::optional<Msg>(std::stop_token)>;

struct QuitMsg {};

struct BatchMsg {
  std::vector<Cmd> cmds;
};

struct AppMsg {
  std::any payload;
};

class Msg {
public:
  Msg(QuitMsg q) : v_(q) {}
  Msg(BatchMsg b) : v_(std::move(b)) {}
  Msg(KeyMsg k) : v_(k) {}
  Msg(AppMsg a) : v_(std::move(a)) {}

  bool is_quit() const { return std::holds_alternative<QuitMsg>(v_); }
  const BatchMsg* batch() const { return std::get_if<BatchMsg>(&v_); }
  const KeyMsg* key() const { return std::get_if<KeyMsg>(&v_); }

  // Application payload of type T, or nullptr.
  template <typename T>
  const T* as() const {
    const AppMsg* a = std::get_if<AppMsg>(&v_);
    return a ? std::any_cast<T>(&a->payload) : nullptr;
  }

private:
  std::variant<QuitMsg, BatchMsg, KeyMsg, AppMsg> v_;
};

template <typename T>
Msg make_msg(T payload) {
  return Msg(AppMsg{std::any(std::move(payload))});
}

Msg quit_msg();

// Cmd whose result is the quit message.
Cmd quit();

// Adapt a callable that ignores cancellation into a Cmd.
Cmd make_cmd(std::function<std::optional<Msg>()> fn);

// Fan-out of several commands with no ordering guarantee between results.
// Empty entries are discarded; with nothing left the result is an empty Cmd.
Cmd batch(std::vector<Cmd> cmds);

template <typename... Cmds>
Cmd batch(Cmds... cmds) {
  std::vector<Cmd> v;
  v.reserve(sizeof...(cmds));
  (v.emplace_back(std::move(cmds)), ...);
  return batch(std::move(v));
}

// Waits `d` (cut short by program stop, yielding nothing) then yields fn().
Cmd tick(std::chrono::milliseconds d, std::function<Msg()> fn);
