#pragma once
/*
 * Program
 *
 * Purpose: Elm-style terminal program: init/update/view supplied by the
 *          application, the loop owns the model and sequences transitions.
 * Usage:
 *   Program<int> p(init, update, view);
 *   if (auto err = p.start()) { ... err->message ... }
 * Note: the model is only touched on the thread calling start(); commands
 *       run concurrently and talk back through messages. A Program runs once.
 */
#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include "error.hpp"
#include "ikey_source.hpp"
#include "iterminal.hpp"
#include "logger.hpp"
#include "message_stream.hpp"
#include "msg.hpp"
#include "options.hpp"
#include "renderer.hpp"
#include "runtime.hpp"
#include "terminal.hpp"
#include "tty_key_source.hpp"
#include "tty_terminal.hpp"

template <std::movable Model>
class Program {
public:
  using Init = std::function<std::pair<Model, Cmd>()>;
  using Update = std::function<std::pair<Model, Cmd>(const Msg&, Model)>;
  using View = std::function<std::string(const Model&)>;

  // Runs on the process tty (options.input_fd / options.output_fd).
  Program(Init init, Update update, View view, ProgramOptions opts = {})
      : init_(std::move(init)), update_(std::move(update)), view_(std::move(view)), opts_(std::move(opts)),
        owned_term_(std::make_unique<TtyTerminal>(opts_.input_fd, opts_.output_fd, opts_.term)),
        owned_keys_(std::make_unique<TtyKeySource>(opts_.input_fd, opts_.esc_delay, owned_term_->key_map())),
        term_(*owned_term_), keys_(*owned_keys_), renderer_(term_) {}

  Program(Init init, Update update, View view, ITerminal& term, IKeySource& keys, ProgramOptions opts = {})
      : init_(std::move(init)), update_(std::move(update)), view_(std::move(view)), opts_(std::move(opts)),
        term_(term), keys_(keys), renderer_(term_) {}

  Program(const Program&) = delete;
  Program& operator=(const Program&) = delete;

  // Runs until quit (empty result) or a fatal input error.
  std::optional<Error> start() {
    if (started_) return Error{0, "program already started"};
    started_ = true;
    if (!opts_.log_file.empty() && !log_.enabled()) {
      std::string msg;
      if (!log_.open(opts_.log_file, msg)) return Error{0, msg};
    }

    Terminal session(term_);
    Error err;
    if (!session.acquire(err)) {
      log_.error("terminal setup failed: " + err.message);
      return err;
    }
    if (opts_.alt_screen) renderer_.enter_alt_screen();

    Runtime rt(stream_, keys_, log_, opts_.shutdown_grace);
    auto [model, cmd] = init_();
    rt.schedule(std::move(cmd));
    renderer_.render(view_(model));
    rt.start_input();
    log_.info("program started");

    for (;;) {
      std::optional<Msg> msg;
      switch (rt.next(msg, err)) {
        case Runtime::Step::Quit:
          log_.info("program quit");
          return std::nullopt;
        case Runtime::Step::Failed:
          return err;
        case Runtime::Step::Message:
          break;
      }
      auto next = update_(*msg, std::move(model));
      model = std::move(next.first);
      rt.schedule(std::move(next.second));
      renderer_.render(view_(model));
    }
  }

  // Thread-safe; dropped once the program has terminated.
  bool send(Msg m) { return stream_->push(std::move(m)); }
  bool quit() { return send(quit_msg()); }

  void enter_alt_screen() { renderer_.enter_alt_screen(); }
  void exit_alt_screen() { renderer_.exit_alt_screen(); }

  std::string last_frame() const { return renderer_.last_frame(); }
  Logger& logger() { return log_; }

private:
  Init init_;
  Update update_;
  View view_;
  ProgramOptions opts_;
  std::unique_ptr<TtyTerminal> owned_term_;
  std::unique_ptr<IKeySource> owned_keys_;
  ITerminal& term_;
  IKeySource& keys_;
  Renderer renderer_;
  Logger log_;
  std::shared_ptr<MessageStream> stream_ = std::make_shared<MessageStream>();
  bool started_ = false;
};
