#pragma once
/*
 * HeadlessTerminal / ScriptedKeySource
 *
 * Purpose: in-memory terminal session and key source for tests and headless
 *          runs; records raw-mode transitions, clears and writes.
 * Note: both are thread-safe; the runtime drives them from several tasks.
 */
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "ikey_source.hpp"
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  bool enter_raw_mode(Error& err) override;
  void restore() override;
  void clear_lines(int n) override;
  void enter_alt_screen() override;
  void exit_alt_screen() override;
  void write(std::string_view s) override;

  // Make the next enter_raw_mode fail with e.
  void fail_setup(Error e);

  int raw_entries() const;
  int restores() const;
  bool raw() const;
  bool alt_screen() const;
  std::vector<int> clears() const;
  std::vector<std::string> writes() const;
  std::string output() const;

private:
  mutable std::mutex mu_;
  bool fail_ = false;
  Error setup_err_;
  int raw_entries_ = 0;
  int restores_ = 0;
  bool raw_ = false;
  bool alt_ = false;
  std::vector<int> clears_;
  std::vector<std::string> writes_;
  std::string output_;
};

class ScriptedKeySource : public IKeySource {
public:
  void push_key(const KeyMsg& k);
  // Decode `bytes` as if typed in one burst.
  void push_bytes(std::string_view bytes);
  void push_error(Error e);
  KeyRead read_key(std::stop_token st, KeyMsg& out, Error& err) override;
  int reads() const;

private:
  mutable std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<std::variant<KeyMsg, Error>> q_;
  int reads_ = 0;
};
