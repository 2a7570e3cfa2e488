#include "msg.hpp"
#include <condition_variable>
#include <mutex>

Msg quit_msg() { return Msg(QuitMsg{}); }

Cmd quit() {
  return [](std::stop_token) -> std::optional<Msg> { return quit_msg(); };
}

Cmd make_cmd(std::function<std::optional<Msg>()> fn) {
  if (!fn) return Cmd{};
  return [fn = std::move(fn)](std::stop_token) -> std::optional<Msg> { return fn(); };
}

Cmd batch(std::vector<Cmd> cmds) {
  std::vector<Cmd> live;
  live.reserve(cmds.size());
  for (auto& c : cmds) {
    if (c) live.push_back(std::move(c));
  }
  if (live.empty()) return Cmd{};
  return [live = std::move(live)](std::stop_token) -> std::optional<Msg> {
    return Msg(BatchMsg{live});
  };
}

Cmd tick(std::chrono::milliseconds d, std::function<Msg()> fn) {
  return [d, fn = std::move(fn)](std::stop_token st) -> std::optional<Msg> {
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(mu);
    (void)cv.wait_for(lk, st, d, [] { return false; });
    if (st.stop_requested()) return std::nullopt;
    return fn();
  };
}
