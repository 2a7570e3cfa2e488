#include "headless_terminal.hpp"

bool HeadlessTerminal::enter_raw_mode(Error& err) {
  std::lock_guard<std::mutex> lk(mu_);
  if (fail_) { fail_ = false; err = setup_err_; return false; }
  raw_entries_++;
  raw_ = true;
  return true;
}

void HeadlessTerminal::restore() {
  std::lock_guard<std::mutex> lk(mu_);
  restores_++;
  raw_ = false;
  alt_ = false;
}

void HeadlessTerminal::clear_lines(int n) {
  std::lock_guard<std::mutex> lk(mu_);
  clears_.push_back(n);
}

void HeadlessTerminal::enter_alt_screen() { std::lock_guard<std::mutex> lk(mu_); alt_ = true; }
void HeadlessTerminal::exit_alt_screen() { std::lock_guard<std::mutex> lk(mu_); alt_ = false; }

void HeadlessTerminal::write(std::string_view s) {
  std::lock_guard<std::mutex> lk(mu_);
  writes_.emplace_back(s);
  output_.append(s.data(), s.size());
}

void HeadlessTerminal::fail_setup(Error e) {
  std::lock_guard<std::mutex> lk(mu_);
  fail_ = true;
  setup_err_ = std::move(e);
}

int HeadlessTerminal::raw_entries() const { std::lock_guard<std::mutex> lk(mu_); return raw_entries_; }
int HeadlessTerminal::restores() const { std::lock_guard<std::mutex> lk(mu_); return restores_; }
bool HeadlessTerminal::raw() const { std::lock_guard<std::mutex> lk(mu_); return raw_; }
bool HeadlessTerminal::alt_screen() const { std::lock_guard<std::mutex> lk(mu_); return alt_; }
std::vector<int> HeadlessTerminal::clears() const { std::lock_guard<std::mutex> lk(mu_); return clears_; }
std::vector<std::string> HeadlessTerminal::writes() const { std::lock_guard<std::mutex> lk(mu_); return writes_; }
std::string HeadlessTerminal::output() const { std::lock_guard<std::mutex> lk(mu_); return output_; }

void ScriptedKeySource::push_key(const KeyMsg& k) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    q_.emplace_back(k);
  }
  cv_.notify_all();
}

void ScriptedKeySource::push_bytes(std::string_view bytes) {
  while (!bytes.empty()) {
    KeyMsg k;
    size_t n = decode_key(bytes, k, false);
    if (n == 0) break;
    bytes.remove_prefix(n);
    if (k.type != KeyType::Unknown) push_key(k);
  }
}

void ScriptedKeySource::push_error(Error e) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    q_.emplace_back(std::move(e));
  }
  cv_.notify_all();
}

KeyRead ScriptedKeySource::read_key(std::stop_token st, KeyMsg& out, Error& err) {
  std::unique_lock<std::mutex> lk(mu_);
  reads_++;
  if (!cv_.wait(lk, st, [this] { return !q_.empty(); })) return KeyRead::Stopped;
  auto item = std::move(q_.front());
  q_.pop_front();
  if (auto* e = std::get_if<Error>(&item)) { err = std::move(*e); return KeyRead::Failed; }
  out = std::get<KeyMsg>(item);
  return KeyRead::Key;
}

int ScriptedKeySource::reads() const {
  std::lock_guard<std::mutex> lk(mu_);
  return reads_;
}
