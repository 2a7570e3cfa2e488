#include "message_stream.hpp"

bool MessageStream::push(Msg m) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return false;
    msgs_.push_back(std::move(m));
  }
  cv_.notify_one();
  return true;
}

bool MessageStream::fail(Error e) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_ || err_) return false;
    err_ = std::move(e);
  }
  cv_.notify_one();
  return true;
}

MessageStream::Wait MessageStream::wait(std::optional<Msg>& msg, Error& err) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this] { return closed_ || err_ || !msgs_.empty(); });
  if (closed_) return Wait::Closed;
  if (err_) { err = *err_; return Wait::Error; }
  msg.emplace(std::move(msgs_.front()));
  msgs_.pop_front();
  return Wait::Message;
}

void MessageStream::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    msgs_.clear();
  }
  cv_.notify_all();
}

bool MessageStream::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

size_t MessageStream::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return msgs_.size();
}
