#include "logger.hpp"
#include <ctime>

static const char* level_name(Logger::Level lv) {
  switch (lv) {
    case Logger::Level::Debug: return "DEBUG";
    case Logger::Level::Info: return "INFO";
    case Logger::Level::Error: return "ERROR";
  }
  return "?";
}

bool Logger::open(const std::string& path, std::string& msg) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) { msg = errno_error("can not open log file " + path, errno).message; return false; }
  std::lock_guard<std::mutex> lk(mu_);
  fd_.reset(fd);
  return true;
}

void Logger::log(Level lv, std::string_view text) {
  if (!fd_.valid()) return;
  char ts[32];
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&now, &tm);
  size_t n = std::strftime(ts, sizeof(ts), "%Y-%m-%dT%H:%M:%S", &tm);
  std::string line(ts, n);
  line += ' ';
  line += level_name(lv);
  line += ' ';
  line.append(text.data(), text.size());
  line += '\n';
  std::lock_guard<std::mutex> lk(mu_);
  const char* p = line.data();
  size_t remain = line.size();
  while (remain > 0) {
    ssize_t w = ::write(fd_.get(), p, remain);
    if (w < 0) {
      if (errno == EINTR) continue;
      return; // best effort
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
}
