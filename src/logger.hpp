#pragma once
/*
 * Logger
 *
 * Purpose: append-only diagnostic log; stdout belongs to the UI.
 * Usage: open(path, msg) once; disabled (no-op) until opened.
 * Line format: "<local time> <LEVEL> <text>\n", one write(2) per line.
 */
#include <mutex>
#include <string>
#include <string_view>
#include "posix_fd.hpp"

class Logger {
public:
  enum class Level { Debug, Info, Error };

  bool open(const std::string& path, std::string& msg);
  bool enabled() const { return fd_.valid(); }
  void log(Level lv, std::string_view text);
  void debug(std::string_view text) { log(Level::Debug, text); }
  void info(std::string_view text) { log(Level::Info, text); }
  void error(std::string_view text) { log(Level::Error, text); }

private:
  std::mutex mu_;
  UniqueFd fd_;
};
