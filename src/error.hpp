#pragma once
/*
 * Error
 *
 * Purpose: error value returned by fallible runtime operations.
 * Note: code carries errno when the failure came from a system call, else 0.
 */
#include <string>

struct Error {
  int code = 0;
  std::string message;

  bool operator==(const Error&) const = default;
};

Error errno_error(const std::string& what, int err);
