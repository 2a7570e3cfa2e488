#include "error.hpp"
#include <cstring>

Error errno_error(const std::string& what, int err) {
  return Error{err, what + ": " + std::strerror(err)};
}
