#include "file_reader.hpp"
#include <cerrno>
#include "posix_fd.hpp"

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  std::string data;
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd.get(), buf, sizeof(buf));
    if (n == 0) break;
    if (n < 0) {
      if (errno == EINTR) continue;
      msg = std::string("can not read file: ") + path.string();
      return false;
    }
    data.append(buf, static_cast<size_t>(n));
  }
  size_t start = 0;
  for (size_t i = 0; i < data.size(); ++i) {
    if (data[i] != '\n') continue;
    size_t end = i;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data, start, end - start);
    start = i + 1;
  }
  if (start < data.size()) {
    size_t end = data.size();
    if (data[end - 1] == '\r') end--;
    out_lines.emplace_back(data, start, end - start);
  }
  return true;
}
