#include "options.hpp"
#include <cctype>
#include <cstdlib>
#include <vector>
#include "file_reader.hpp"

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c) { return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn(static_cast<unsigned char>(s[i]))) i++;
  size_t j = s.size(); while (j > i && isspace_fn(static_cast<unsigned char>(s[j - 1]))) j--;
  return s.substr(i, j - i);
}

static bool parse_bool(const std::string& v, bool& out) {
  if (v == "1" || v == "true" || v == "on" || v == "yes") { out = true; return true; }
  if (v == "0" || v == "false" || v == "off" || v == "no") { out = false; return true; }
  return false;
}

static bool parse_ms(const std::string& v, std::chrono::milliseconds& out) {
  if (v.empty()) return false;
  long long n = 0;
  for (char c : v) {
    if (c < '0' || c > '9') return false;
    n = n * 10 + (c - '0');
    if (n > 3600000) return false;
  }
  out = std::chrono::milliseconds(n);
  return true;
}

bool set_option(ProgramOptions& opts, const std::string& key, const std::string& value, std::string& msg) {
  if (key == "alt_screen") {
    if (parse_bool(value, opts.alt_screen)) return true;
    msg = "alt_screen: expected on/off, got '" + value + "'";
    return false;
  }
  if (key == "shutdown_grace_ms") {
    if (parse_ms(value, opts.shutdown_grace)) return true;
    msg = "shutdown_grace_ms: invalid number '" + value + "'";
    return false;
  }
  if (key == "esc_delay_ms") {
    if (parse_ms(value, opts.esc_delay)) return true;
    msg = "esc_delay_ms: invalid number '" + value + "'";
    return false;
  }
  if (key == "log_file") { opts.log_file = value; return true; }
  if (key == "term") { opts.term = value; return true; }
  msg = "unknown option: " + key;
  return false;
}

bool load_options(const std::filesystem::path& path, ProgramOptions& opts, std::string& msg) {
  std::vector<std::string> lines;
  if (!read_lines(path, lines, msg)) return false;
  int lineno = 0;
  for (const auto& raw : lines) {
    lineno++;
    std::string s = trim(raw);
    if (s.empty() || s[0] == '#' || s[0] == '"') continue;
    if (s.rfind("set ", 0) == 0) s = trim(s.substr(4));
    auto eq = s.find('=');
    if (eq == std::string::npos) {
      msg = path.string() + ":" + std::to_string(lineno) + ": expected key=value";
      return false;
    }
    std::string err;
    if (!set_option(opts, trim(s.substr(0, eq)), trim(s.substr(eq + 1)), err)) {
      msg = path.string() + ":" + std::to_string(lineno) + ": " + err;
      return false;
    }
  }
  return true;
}

void apply_env(ProgramOptions& opts) {
  if (const char* v = std::getenv("MTEA_LOG"); v && *v) opts.log_file = v;
  if (const char* v = std::getenv("MTEA_TERM"); v && *v) opts.term = v;
}
