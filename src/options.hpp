#pragma once
/*
 * ProgramOptions
 *
 * Purpose: runtime settings (fds, alt screen, shutdown grace, log file).
 * Sources: defaults, rc-style file (load_options), environment (apply_env).
 * rc format: "key=value" or "set key=value"; '#' and '"' start comments.
 */
#include <chrono>
#include <filesystem>
#include <string>
#include <unistd.h>

struct ProgramOptions {
  int input_fd = STDIN_FILENO;
  int output_fd = STDOUT_FILENO;
  bool alt_screen = false;
  std::chrono::milliseconds shutdown_grace{250};
  std::chrono::milliseconds esc_delay{25};
  std::string log_file;
  std::string term; // terminfo entry; empty: $TERM
};

bool set_option(ProgramOptions& opts, const std::string& key, const std::string& value, std::string& msg);
bool load_options(const std::filesystem::path& path, ProgramOptions& opts, std::string& msg);
// MTEA_LOG -> log_file, MTEA_TERM -> term
void apply_env(ProgramOptions& opts);
