// Synchronous external commands with a hard deadline
#pragma once
#include <chrono>
#include <string>

namespace reclaim::util {

struct CommandResult {
  bool started{false};   // fork/exec of /bin/sh succeeded
  bool timed_out{false}; // deadline hit; child was terminated and reaped
  int exit_code{-1};     // valid when started && !timed_out; 128+N for signal N
  std::string output;    // merged stdout/stderr, capped
};

// Runs `/bin/sh -c cmdline` in its own process group with stdin on /dev/null.
// Never blocks past `timeout` plus a short reap window.
[[nodiscard]] CommandResult run_command(const std::string& cmdline, std::chrono::milliseconds timeout);

// First word of a command line, after any leading `sudo -n`
[[nodiscard]] std::string command_program(const std::string& cmdline);

// `command -v` equivalent: absolute/relative paths are checked directly,
// bare names are searched on $PATH.
[[nodiscard]] bool program_on_path(const std::string& program);

} // namespace reclaim::util
