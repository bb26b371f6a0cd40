#pragma once

#include <atomic>
#include <string>

namespace reclaim::ui {

// Last termination signal received (SIGINT/SIGTERM), 0 when none
extern std::atomic<int> g_signal;

void on_terminate_signal(int signo);
void install_signal_handlers();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();
[[nodiscard]] bool use_unicode();

// SGR code generation; empty when the stream is not a terminal
[[nodiscard]] std::string sgr(const char* code, bool enabled);
[[nodiscard]] std::string sgr_reset(bool enabled);

// "<question> (y/N): " on stdout, answer from stdin. EOF or anything but
// y/Y declines.
[[nodiscard]] bool ask_yes_no(const std::string& question);

// Best-effort write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);

} // namespace reclaim::ui
