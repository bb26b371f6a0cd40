#include "ui/Terminal.hpp"
#include <unistd.h>
#include <csignal>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace reclaim::ui {

std::atomic<int> g_signal{0};

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* ignore */ }
}

void on_terminate_signal(int signo) {
  // Only record it; the executor checks between actions
  g_signal.store(signo);
  const char* msg = "\nreclaim: interrupt received, finishing current action\n";
  best_effort_write(STDERR_FILENO, msg, std::strlen(msg));
}

void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_terminate_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0; // no SA_RESTART: blocking reads (prompts) return EINTR
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
}

bool tty_stdout() { return ::isatty(STDOUT_FILENO) == 1; }

bool use_unicode() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  std::string s = lc;
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s.find("utf") != std::string::npos;
}

std::string sgr(const char* code, bool enabled) {
  if (!enabled) return {};
  return std::string("\x1B[") + code + "m";
}

std::string sgr_reset(bool enabled) { return enabled ? std::string("\x1B[0m") : std::string(); }

bool ask_yes_no(const std::string& question) {
  bool color = tty_stdout();
  std::cout << sgr("1;33", color) << question << sgr_reset(color) << " (y/N): " << std::flush;
  std::string reply;
  if (!std::getline(std::cin, reply)) {
    std::cin.clear();
    std::cout << "\n";
    return false;
  }
  return reply == "y" || reply == "Y";
}

} // namespace reclaim::ui
