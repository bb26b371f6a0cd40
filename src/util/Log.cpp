#include "util/Log.hpp"

#include <unistd.h>

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace reclaim::util {

static std::atomic<bool> g_verbose{false};

void set_verbose(bool on) { g_verbose.store(on); }
bool verbose_enabled() { return g_verbose.load(); }

static const char* tag(LogLevel level) {
  switch (level) {
    case LogLevel::Info: return "INFO";
    case LogLevel::Success: return "SUCCESS";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Verbose: return "VERBOSE";
  }
  return "?";
}

static const char* color(LogLevel level) {
  switch (level) {
    case LogLevel::Info: return "\x1B[0;34m";
    case LogLevel::Success: return "\x1B[0;32m";
    case LogLevel::Warning: return "\x1B[1;33m";
    case LogLevel::Error: return "\x1B[0;31m";
    case LogLevel::Verbose: return "\x1B[0;36m";
  }
  return "";
}

void log_line(LogLevel level, const char* fmt, ...) {
  if (level == LogLevel::Verbose && !g_verbose.load()) return;
  const bool tty = ::isatty(STDERR_FILENO) == 1;
  char msg[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);
  if (tty) std::fprintf(stderr, "%s[%s]\x1B[0m %s\n", color(level), tag(level), msg);
  else std::fprintf(stderr, "[%s] %s\n", tag(level), msg);
}

} // namespace reclaim::util
