#pragma once

namespace reclaim::util {

enum class LogLevel { Info, Success, Warning, Error, Verbose };

// Verbose lines are dropped unless enabled (--verbose)
void set_verbose(bool on);
[[nodiscard]] bool verbose_enabled();

// printf-style, one line to stderr with a coloured [LEVEL] tag on terminals
void log_line(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace reclaim::util

#define RECLAIM_LOG_INFO(...)    ::reclaim::util::log_line(::reclaim::util::LogLevel::Info, __VA_ARGS__)
#define RECLAIM_LOG_SUCCESS(...) ::reclaim::util::log_line(::reclaim::util::LogLevel::Success, __VA_ARGS__)
#define RECLAIM_LOG_WARN(...)    ::reclaim::util::log_line(::reclaim::util::LogLevel::Warning, __VA_ARGS__)
#define RECLAIM_LOG_ERROR(...)   ::reclaim::util::log_line(::reclaim::util::LogLevel::Error, __VA_ARGS__)
#define RECLAIM_LOG_VERBOSE(...) ::reclaim::util::log_line(::reclaim::util::LogLevel::Verbose, __VA_ARGS__)
