#include "app/RunLog.hpp"
#include "app/Accountant.hpp"
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>

namespace reclaim::app {

RunLog::RunLog(std::filesystem::path log_dir) : log_dir_(std::move(log_dir)) {}

std::string RunLog::format_line(const model::CleanupSession& s) {
  auto t = tally(s.actions);
  auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      s.end_time.time_since_epoch()).count();
  char ts_buf[32];
  auto [ptr, ec] = std::to_chars(ts_buf, ts_buf + sizeof(ts_buf), epoch_ms);
  std::string line(ts_buf, ec == std::errc() ? ptr : ts_buf);

  line += " tool=" + s.tool;
  line += s.dry_run() ? " mode=dry-run" : " mode=live";
  line += " success=" + std::to_string(t.success);
  line += " skipped=" + std::to_string(t.skipped);
  line += " failed=" + std::to_string(t.failed);
  line += " dry_run=" + std::to_string(t.dry_run);
  line += " freed_bytes=" + std::to_string(t.total_freed);
  line += " reclaimable_bytes=" + std::to_string(t.total_reclaimable);
  if (s.baseline && s.final_snapshot)
    line += " delta_bytes=" + std::to_string(compute_delta(*s.baseline, *s.final_snapshot));
  if (s.incomplete_delta) line += " incomplete_delta=1";
  line += s.cancelled ? " cancelled=1" : " cancelled=0";
  return line;
}

std::filesystem::path RunLog::chunk_path(std::chrono::system_clock::time_point when) const {
  auto when_t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
  ::localtime_r(&when_t, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "reclaim_%04d-%02d.log", tm.tm_year + 1900, tm.tm_mon + 1);
  return log_dir_ / buf;
}

bool RunLog::append(const model::CleanupSession& s) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    std::fprintf(stderr, "reclaim: RunLog: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
    return false;
  }
  auto path = chunk_path(s.end_time);
  std::ofstream file(path, std::ios::app);
  if (!file) {
    std::fprintf(stderr, "reclaim: RunLog: failed to open %s: %s\n",
                 path.c_str(), std::strerror(errno));
    return false;
  }
  auto line = format_line(s);
  line += '\n';
  file.write(line.data(), static_cast<std::streamsize>(line.size()));
  file.flush();
  return static_cast<bool>(file);
}

} // namespace reclaim::app
