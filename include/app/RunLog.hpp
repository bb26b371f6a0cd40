#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "model/Session.hpp"

namespace reclaim::app {

// Appends one line per finished session to a monthly chunk
// (reclaim_YYYY-MM.log) under log_dir.
class RunLog {
public:
  explicit RunLog(std::filesystem::path log_dir);

  // false (with a diagnostic on stderr) when the chunk cannot be written
  [[nodiscard]] bool append(const model::CleanupSession& s);

  [[nodiscard]] static std::string format_line(const model::CleanupSession& s);
  [[nodiscard]] std::filesystem::path chunk_path(std::chrono::system_clock::time_point when) const;

private:
  std::filesystem::path log_dir_;
};

} // namespace reclaim::app
