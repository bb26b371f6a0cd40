#pragma once
#include "app/Config.hpp"
#include <string>
#include <vector>

namespace reclaim::app {

struct PathEntry {
  std::string pattern;  // plain path or glob in the last component; ~ allowed
  std::string label;
};

struct CommandEntry {
  std::string cmdline;
  std::string label;
  bool needs_root{false}; // wrapped in `sudo -n` when not running as root
};

// One confirmable group of targets
struct CategorySpec {
  std::string name;
  std::string question;
  std::vector<PathEntry> paths;
  std::vector<CommandEntry> commands;
  bool processes{false};  // plan memory-heavy processes (--quit-apps)
};

struct ProfileFlags {
  bool aggressive{false};
  bool quit_apps{false};
};

// Default categories in confirmation order, minus those disabled in
// [categories]
[[nodiscard]] std::vector<CategorySpec> memory_profile(const Config& cfg, ProfileFlags flags);
[[nodiscard]] std::vector<CategorySpec> disk_profile(const Config& cfg);

} // namespace reclaim::app
