#pragma once
#include <string>

namespace reclaim::app {

struct ToolInfo {
  const char* name;     // argv[0] shown in usage and reports
  bool memory_tool;     // accepts -a/-q, settles before the final sample
  bool summary_default; // full report without --summary
};

struct CliOptions {
  bool yes{false};
  bool verbose{false};
  bool dry_run{false};
  bool summary{false};
  bool aggressive{false};
  bool quit_apps{false};
  bool help{false};
  bool version{false};
  std::string config_path;
  std::string log_dir;
};

inline constexpr const char* kVersion = "1.0.0";

// Long options, combinable short flags (-yv), --opt=value and --opt value.
// false with err on bad usage.
[[nodiscard]] bool parse_args(int argc, char** argv, const ToolInfo& tool,
                              CliOptions& opts, std::string& err);

[[nodiscard]] std::string usage(const ToolInfo& tool);

// false with err unless running on Linux
[[nodiscard]] bool platform_supported(std::string& err);

// Whole program: returns the process exit code
int run(int argc, char** argv, const ToolInfo& tool);

} // namespace reclaim::app
