#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace reclaim::app {

struct Config {
  struct Process {
    int threshold_mb{100};            // quit-apps candidates must exceed this
    int grace_ms{2000};               // wait after SIGTERM before re-checking
    std::vector<std::string> protect; // extra protected command names
  } process;
  struct Commands {
    int timeout_s{60};
  } commands;
  struct Session {
    int settle_ms{5000};              // pause before the final snapshot (memory tool)
  } session;
  struct Planner {
    bool processes_first{false};
  } planner;
  std::vector<std::string> extra_paths;
  std::vector<std::pair<std::string, bool>> categories; // [categories] toggles, file order
  std::string log_dir;                                  // empty => run log off
  std::string source_path;                              // file actually loaded, if any

  [[nodiscard]] bool category_enabled(const std::string& name) const;
};

// $XDG_CONFIG_HOME/reclaim/config.toml, else ~/.config/reclaim/config.toml
[[nodiscard]] std::string config_file_path();

// TOML -> environment -> compiled default. An explicit path that cannot be
// read is reported through `err` (defaults still apply); a missing default
// file is silently ignored.
[[nodiscard]] Config load_config(const std::string& explicit_path, std::string& err);

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace reclaim::app
