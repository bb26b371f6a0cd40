#pragma once
#include "app/Profiles.hpp"
#include "collectors/ProcessInventory.hpp"
#include "model/Action.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace reclaim::app {

struct Plan {
  std::vector<model::CleanupTarget> targets;   // execution order after order()
  std::vector<model::ActionResult> immediate;  // planning-time Skipped results
  std::vector<std::string> claimed_paths;      // file targets already planned
};

// Turns categories into an ordered list of cleanup targets. Planning only
// reads: directory listings, sizes, $PATH and the process inventory.
class ActionPlanner {
public:
  struct Options {
    uint64_t process_threshold_bytes{100ull * 1024 * 1024};
    bool processes_first{false};
    bool elevate{false};   // prefix root-only commands with `sudo -n`
    std::string home;      // ~ expansion; empty => $HOME
  };

  ActionPlanner(const collectors::ProcessInventory& inventory, Options opt);

  [[nodiscard]] const collectors::ProcessInventory& inventory() const { return inventory_; }

  // Appends the category's targets and immediate results to `plan`
  void plan_category(const CategorySpec& cat, Plan& plan) const;

  // All categories, no confirmation, ordered
  [[nodiscard]] Plan plan(const std::vector<CategorySpec>& cats) const;

  // File and command targets before process targets (or the reverse),
  // stable within each group
  void order(Plan& plan) const;

  [[nodiscard]] std::string expand_home(const std::string& pattern) const;

  // Glob characters in the last component make it a one-level pattern over
  // the parent directory (hidden entries included, sorted by name). A plain
  // path yields itself when it exists (symlinks are not followed).
  [[nodiscard]] static std::vector<std::filesystem::path> expand_pattern(const std::string& expanded);

private:
  void plan_paths(const CategorySpec& cat, Plan& plan) const;
  void plan_commands(const CategorySpec& cat, Plan& plan) const;
  void plan_processes(const CategorySpec& cat, Plan& plan) const;

  const collectors::ProcessInventory& inventory_;
  Options opt_;
};

} // namespace reclaim::app
