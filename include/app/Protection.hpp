#pragma once

#include "model/Process.hpp"
#include <cstdint>
#include <string>
#include <unordered_set>

namespace reclaim::app {

// Which processes may never be targeted: a name set plus identity checks
// (own pid, parent pid, init, kernel threads).
class ProtectionPolicy {
public:
  ProtectionPolicy();
  ProtectionPolicy(int32_t self_pid, int32_t parent_pid,
                   std::unordered_set<std::string> names = default_names());

  [[nodiscard]] static const std::unordered_set<std::string>& default_names();

  void add_name(const std::string& name);

  [[nodiscard]] bool is_protected(const model::ProcessRecord& p) const;
  // Empty when not protected
  [[nodiscard]] std::string reason(const model::ProcessRecord& p) const;

  [[nodiscard]] int32_t self_pid() const { return self_pid_; }
  [[nodiscard]] int32_t parent_pid() const { return parent_pid_; }

private:
  int32_t self_pid_{};
  int32_t parent_pid_{};
  std::unordered_set<std::string> names_;
};

} // namespace reclaim::app
