#pragma once
#include "collectors/ProcessInventory.hpp"
#include "model/Action.hpp"
#include "model/Session.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>

namespace reclaim::app {

// Runs planned targets one at a time. A dry-run session never mutates
// anything; live actions each yield exactly one ActionResult.
class ActionExecutor {
public:
  struct Options {
    std::chrono::milliseconds grace{2000};           // after SIGTERM
    std::chrono::milliseconds poll{100};
    std::chrono::milliseconds command_timeout{60000};
  };

  // inventory: re-reads a process right before it is signalled
  // cancel: checked before each target; non-zero stops scheduling
  ActionExecutor(Options opt, const collectors::ProcessInventory& inventory,
                 const std::atomic<int>* cancel = nullptr);

  // Appends one result per attempted target of session.planned
  void execute(model::CleanupSession& session) const;

  [[nodiscard]] model::ActionResult execute_one(const model::CleanupTarget& t, model::RunMode mode) const;

  // false when the pid is gone or a zombie
  [[nodiscard]] static bool process_alive(int32_t pid);

private:
  [[nodiscard]] model::ActionResult remove_file(const model::CleanupTarget& t) const;
  [[nodiscard]] model::ActionResult terminate_process(const model::CleanupTarget& t) const;
  [[nodiscard]] model::ActionResult run_command(const model::CleanupTarget& t) const;

  Options opt_;
  const collectors::ProcessInventory& inventory_;
  const std::atomic<int>* cancel_{};
};

} // namespace reclaim::app
