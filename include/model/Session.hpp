#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "model/Action.hpp"
#include "model/Process.hpp"
#include "model/Resource.hpp"

namespace reclaim::model {

enum class RunMode { Live, DryRun };

enum class SessionStage { Created, BaselineCollected, Planned, Executed, FinalCollected, Reported };

struct CleanupSession {
  std::string tool;                    // "reclaim-mem" / "reclaim-disk"
  RunMode mode{RunMode::Live};
  SessionStage stage{SessionStage::Created};
  std::optional<ResourceSnapshot> baseline;
  std::optional<ResourceSnapshot> final_snapshot;
  std::vector<ProcessRecord> top_processes; // largest residents at baseline time
  std::vector<CleanupTarget> planned;
  std::vector<ActionResult> actions;   // append-only, in execution order
  std::chrono::system_clock::time_point start_time{};
  std::chrono::system_clock::time_point end_time{};
  bool incomplete_delta{false};        // final collection failed, baseline reused
  bool cancelled{false};
  size_t not_attempted{};              // targets left unscheduled after cancellation

  [[nodiscard]] bool dry_run() const { return mode == RunMode::DryRun; }
};

[[nodiscard]] const char* to_string(SessionStage s);

} // namespace reclaim::model
