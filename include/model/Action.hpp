#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace reclaim::model {

enum class TargetKind { File, Process, Command };

enum class ActionStatus { Success, Skipped, Failed, DryRun };

enum class ErrorKind {
  PlatformUnsupported,
  MetricsUnavailable,
  PermissionDenied,
  ActionFailed,
  TargetNotFound,
  Timeout
};

struct CleanupTarget {
  std::string identifier;  // path, pid or command line
  TargetKind kind{TargetKind::File};
  uint64_t size_bytes{};   // File only
  std::string label;
  std::string category;
  int32_t pid{};           // Process only
  uint64_t resident_bytes{}; // Process only, informational
  std::string command;       // Process only, comm at planning time
  uint64_t start_ticks{};    // Process only, starttime at planning time
};

struct ActionResult {
  CleanupTarget target;
  ActionStatus status{ActionStatus::Skipped};
  uint64_t bytes_freed{};       // non-zero only for Success
  uint64_t bytes_reclaimable{}; // would-be effect, DryRun only
  std::optional<ErrorKind> error;
  std::string detail;
};

[[nodiscard]] const char* to_string(TargetKind k);
[[nodiscard]] const char* to_string(ActionStatus s);
[[nodiscard]] const char* to_string(ErrorKind e);

} // namespace reclaim::model
