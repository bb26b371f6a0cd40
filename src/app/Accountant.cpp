#include "app/Accountant.hpp"

namespace reclaim::app {

Tally tally(const std::vector<model::ActionResult>& actions) {
  Tally t{};
  for (const auto& a : actions) {
    switch (a.status) {
      case model::ActionStatus::Success:
        ++t.success;
        t.total_freed += a.bytes_freed;
        if (a.target.kind == model::TargetKind::File) ++t.items_removed;
        break;
      case model::ActionStatus::Skipped: ++t.skipped; break;
      case model::ActionStatus::Failed:  ++t.failed; break;
      case model::ActionStatus::DryRun:
        ++t.dry_run;
        t.total_reclaimable += a.bytes_reclaimable;
        break;
    }
  }
  return t;
}

int64_t compute_delta(const model::ResourceSnapshot& baseline,
                      const model::ResourceSnapshot& final_snapshot) {
  return static_cast<int64_t>(final_snapshot.available_bytes) -
         static_cast<int64_t>(baseline.available_bytes);
}

} // namespace reclaim::app
