#pragma once
#include "model/Action.hpp"
#include "model/Resource.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace reclaim::app {

struct Tally {
  uint64_t total_freed{};        // Success only
  uint64_t total_reclaimable{};  // DryRun only
  size_t success{};
  size_t skipped{};
  size_t failed{};
  size_t dry_run{};
  size_t items_removed{};        // successful File targets

  [[nodiscard]] size_t total() const { return success + skipped + failed + dry_run; }
};

[[nodiscard]] Tally tally(const std::vector<model::ActionResult>& actions);

// final.available - baseline.available; negative when memory got tighter
[[nodiscard]] int64_t compute_delta(const model::ResourceSnapshot& baseline,
                                    const model::ResourceSnapshot& final_snapshot);

} // namespace reclaim::app
