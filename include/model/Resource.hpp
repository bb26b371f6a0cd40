#pragma once
#include <chrono>
#include <cstdint>
#include <optional>

namespace reclaim::model {

// Point-in-time memory accounting. used + available == total always holds for
// snapshots produced by MetricsCollector.
struct ResourceSnapshot {
  uint64_t total_bytes{};
  uint64_t used_bytes{};       // active + wired + compressed
  uint64_t free_bytes{};
  uint64_t inactive_bytes{};
  uint64_t active_bytes{};
  uint64_t wired_bytes{};      // unevictable
  uint64_t compressed_bytes{}; // zsmalloc pool
  bool compressor_present{true}; // false: no nr_zspages, compressed_bytes is 0
  uint64_t available_bytes{};  // free + inactive
  std::optional<double> pressure_pct; // unset = unknown
  std::chrono::system_clock::time_point timestamp{};

  // Timestamp excluded
  [[nodiscard]] bool same_readings(const ResourceSnapshot& o) const {
    return total_bytes == o.total_bytes && used_bytes == o.used_bytes &&
           free_bytes == o.free_bytes && inactive_bytes == o.inactive_bytes &&
           active_bytes == o.active_bytes && wired_bytes == o.wired_bytes &&
           compressed_bytes == o.compressed_bytes && compressor_present == o.compressor_present &&
           available_bytes == o.available_bytes &&
           pressure_pct == o.pressure_pct;
  }
};

} // namespace reclaim::model
