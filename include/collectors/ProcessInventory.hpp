#pragma once
#include "app/Protection.hpp"
#include "model/Process.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace reclaim::collectors {

// Scans /proc/<pid>/stat for resident sizes. Rows that fail numeric validation
// (or vanish mid-scan) are dropped, never reported as errors.
class ProcessInventory {
public:
  // Raw fields of one stat line, unvalidated
  struct StatFields {
    std::string comm;
    char state{};
    std::string ppid;
    std::string start_time; // clock ticks since boot
    std::string rss;        // pages
  };

  // page_size 0 => sysconf(_SC_PAGESIZE)
  explicit ProcessInventory(const app::ProtectionPolicy& policy, uint64_t page_size = 0);

  // Processes with resident_bytes >= min_size_bytes, resident desc then pid asc
  [[nodiscard]] model::ProcessInventorySnapshot list(uint64_t min_size_bytes) const;

  // Fresh record for one pid, protection evaluated; nullopt when gone or malformed
  [[nodiscard]] std::optional<model::ProcessRecord> read(int32_t pid) const;

  static bool parse_stat_line(const std::string& content, StatFields& out);

private:
  const app::ProtectionPolicy& policy_;
  uint64_t page_size_{};
};

} // namespace reclaim::collectors
