#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace reclaim::model {

struct ProcessRecord {
  int32_t pid{};
  int32_t ppid{};
  uint64_t resident_bytes{};
  uint64_t start_ticks{};    // starttime, distinguishes pid reuse
  std::string command;       // comm from /proc/<pid>/stat
  bool is_protected{false};
};

struct ProcessInventorySnapshot {
  std::vector<ProcessRecord> processes; // sorted by resident_bytes desc
  size_t scanned_rows{};                // numeric /proc entries seen
  size_t dropped_rows{};                // unreadable or malformed rows
};

} // namespace reclaim::model
