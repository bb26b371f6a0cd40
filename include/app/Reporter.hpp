#pragma once
#include "model/Process.hpp"
#include "model/Session.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace reclaim::app {

// Pure renderers. Same session => same text; wall-clock duration only ever
// appears in render_elapsed().
class Reporter {
public:
  [[nodiscard]] static std::string render(const model::CleanupSession& s);
  [[nodiscard]] static std::string render_oneline(const model::CleanupSession& s);
  [[nodiscard]] static std::string render_elapsed(const model::CleanupSession& s);

  // Available memory below these is reported as low / getting low
  static constexpr uint64_t kLowMemoryMb = 1000;
  static constexpr uint64_t kTightMemoryMb = 2000;

  [[nodiscard]] static std::string render_snapshot(const model::ResourceSnapshot& snap);
  [[nodiscard]] static const char* health(const model::ResourceSnapshot& snap);
  // PID / MB / comm table, in the order given
  [[nodiscard]] static std::string render_top_processes(const std::vector<model::ProcessRecord>& procs);
  [[nodiscard]] static std::string render_action(const model::ActionResult& a);
  // "Memory freed: N MB" and friends
  [[nodiscard]] static std::string delta_line(int64_t delta_bytes);
};

} // namespace reclaim::app
