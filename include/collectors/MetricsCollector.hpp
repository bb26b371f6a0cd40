#pragma once
#include "model/Resource.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reclaim::collectors {

// Memory snapshot from /proc/vmstat page counts. Every counter is validated;
// a missing or malformed one fails the whole sample (no zero substitution).
class MetricsCollector {
public:
  // page_size 0 => sysconf(_SC_PAGESIZE)
  explicit MetricsCollector(uint64_t page_size = 0);

  // returns true on success; err receives the reason otherwise
  [[nodiscard]] bool sample(model::ResourceSnapshot& out, std::string& err) const;

  [[nodiscard]] uint64_t page_size() const { return page_size_; }

  // Validates raw vmstat text; timestamp and pressure are left untouched.
  [[nodiscard]] static bool parse_vmstat(std::string_view text, uint64_t page_size,
                                         model::ResourceSnapshot& out, std::string& err);

  // "some avg10=1.23 ..." -> 1.23; nullopt when absent or unparseable
  [[nodiscard]] static std::optional<double> parse_pressure(std::string_view text);

private:
  uint64_t page_size_{};
};

} // namespace reclaim::collectors
