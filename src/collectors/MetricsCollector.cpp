#include "collectors/MetricsCollector.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>

#include <array>
#include <charconv>
#include <limits>

namespace reclaim::collectors {

namespace {

enum Counter { FreePages, ActiveAnon, ActiveFile, InactiveAnon, InactiveFile, Unevictable, ZsPages, CounterCount };

constexpr std::array<std::string_view, CounterCount> kCounterNames = {
  "nr_free_pages", "nr_active_anon", "nr_active_file", "nr_inactive_anon",
  "nr_inactive_file", "nr_unevictable", "nr_zspages"
};

bool mul_overflows(uint64_t a, uint64_t b) {
  return a != 0 && b > std::numeric_limits<uint64_t>::max() / a;
}

} // namespace

MetricsCollector::MetricsCollector(uint64_t page_size) : page_size_(page_size) {
  if (page_size_ == 0) {
    long ps = ::sysconf(_SC_PAGESIZE);
    page_size_ = ps > 0 ? static_cast<uint64_t>(ps) : 4096;
  }
}

bool MetricsCollector::parse_vmstat(std::string_view text, uint64_t page_size,
                                    model::ResourceSnapshot& out, std::string& err) {
  std::array<std::optional<uint64_t>, CounterCount> pages{};
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(start, end - start);
    start = end + 1;
    auto sp = line.find(' ');
    if (sp == std::string_view::npos) continue;
    auto key = line.substr(0, sp);
    for (size_t i = 0; i < kCounterNames.size(); ++i) {
      if (key != kCounterNames[i]) continue;
      auto value = line.substr(sp + 1);
      while (!value.empty() && (value.back() == '\r' || value.back() == ' ')) value.remove_suffix(1);
      auto parsed = util::parse_strict_u64(value);
      if (!parsed) {
        err = std::string("invalid value for ") + std::string(key) + ": '" + std::string(value) + "'";
        return false;
      }
      pages[i] = *parsed;
      break;
    }
  }
  // nr_zspages only exists once zsmalloc is in use; everything else is mandatory
  bool compressor = pages[ZsPages].has_value();
  if (!compressor) pages[ZsPages] = 0;
  for (size_t i = 0; i < pages.size(); ++i) {
    if (!pages[i]) {
      err = std::string("missing counter ") + std::string(kCounterNames[i]);
      return false;
    }
  }

  auto to_bytes = [&](uint64_t p, uint64_t& dst) {
    if (mul_overflows(p, page_size)) return false;
    dst = p * page_size;
    return true;
  };
  // Sums of page counts before conversion; vmstat counters are far below 2^52
  uint64_t active_p = *pages[ActiveAnon] + *pages[ActiveFile];
  uint64_t inactive_p = *pages[InactiveAnon] + *pages[InactiveFile];
  model::ResourceSnapshot s;
  if (!to_bytes(*pages[FreePages], s.free_bytes) || !to_bytes(active_p, s.active_bytes) ||
      !to_bytes(inactive_p, s.inactive_bytes) || !to_bytes(*pages[Unevictable], s.wired_bytes) ||
      !to_bytes(*pages[ZsPages], s.compressed_bytes)) {
    err = "page count overflows byte conversion";
    return false;
  }
  s.used_bytes = s.active_bytes + s.wired_bytes + s.compressed_bytes;
  s.available_bytes = s.free_bytes + s.inactive_bytes;
  if (s.used_bytes < s.active_bytes || s.available_bytes < s.free_bytes ||
      s.used_bytes + s.available_bytes < s.used_bytes) {
    err = "byte totals overflow";
    return false;
  }
  s.total_bytes = s.used_bytes + s.available_bytes;
  s.compressor_present = compressor;
  s.pressure_pct = out.pressure_pct;
  s.timestamp = out.timestamp;
  out = s;
  return true;
}

std::optional<double> MetricsCollector::parse_pressure(std::string_view text) {
  if (!text.starts_with("some ")) return std::nullopt;
  auto pos = text.find("avg10=");
  if (pos == std::string_view::npos) return std::nullopt;
  auto rest = text.substr(pos + 6);
  auto end = rest.find_first_of(" \n");
  if (end != std::string_view::npos) rest = rest.substr(0, end);
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), v);
  if (ec != std::errc{} || ptr != rest.data() + rest.size() || v < 0.0 || v > 100.0) return std::nullopt;
  return v;
}

bool MetricsCollector::sample(model::ResourceSnapshot& out, std::string& err) const {
  auto txt = util::read_file_string("/proc/vmstat");
  if (!txt) {
    err = "cannot read /proc/vmstat";
    return false;
  }
  model::ResourceSnapshot s;
  if (!parse_vmstat(*txt, page_size_, s, err)) return false;
  if (auto psi = util::read_file_string("/proc/pressure/memory")) s.pressure_pct = parse_pressure(*psi);
  s.timestamp = std::chrono::system_clock::now();
  out = s;
  return true;
}

} // namespace reclaim::collectors
