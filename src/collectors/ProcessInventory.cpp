#include "collectors/ProcessInventory.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>

#include <algorithm>
#include <limits>
#include <sstream>
#include <vector>

namespace reclaim::collectors {

static constexpr uint64_t kMaxPid = static_cast<uint64_t>(std::numeric_limits<int32_t>::max());

ProcessInventory::ProcessInventory(const app::ProtectionPolicy& policy, uint64_t page_size)
  : policy_(policy), page_size_(page_size) {
  if (page_size_ == 0) {
    long ps = ::sysconf(_SC_PAGESIZE);
    page_size_ = ps > 0 ? static_cast<uint64_t>(ps) : 4096;
  }
}

bool ProcessInventory::parse_stat_line(const std::string& content, StatFields& out) {
  // comm may itself contain spaces and parentheses; the last ')' ends it
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > content.size()) return false;
  std::istringstream ss(content.substr(rp + 2));
  // fields after comm: state(0) ppid(1) ... starttime(19) vsize(20) rss(21)
  std::vector<std::string> fields;
  std::string tok;
  while (fields.size() < 22 && ss >> tok) fields.push_back(tok);
  if (fields.size() < 22 || fields[0].size() != 1) return false;
  out.comm = content.substr(lp + 1, rp - lp - 1);
  out.state = fields[0][0];
  out.ppid = fields[1];
  out.start_time = fields[19];
  out.rss = fields[21];
  return true;
}

std::optional<model::ProcessRecord> ProcessInventory::read(int32_t pid) const {
  if (pid <= 0) return std::nullopt;
  auto content = util::read_file_string("/proc/" + std::to_string(pid) + "/stat");
  StatFields f;
  if (!content || !parse_stat_line(*content, f)) return std::nullopt;
  auto ppid = util::parse_strict_u64(f.ppid);
  auto start = util::parse_strict_u64(f.start_time);
  auto rss_pages = util::parse_strict_u64(f.rss);
  if (!ppid || *ppid > kMaxPid || !start || !rss_pages ||
      *rss_pages > std::numeric_limits<uint64_t>::max() / page_size_)
    return std::nullopt;
  model::ProcessRecord rec;
  rec.pid = pid;
  rec.ppid = static_cast<int32_t>(*ppid);
  rec.resident_bytes = *rss_pages * page_size_;
  rec.start_ticks = *start;
  rec.command = std::move(f.comm);
  rec.is_protected = policy_.is_protected(rec);
  return rec;
}

model::ProcessInventorySnapshot ProcessInventory::list(uint64_t min_size_bytes) const {
  model::ProcessInventorySnapshot out;
  for (auto& name : util::list_dir("/proc")) {
    if (name.empty() || name[0] < '0' || name[0] > '9') continue; // not a pid dir
    ++out.scanned_rows;
    auto pid = util::parse_strict_u64(name);
    if (!pid || *pid > kMaxPid) { ++out.dropped_rows; continue; }
    auto rec = read(static_cast<int32_t>(*pid));
    if (!rec) { ++out.dropped_rows; continue; }
    if (rec->resident_bytes < min_size_bytes) continue;
    out.processes.push_back(std::move(*rec));
  }
  std::sort(out.processes.begin(), out.processes.end(), [](const auto& a, const auto& b){
    if (a.resident_bytes != b.resident_bytes) return a.resident_bytes > b.resident_bytes;
    return a.pid < b.pid;
  });
  return out;
}

} // namespace reclaim::collectors
