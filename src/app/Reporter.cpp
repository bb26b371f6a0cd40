#include "app/Reporter.hpp"
#include "app/Accountant.hpp"
#include "ui/Formatting.hpp"
#include <cstdio>
#include <sstream>

namespace reclaim::app {

static std::string mb(uint64_t bytes) {
  return std::to_string(bytes / (1024ULL * 1024ULL)) + " MB";
}

const char* Reporter::health(const model::ResourceSnapshot& snap) {
  uint64_t avail_mb = snap.available_bytes / (1024ULL * 1024ULL);
  if (avail_mb < kLowMemoryMb) return "Low memory available";
  if (avail_mb < kTightMemoryMb) return "Memory getting low";
  return "Memory levels healthy";
}

std::string Reporter::render_snapshot(const model::ResourceSnapshot& snap) {
  std::ostringstream os;
  uint64_t used_pct = snap.total_bytes ? snap.used_bytes * 100 / snap.total_bytes : 0;
  os << "  Total:       " << mb(snap.total_bytes) << '\n'
     << "  Used:        " << mb(snap.used_bytes) << " (" << used_pct << "%)\n"
     << "  Available:   " << mb(snap.available_bytes) << '\n'
     << "  Free:        " << mb(snap.free_bytes) << '\n'
     << "  Active:      " << mb(snap.active_bytes) << '\n'
     << "  Inactive:    " << mb(snap.inactive_bytes) << '\n'
     << "  Wired:       " << mb(snap.wired_bytes) << '\n'
     << "  Compressed:  " << mb(snap.compressed_bytes)
     << (snap.compressor_present ? "" : " (no zsmalloc)") << '\n';
  if (snap.pressure_pct) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f%%", *snap.pressure_pct);
    os << "  Pressure:    " << buf << '\n';
  } else {
    os << "  Pressure:    unknown\n";
  }
  os << "  Status:      " << health(snap) << '\n';
  return os.str();
}

std::string Reporter::render_top_processes(const std::vector<model::ProcessRecord>& procs) {
  std::ostringstream os;
  os << "Top " << procs.size() << " memory-consuming processes:\n"
     << "PID     | Memory  | Process\n"
     << "--------|---------|--------------------------------\n";
  char buf[64];
  for (const auto& p : procs) {
    std::snprintf(buf, sizeof(buf), "%-7d | %-7s | ", p.pid,
                  (std::to_string(p.resident_bytes / (1024ULL * 1024ULL)) + "MB").c_str());
    os << buf << p.command << '\n';
  }
  return os.str();
}

std::string Reporter::render_action(const model::ActionResult& a) {
  uint64_t size = a.status == model::ActionStatus::DryRun ? a.bytes_reclaimable : a.bytes_freed;
  return std::string(model::to_string(a.status)) + " | " + a.target.label + " | " + ui::format_bytes(size);
}

std::string Reporter::delta_line(int64_t delta_bytes) {
  int64_t m = ui::to_whole_mb(delta_bytes);
  if (m > 0) return "Memory freed: " + std::to_string(m) + " MB";
  if (m < 0) return "Memory usage increased by " + std::to_string(-m) + " MB";
  return "No significant change in memory usage";
}

std::string Reporter::render(const model::CleanupSession& s) {
  std::ostringstream os;
  auto t = tally(s.actions);

  os << "=== " << s.tool << (s.dry_run() ? " (dry run)" : "") << " ===\n\n";

  os << "Memory before:\n";
  if (s.baseline) os << render_snapshot(*s.baseline);
  else os << "  unavailable\n";

  os << "\nMemory after" << (s.incomplete_delta ? " (baseline reused)" : "") << ":\n";
  if (s.final_snapshot) os << render_snapshot(*s.final_snapshot);
  else os << "  unavailable\n";

  os << "\nActions:\n";
  if (s.actions.empty()) os << "  (none)\n";
  for (const auto& a : s.actions) {
    os << render_action(a) << '\n';
    if (a.status == model::ActionStatus::Success) continue;
    if (!a.detail.empty() && a.error)
      os << "    " << a.detail << " (" << model::to_string(*a.error) << ")\n";
    else if (!a.detail.empty())
      os << "    " << a.detail << '\n';
    else if (a.error)
      os << "    " << model::to_string(*a.error) << '\n';
  }

  os << "\nSummary:\n"
     << "  Successful:    " << t.success << '\n'
     << "  Skipped:       " << t.skipped << '\n'
     << "  Failed:        " << t.failed << '\n';
  if (s.dry_run()) os << "  Dry run:       " << t.dry_run << '\n';
  os << "  Items removed: " << t.items_removed << '\n';
  if (s.dry_run())
    os << "Total that would be freed: " << ui::format_bytes(t.total_reclaimable) << '\n';
  else
    os << "Total freed: " << ui::format_bytes(t.total_freed) << '\n';

  if (s.baseline && s.final_snapshot) {
    os << delta_line(compute_delta(*s.baseline, *s.final_snapshot));
    if (s.incomplete_delta) os << " (final snapshot unavailable)";
    os << '\n';
  }

  if (s.cancelled)
    os << "Interrupted: " << s.not_attempted << " action(s) not attempted\n";
  return os.str();
}

std::string Reporter::render_oneline(const model::CleanupSession& s) {
  auto t = tally(s.actions);
  std::string line;
  if (s.dry_run()) {
    line = "Dry run completed - " + ui::format_bytes(t.total_reclaimable) + " would be freed (" +
           std::to_string(t.dry_run) + " action(s))";
  } else {
    line = "Cleanup completed - " + ui::format_bytes(t.total_freed) + " freed, " +
           std::to_string(t.success) + "/" + std::to_string(t.total()) + " action(s) successful";
  }
  if (s.baseline && s.final_snapshot)
    line += "; " + delta_line(compute_delta(*s.baseline, *s.final_snapshot));
  if (s.cancelled) line += " (interrupted)";
  return line;
}

std::string Reporter::render_elapsed(const model::CleanupSession& s) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(s.end_time - s.start_time).count();
  if (ms < 0) ms = 0;
  char buf[96];
  std::snprintf(buf, sizeof(buf), "Finished %s in %lld.%01lld s", ui::format_local_time(s.end_time).c_str(),
                static_cast<long long>(ms / 1000), static_cast<long long>((ms % 1000) / 100));
  return buf;
}

} // namespace reclaim::app
