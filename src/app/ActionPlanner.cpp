#include "app/ActionPlanner.hpp"
#include "collectors/DiskUsage.hpp"
#include "ui/Formatting.hpp"
#include "util/Command.hpp"
#include "util/Log.hpp"
#include <algorithm>
#include <cstdlib>
#include <fnmatch.h>
#include <system_error>

namespace fs = std::filesystem;

namespace reclaim::app {

static bool has_glob(const std::string& s) {
  return s.find_first_of("*?[") != std::string::npos;
}

// a == b, or one is a directory prefix of the other
static bool paths_overlap(const std::string& a, const std::string& b) {
  if (a == b) return true;
  auto under = [](const std::string& child, const std::string& parent) {
    if (child.size() <= parent.size() || child.compare(0, parent.size(), parent) != 0) return false;
    return parent.back() == '/' || child[parent.size()] == '/';
  };
  return under(a, b) || under(b, a);
}

static model::ActionResult skipped(model::CleanupTarget t, std::optional<model::ErrorKind> err,
                                   std::string detail) {
  model::ActionResult r;
  r.target = std::move(t);
  r.status = model::ActionStatus::Skipped;
  r.error = err;
  r.detail = std::move(detail);
  return r;
}

ActionPlanner::ActionPlanner(const collectors::ProcessInventory& inventory, Options opt)
  : inventory_(inventory), opt_(std::move(opt)) {
  if (opt_.home.empty()) {
    if (const char* h = std::getenv("HOME"); h && *h) opt_.home = h;
  }
}

std::string ActionPlanner::expand_home(const std::string& pattern) const {
  if (pattern == "~") return opt_.home;
  if (pattern.rfind("~/", 0) == 0) return opt_.home + pattern.substr(1);
  return pattern;
}

std::vector<fs::path> ActionPlanner::expand_pattern(const std::string& expanded) {
  std::vector<fs::path> out;
  if (expanded.empty()) return out;
  fs::path p(expanded);
  std::error_code ec;
  std::string last = p.filename().string();
  if (!has_glob(last)) {
    if (fs::exists(fs::symlink_status(p, ec))) out.push_back(p);
    return out;
  }
  fs::path dir = p.parent_path();
  if (!fs::is_directory(dir, ec)) return out;
  std::vector<std::string> names;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) return out;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::string name = it->path().filename().string();
    if (::fnmatch(last.c_str(), name.c_str(), 0) == 0) names.push_back(std::move(name));
  }
  std::sort(names.begin(), names.end());
  out.reserve(names.size());
  for (auto& n : names) out.push_back(dir / n);
  return out;
}

void ActionPlanner::plan_paths(const CategorySpec& cat, Plan& plan) const {
  for (const auto& entry : cat.paths) {
    std::string expanded = expand_home(entry.pattern);
    bool pattern = has_glob(fs::path(expanded).filename().string());

    model::CleanupTarget proto;
    proto.kind = model::TargetKind::File;
    proto.category = cat.name;
    proto.label = entry.label;
    proto.identifier = expanded;

    auto matches = expand_pattern(expanded);
    if (matches.empty()) {
      RECLAIM_LOG_VERBOSE("reclaim: planner: nothing at %s", expanded.c_str());
      plan.immediate.push_back(skipped(std::move(proto), model::ErrorKind::TargetNotFound, "not found"));
      continue;
    }

    for (const auto& m : matches) {
      model::CleanupTarget t = proto;
      t.identifier = m.string();
      if (pattern) t.label = entry.label + ": " + m.filename().string();

      auto claimed = std::find_if(plan.claimed_paths.begin(), plan.claimed_paths.end(),
                                  [&](const std::string& c) { return paths_overlap(c, t.identifier); });
      if (claimed != plan.claimed_paths.end()) {
        plan.immediate.push_back(skipped(std::move(t), std::nullopt, "overlaps " + *claimed));
        continue;
      }

      auto size = collectors::tree_allocated_bytes(m);
      if (!size) {
        // Vanished between listing and sizing
        plan.immediate.push_back(skipped(std::move(t), model::ErrorKind::TargetNotFound, "not found"));
        continue;
      }
      t.size_bytes = *size;
      RECLAIM_LOG_VERBOSE("reclaim: planner: %s (%s)", t.identifier.c_str(),
                          ui::format_bytes(t.size_bytes).c_str());
      plan.claimed_paths.push_back(t.identifier);
      plan.targets.push_back(std::move(t));
    }
  }
}

void ActionPlanner::plan_commands(const CategorySpec& cat, Plan& plan) const {
  for (const auto& entry : cat.commands) {
    model::CleanupTarget t;
    t.kind = model::TargetKind::Command;
    t.category = cat.name;
    t.label = entry.label;
    t.identifier = (entry.needs_root && opt_.elevate) ? "sudo -n " + entry.cmdline : entry.cmdline;

    if (entry.needs_root && opt_.elevate && !util::program_on_path("sudo")) {
      plan.immediate.push_back(skipped(std::move(t), model::ErrorKind::PermissionDenied,
                                       "requires root and sudo is not available"));
      continue;
    }
    auto program = util::command_program(entry.cmdline);
    if (program.empty() || !util::program_on_path(program)) {
      plan.immediate.push_back(skipped(std::move(t), model::ErrorKind::TargetNotFound,
                                       program + " not found"));
      continue;
    }
    plan.targets.push_back(std::move(t));
  }
}

void ActionPlanner::plan_processes(const CategorySpec& cat, Plan& plan) const {
  if (!cat.processes) return;
  // list() is inclusive; candidates must be strictly above the threshold
  auto snap = inventory_.list(opt_.process_threshold_bytes + 1);
  for (const auto& p : snap.processes) {
    if (p.is_protected) continue;
    model::CleanupTarget t;
    t.kind = model::TargetKind::Process;
    t.category = cat.name;
    t.identifier = std::to_string(p.pid);
    t.pid = p.pid;
    t.resident_bytes = p.resident_bytes;
    t.command = p.command;
    t.start_ticks = p.start_ticks;
    t.label = p.command + " (PID " + std::to_string(p.pid) + ")";
    plan.targets.push_back(std::move(t));
  }
}

void ActionPlanner::plan_category(const CategorySpec& cat, Plan& plan) const {
  plan_paths(cat, plan);
  plan_commands(cat, plan);
  plan_processes(cat, plan);
}

Plan ActionPlanner::plan(const std::vector<CategorySpec>& cats) const {
  Plan plan;
  for (const auto& c : cats) plan_category(c, plan);
  order(plan);
  return plan;
}

void ActionPlanner::order(Plan& plan) const {
  auto is_process = [](const model::CleanupTarget& t) { return t.kind == model::TargetKind::Process; };
  if (opt_.processes_first)
    std::stable_partition(plan.targets.begin(), plan.targets.end(), is_process);
  else
    std::stable_partition(plan.targets.begin(), plan.targets.end(),
                          [&](const model::CleanupTarget& t) { return !is_process(t); });
}

} // namespace reclaim::app
