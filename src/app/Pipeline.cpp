#include "app/Pipeline.hpp"
#include "app/Accountant.hpp"
#include "app/Reporter.hpp"
#include "util/Log.hpp"
#include <algorithm>
#include <cstdio>
#include <thread>

namespace reclaim::app {

Pipeline::Pipeline(const collectors::MetricsCollector& metrics, const ActionPlanner& planner,
                   const ActionExecutor& executor, ConfirmationGate& gate,
                   const std::atomic<int>* cancel, Options opt)
  : metrics_(metrics), planner_(planner), executor_(executor), gate_(gate),
    cancel_(cancel), opt_(opt) {}

void Pipeline::plan(model::CleanupSession& s, const std::vector<CategorySpec>& categories) const {
  Plan plan;
  for (const auto& cat : categories) {
    if (cancelled()) break;
    if (cat.processes) {
      Plan scratch;
      planner_.plan_category(cat, scratch);
      if (scratch.targets.empty()) {
        RECLAIM_LOG_INFO("No memory-heavy applications to quit");
        continue;
      }
      // Listing what would be quit is enough for a dry run
      if (!s.dry_run() && !gate_.confirm(cat, scratch.targets)) {
        RECLAIM_LOG_VERBOSE("reclaim: pipeline: %s declined", cat.name.c_str());
        continue;
      }
      for (auto& t : scratch.targets) plan.targets.push_back(std::move(t));
      continue;
    }
    if (!gate_.confirm(cat, {})) {
      RECLAIM_LOG_VERBOSE("reclaim: pipeline: %s declined", cat.name.c_str());
      continue;
    }
    RECLAIM_LOG_INFO("Scanning %s...", cat.name.c_str());
    planner_.plan_category(cat, plan);
  }
  planner_.order(plan);
  s.planned = std::move(plan.targets);
  for (auto& r : plan.immediate) s.actions.push_back(std::move(r));
}

void Pipeline::settle() const {
  auto deadline = std::chrono::steady_clock::now() + opt_.settle;
  while (std::chrono::steady_clock::now() < deadline && !cancelled())
    std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(opt_.settle, std::chrono::milliseconds(100)));
}

void Pipeline::show_top_processes(model::CleanupSession& s) const {
  // sub-megabyte rows would print as 0MB
  auto snap = planner_.inventory().list(1024 * 1024);
  if (snap.processes.empty()) {
    RECLAIM_LOG_WARN("Could not retrieve process memory information");
    return;
  }
  if (snap.processes.size() > opt_.top_processes) snap.processes.resize(opt_.top_processes);
  s.top_processes = std::move(snap.processes);
  std::fputs(("\n" + Reporter::render_top_processes(s.top_processes) + "\n").c_str(), stdout);
  std::fflush(stdout);
}

bool Pipeline::run(model::CleanupSession& s, const std::vector<CategorySpec>& categories,
                   std::string& err) const {
  s.start_time = std::chrono::system_clock::now();

  model::ResourceSnapshot baseline;
  if (!metrics_.sample(baseline, err)) return false;
  s.baseline = baseline;
  s.stage = model::SessionStage::BaselineCollected;
  if (opt_.top_processes > 0) show_top_processes(s);

  plan(s, categories);
  s.stage = model::SessionStage::Planned;
  RECLAIM_LOG_VERBOSE("reclaim: pipeline: %zu target(s) planned, %zu skipped",
                      s.planned.size(), s.actions.size());

  executor_.execute(s);
  if (cancelled() && !s.cancelled) {
    s.cancelled = true;
    s.not_attempted = 0;
  }
  s.stage = model::SessionStage::Executed;

  if (!s.dry_run() && opt_.settle.count() > 0 && tally(s.actions).success > 0) {
    RECLAIM_LOG_INFO("Waiting for memory to settle...");
    settle();
  }

  model::ResourceSnapshot final_snapshot;
  std::string final_err;
  if (metrics_.sample(final_snapshot, final_err)) {
    s.final_snapshot = final_snapshot;
  } else {
    RECLAIM_LOG_WARN("reclaim: metrics: final sample failed (%s); using baseline", final_err.c_str());
    s.final_snapshot = s.baseline;
    s.incomplete_delta = true;
  }
  s.stage = model::SessionStage::FinalCollected;
  s.end_time = std::chrono::system_clock::now();
  return true;
}

std::string Pipeline::report(model::CleanupSession& s, bool full) const {
  std::string out = full ? Reporter::render(s) : Reporter::render_oneline(s) + "\n";
  s.stage = model::SessionStage::Reported;
  return out;
}

} // namespace reclaim::app
