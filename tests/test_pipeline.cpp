#include "minitest.hpp"
#include "app/Pipeline.hpp"
#include "app/Reporter.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using namespace reclaim;

static fs::path make_root(const char* tag) {
  auto root = fs::temp_directory_path() / ("reclaim_pipeline_test_" + std::to_string(::getpid()) + "_" + tag);
  fs::remove_all(root);
  fs::create_directories(root / "proc");
  fs::create_directories(root / "home");
  std::ofstream(root / "proc/vmstat") <<
    "nr_free_pages 1000\nnr_inactive_anon 200\nnr_active_anon 300\nnr_inactive_file 400\n"
    "nr_active_file 500\nnr_unevictable 50\nnr_zspages 25\n";
  return root;
}

// Records questions; the hook runs on each confirmation
class ScriptedGate : public app::ConfirmationGate {
public:
  bool answer{true};
  std::vector<std::string> asked;
  std::function<void()> hook;

  bool confirm(const app::CategorySpec& category, const std::vector<model::CleanupTarget>&) override {
    asked.push_back(category.name);
    if (hook) hook();
    return answer;
  }
};

struct Harness {
  app::ProtectionPolicy policy{99999, 99998};
  collectors::MetricsCollector metrics{4096};
  collectors::ProcessInventory inventory{policy, 4096};
  app::ActionPlanner planner;
  app::ActionExecutor executor;
  ScriptedGate gate;
  std::atomic<int> cancel{0};
  app::Pipeline pipeline;

  explicit Harness(const fs::path& home, size_t top_processes = 0)
    : planner(inventory, options(home)),
      executor(app::ActionExecutor::Options{200ms, 20ms, 2000ms}, inventory, &cancel),
      pipeline(metrics, planner, executor, gate, &cancel, app::Pipeline::Options{0ms, top_processes}) {}

  static app::ActionPlanner::Options options(const fs::path& home) {
    app::ActionPlanner::Options o;
    o.home = home.string();
    return o;
  }
};

static std::vector<app::CategorySpec> categories() {
  return {
    {"temp", "Clean temporary files?", {{"~/tmp/*", "Temp"}}, {}, false},
    {"caches", "Clean application caches?", {{"~/.cache/missing", "Missing cache"}}, {}, false},
  };
}

TEST(pipeline_baseline_failure_is_fatal) {
  auto root = make_root("fatal");
  fs::remove(root / "proc/vmstat");
  setenv("RECLAIM_PROC_ROOT", root.c_str(), 1);
  Harness h(root / "home");
  model::CleanupSession s;
  std::string err;
  ASSERT_TRUE(!h.pipeline.run(s, categories(), err));
  ASSERT_TRUE(!err.empty());
  ASSERT_TRUE(s.stage == model::SessionStage::Created);
  ASSERT_TRUE(s.actions.empty());
  ASSERT_TRUE(h.gate.asked.empty());
  unsetenv("RECLAIM_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pipeline_live_run_reaches_reported) {
  auto root = make_root("live");
  fs::create_directories(root / "home/tmp");
  std::ofstream(root / "home/tmp/a") << std::string(8192, 'a');
  std::ofstream(root / "home/tmp/b") << std::string(8192, 'b');
  setenv("RECLAIM_PROC_ROOT", root.c_str(), 1);
  Harness h(root / "home");
  model::CleanupSession s;
  s.tool = "reclaim-disk";
  std::string err;
  ASSERT_TRUE(h.pipeline.run(s, categories(), err));
  ASSERT_TRUE(s.stage == model::SessionStage::FinalCollected);
  ASSERT_EQ(h.gate.asked.size(), 2u);
  ASSERT_EQ(s.planned.size(), 2u);
  ASSERT_EQ(s.actions.size(), 3u);
  ASSERT_TRUE(s.actions[0].status == model::ActionStatus::Skipped);

  uint64_t expected = 0;
  for (const auto& t : s.planned) expected += t.size_bytes;
  uint64_t freed = 0;
  for (const auto& a : s.actions)
    if (a.status == model::ActionStatus::Success) freed += a.bytes_freed;
  ASSERT_EQ(freed, expected);
  ASSERT_TRUE(!fs::exists(root / "home/tmp/a"));
  ASSERT_TRUE(!s.incomplete_delta);

  auto out = h.pipeline.report(s, true);
  ASSERT_TRUE(s.stage == model::SessionStage::Reported);
  ASSERT_TRUE(out.find("SKIPPED | Missing cache | 0 B") != std::string::npos);
  unsetenv("RECLAIM_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pipeline_dry_run_is_idempotent) {
  auto root = make_root("dry");
  fs::create_directories(root / "home/tmp/nested");
  std::ofstream(root / "home/tmp/nested/x") << std::string(4096, 'x');
  std::ofstream(root / "home/tmp/y") << "y";
  setenv("RECLAIM_PROC_ROOT", root.c_str(), 1);
  Harness h(root / "home");

  model::CleanupSession first;
  first.mode = model::RunMode::DryRun;
  std::string err;
  ASSERT_TRUE(h.pipeline.run(first, categories(), err));
  model::CleanupSession second;
  second.mode = model::RunMode::DryRun;
  ASSERT_TRUE(h.pipeline.run(second, categories(), err));

  ASSERT_EQ(first.planned.size(), second.planned.size());
  for (size_t i = 0; i < first.planned.size(); ++i) {
    ASSERT_EQ(first.planned[i].identifier, second.planned[i].identifier);
    ASSERT_EQ(first.planned[i].size_bytes, second.planned[i].size_bytes);
  }
  ASSERT_TRUE(first.baseline->same_readings(*second.baseline));
  ASSERT_TRUE(first.final_snapshot->same_readings(*first.baseline));
  ASSERT_TRUE(fs::exists(root / "home/tmp/nested/x"));
  ASSERT_TRUE(fs::exists(root / "home/tmp/y"));
  for (const auto& a : second.actions) ASSERT_EQ(a.bytes_freed, 0u);
  ASSERT_EQ(app::Reporter::render(first), app::Reporter::render(second));
  unsetenv("RECLAIM_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pipeline_final_failure_reuses_baseline) {
  auto root = make_root("final");
  setenv("RECLAIM_PROC_ROOT", root.c_str(), 1);
  Harness h(root / "home");
  // vmstat disappears after the baseline was taken
  h.gate.hook = [&] { fs::remove(root / "proc/vmstat"); };
  model::CleanupSession s;
  std::string err;
  ASSERT_TRUE(h.pipeline.run(s, categories(), err));
  ASSERT_TRUE(s.incomplete_delta);
  ASSERT_TRUE(s.final_snapshot.has_value());
  ASSERT_TRUE(s.final_snapshot->same_readings(*s.baseline));
  auto out = h.pipeline.report(s, true);
  ASSERT_TRUE(s.stage == model::SessionStage::Reported);
  ASSERT_TRUE(out.find("(baseline reused)") != std::string::npos);
  unsetenv("RECLAIM_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pipeline_declined_categories_contribute_nothing) {
  auto root = make_root("declined");
  fs::create_directories(root / "home/tmp");
  std::ofstream(root / "home/tmp/a") << "a";
  setenv("RECLAIM_PROC_ROOT", root.c_str(), 1);
  Harness h(root / "home");
  h.gate.answer = false;
  model::CleanupSession s;
  std::string err;
  ASSERT_TRUE(h.pipeline.run(s, categories(), err));
  ASSERT_TRUE(s.planned.empty());
  ASSERT_TRUE(s.actions.empty());
  ASSERT_TRUE(fs::exists(root / "home/tmp/a"));
  unsetenv("RECLAIM_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pipeline_interrupt_still_reports) {
  auto root = make_root("interrupt");
  fs::create_directories(root / "home/tmp");
  std::ofstream(root / "home/tmp/a") << "a";
  setenv("RECLAIM_PROC_ROOT", root.c_str(), 1);
  Harness h(root / "home");
  // Signal lands while the first question is open
  h.gate.hook = [&] { h.cancel.store(SIGINT); };
  model::CleanupSession s;
  std::string err;
  ASSERT_TRUE(h.pipeline.run(s, categories(), err));
  ASSERT_TRUE(s.cancelled);
  ASSERT_EQ(h.gate.asked.size(), 1u);
  ASSERT_EQ(s.not_attempted, 1u);
  ASSERT_TRUE(fs::exists(root / "home/tmp/a"));
  auto out = h.pipeline.report(s, true);
  ASSERT_TRUE(out.find("Interrupted: 1 action(s) not attempted") != std::string::npos);
  unsetenv("RECLAIM_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pipeline_protected_process_never_succeeds) {
  auto root = make_root("protected");
  auto dir = root / "proc/4242";
  fs::create_directories(dir);
  std::string stat = "4242 (gnome-shell) S 1";
  for (int i = 2; i < 21; ++i) stat += " 0";
  stat += " 512000 0 0\n";
  std::ofstream(dir / "stat") << stat;
  setenv("RECLAIM_PROC_ROOT", root.c_str(), 1);
  Harness h(root / "home");
  std::vector<app::CategorySpec> cats{{"apps", "Quit these applications?", {}, {}, true}};
  model::CleanupSession s;
  std::string err;
  ASSERT_TRUE(h.pipeline.run(s, cats, err));
  ASSERT_TRUE(s.planned.empty());
  for (const auto& a : s.actions) ASSERT_TRUE(a.status != model::ActionStatus::Success);
  ASSERT_TRUE(h.gate.asked.empty());
  unsetenv("RECLAIM_PROC_ROOT");
  fs::remove_all(root);
}

static void add_proc(const fs::path& root, int pid, const std::string& comm, const std::string& rss) {
  auto dir = root / "proc" / std::to_string(pid);
  fs::create_directories(dir);
  std::string stat = std::to_string(pid) + " (" + comm + ") S 1";
  for (int i = 2; i < 21; ++i) stat += " 0";
  stat += " " + rss + " 0 0\n";
  std::ofstream(dir / "stat") << stat;
}

TEST(pipeline_lists_top_processes_after_baseline) {
  auto root = make_root("top");
  for (int i = 0; i < 12; ++i) add_proc(root, 100 + i, "app" + std::to_string(i), std::to_string((i + 1) * 25600));
  add_proc(root, 300, "tiny", "10"); // under 1 MB
  setenv("RECLAIM_PROC_ROOT", root.c_str(), 1);
  Harness h(root / "home", 10);
  h.gate.answer = false;
  model::CleanupSession s;
  std::string err;
  ASSERT_TRUE(h.pipeline.run(s, categories(), err));
  ASSERT_EQ(s.top_processes.size(), 10u);
  ASSERT_EQ(s.top_processes[0].pid, 111);
  ASSERT_EQ(s.top_processes[0].resident_bytes, 12u * 100u * 1024u * 1024u);
  ASSERT_EQ(s.top_processes[9].pid, 102);
  for (const auto& p : s.top_processes) ASSERT_NE(p.command, "tiny");
  auto table = app::Reporter::render_top_processes(s.top_processes);
  ASSERT_TRUE(table.find("111     | 1200MB  | app11") != std::string::npos);
  unsetenv("RECLAIM_PROC_ROOT");
  fs::remove_all(root);
}

TEST(pipeline_skips_top_processes_when_disabled) {
  auto root = make_root("notop");
  add_proc(root, 100, "app", "25600");
  setenv("RECLAIM_PROC_ROOT", root.c_str(), 1);
  Harness h(root / "home");
  h.gate.answer = false;
  model::CleanupSession s;
  std::string err;
  ASSERT_TRUE(h.pipeline.run(s, categories(), err));
  ASSERT_TRUE(s.top_processes.empty());
  unsetenv("RECLAIM_PROC_ROOT");
  fs::remove_all(root);
}
