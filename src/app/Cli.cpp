#include "app/Cli.hpp"
#include "app/ActionExecutor.hpp"
#include "app/ActionPlanner.hpp"
#include "app/Config.hpp"
#include "app/Confirmation.hpp"
#include "app/Pipeline.hpp"
#include "app/Profiles.hpp"
#include "app/Protection.hpp"
#include "app/Reporter.hpp"
#include "app/RunLog.hpp"
#include "collectors/MetricsCollector.hpp"
#include "collectors/ProcessInventory.hpp"
#include "ui/Terminal.hpp"
#include "util/Log.hpp"
#include <cstdio>
#include <memory>
#include <sys/utsname.h>
#include <unistd.h>

namespace reclaim::app {

std::string usage(const ToolInfo& tool) {
  std::string u = std::string("Usage: ") + tool.name + " [options]\n\n";
  u += tool.memory_tool
         ? "Reclaims memory: purges inactive pages, flushes caches and optionally quits\n"
           "memory-heavy applications, then reports how much memory came back.\n\n"
         : "Reclaims disk space: cleans temporary files, caches, trash, logs and\n"
           "development caches, then reports how much space was freed.\n\n";
  u += "Options:\n"
       "  -y, --yes          Answer yes to every confirmation\n"
       "  -v, --verbose      Verbose logging\n"
       "  -d, --dry-run      Show what would be cleaned without changing anything\n"
       "  -s, --summary      Print the full report\n";
  if (tool.memory_tool) {
    u += "  -a, --aggressive   Also drop all reclaimable caches and cycle swap\n"
         "  -q, --quit-apps    Offer to quit memory-heavy applications\n";
  }
  u += "      --config PATH  Config file (default ~/.config/reclaim/config.toml)\n"
       "      --log-dir DIR  Append a run record to DIR/reclaim_YYYY-MM.log\n"
       "  -h, --help         Show this help\n"
       "      --version      Show version\n";
  return u;
}

bool parse_args(int argc, char** argv, const ToolInfo& tool, CliOptions& opts, std::string& err) {
  auto short_flag = [&](char c) -> bool {
    switch (c) {
      case 'y': opts.yes = true; return true;
      case 'v': opts.verbose = true; return true;
      case 'd': opts.dry_run = true; return true;
      case 's': opts.summary = true; return true;
      case 'h': opts.help = true; return true;
      case 'a': if (!tool.memory_tool) break; opts.aggressive = true; return true;
      case 'q': if (!tool.memory_tool) break; opts.quit_apps = true; return true;
      default: break;
    }
    err = std::string("unknown option: -") + c;
    return false;
  };

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    std::string value;
    bool has_value = false;
    if (a.rfind("--", 0) == 0) {
      if (auto eq = a.find('='); eq != std::string::npos) {
        value = a.substr(eq + 1);
        a = a.substr(0, eq);
        has_value = true;
      }
    }
    auto take_value = [&](std::string& dst) -> bool {
      if (has_value) { dst = value; return true; }
      if (i + 1 >= argc) { err = "option " + a + " requires an argument"; return false; }
      dst = argv[++i];
      return true;
    };

    if (a == "--yes") opts.yes = true;
    else if (a == "--verbose") opts.verbose = true;
    else if (a == "--dry-run") opts.dry_run = true;
    else if (a == "--summary") opts.summary = true;
    else if (a == "--help") opts.help = true;
    else if (a == "--version") opts.version = true;
    else if (tool.memory_tool && a == "--aggressive") opts.aggressive = true;
    else if (tool.memory_tool && a == "--quit-apps") opts.quit_apps = true;
    else if (a == "--config") { if (!take_value(opts.config_path)) return false; }
    else if (a == "--log-dir") { if (!take_value(opts.log_dir)) return false; }
    else if (a.size() > 1 && a[0] == '-' && a[1] != '-') {
      for (size_t k = 1; k < a.size(); ++k)
        if (!short_flag(a[k])) return false;
    } else {
      err = "unknown option: " + a;
      return false;
    }
    if (has_value && a != "--config" && a != "--log-dir") {
      err = "option " + a + " takes no argument";
      return false;
    }
  }
  return true;
}

bool platform_supported(std::string& err) {
#ifndef __linux__
  err = "this tool only runs on Linux";
  return false;
#else
  struct utsname u{};
  if (::uname(&u) != 0) {
    err = "uname failed";
    return false;
  }
  if (std::string(u.sysname) != "Linux") {
    err = std::string("unsupported platform: ") + u.sysname;
    return false;
  }
  return true;
#endif
}

int run(int argc, char** argv, const ToolInfo& tool) {
  CliOptions opts;
  std::string err;
  if (!parse_args(argc, argv, tool, opts, err)) {
    std::fprintf(stderr, "%s: %s\nTry '%s --help' for more information.\n", tool.name, err.c_str(), tool.name);
    return 1;
  }
  if (opts.help) {
    std::fputs(usage(tool).c_str(), stdout);
    return 0;
  }
  if (opts.version) {
    std::printf("%s %s\n", tool.name, kVersion);
    return 0;
  }
  util::set_verbose(opts.verbose);

  if (!platform_supported(err)) {
    RECLAIM_LOG_ERROR("%s: %s", model::to_string(model::ErrorKind::PlatformUnsupported), err.c_str());
    return 1;
  }

  std::string cfg_err;
  Config cfg = load_config(opts.config_path, cfg_err);
  if (!cfg_err.empty()) RECLAIM_LOG_WARN("reclaim: config: %s (using defaults)", cfg_err.c_str());
  else if (!cfg.source_path.empty()) RECLAIM_LOG_VERBOSE("reclaim: config: loaded %s", cfg.source_path.c_str());

  ui::install_signal_handlers();

  auto categories = tool.memory_tool
                      ? memory_profile(cfg, ProfileFlags{opts.aggressive, opts.quit_apps})
                      : disk_profile(cfg);

  ProtectionPolicy policy;
  for (const auto& name : cfg.process.protect) policy.add_name(name);

  collectors::MetricsCollector metrics;
  collectors::ProcessInventory inventory(policy);

  ActionPlanner::Options popt;
  popt.process_threshold_bytes = static_cast<uint64_t>(cfg.process.threshold_mb) * 1024ULL * 1024ULL;
  popt.processes_first = cfg.planner.processes_first;
  popt.elevate = ::geteuid() != 0;
  ActionPlanner planner(inventory, popt);

  ActionExecutor::Options eopt;
  eopt.grace = std::chrono::milliseconds(cfg.process.grace_ms);
  eopt.command_timeout = std::chrono::milliseconds(static_cast<int64_t>(cfg.commands.timeout_s) * 1000);
  ActionExecutor executor(eopt, inventory, &ui::g_signal);

  std::unique_ptr<ConfirmationGate> gate;
  if (opts.yes) gate = std::make_unique<AutoApproveGate>();
  else gate = std::make_unique<PromptGate>();

  Pipeline::Options plopt;
  if (tool.memory_tool) {
    plopt.settle = std::chrono::milliseconds(cfg.session.settle_ms);
    plopt.top_processes = 10;
  }
  Pipeline pipeline(metrics, planner, executor, *gate, &ui::g_signal, plopt);

  model::CleanupSession session;
  session.tool = tool.name;
  session.mode = opts.dry_run ? model::RunMode::DryRun : model::RunMode::Live;
  if (opts.dry_run) RECLAIM_LOG_INFO("Dry run: nothing will be changed");

  if (!pipeline.run(session, categories, err)) {
    RECLAIM_LOG_ERROR("reclaim: metrics: %s: %s",
                      model::to_string(model::ErrorKind::MetricsUnavailable), err.c_str());
    return 1;
  }

  bool full = opts.summary || tool.summary_default;
  std::string report = pipeline.report(session, full);
  std::fputs(report.c_str(), stdout);
  if (full) std::printf("%s\n", Reporter::render_elapsed(session).c_str());
  std::fflush(stdout);

  std::string log_dir = opts.log_dir.empty() ? cfg.log_dir : opts.log_dir;
  if (!log_dir.empty()) {
    RunLog runlog(log_dir);
    if (!runlog.append(session)) RECLAIM_LOG_WARN("run log not written");
  }

  int sig = ui::g_signal.load();
  return sig != 0 ? 128 + sig : 0;
}

} // namespace reclaim::app
