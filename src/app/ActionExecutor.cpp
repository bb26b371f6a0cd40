#include "app/ActionExecutor.hpp"
#include "ui/Formatting.hpp"
#include "util/Command.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace reclaim::app {

static model::ActionResult make_result(const model::CleanupTarget& t, model::ActionStatus st,
                                       std::optional<model::ErrorKind> err = std::nullopt,
                                       std::string detail = {}) {
  model::ActionResult r;
  r.target = t;
  r.status = st;
  r.error = err;
  r.detail = std::move(detail);
  return r;
}

static std::string first_line(const std::string& s) {
  auto nl = s.find('\n');
  return nl == std::string::npos ? s : s.substr(0, nl);
}

ActionExecutor::ActionExecutor(Options opt, const collectors::ProcessInventory& inventory,
                               const std::atomic<int>* cancel)
  : opt_(opt), inventory_(inventory), cancel_(cancel) {}

bool ActionExecutor::process_alive(int32_t pid) {
  if (pid <= 0) return false;
  if (::kill(pid, 0) != 0 && errno == ESRCH) return false;
  // Signalling succeeds on zombies; look at the state letter
  auto content = util::read_file_string("/proc/" + std::to_string(pid) + "/stat");
  if (!content) return false;
  collectors::ProcessInventory::StatFields f;
  if (!collectors::ProcessInventory::parse_stat_line(*content, f)) return true;
  return f.state != 'Z' && f.state != 'X';
}

model::ActionResult ActionExecutor::remove_file(const model::CleanupTarget& t) const {
  std::error_code ec;
  fs::path p(t.identifier);
  if (!fs::exists(fs::symlink_status(p, ec)))
    return make_result(t, model::ActionStatus::Failed, model::ErrorKind::ActionFailed, "vanished before removal");
  fs::remove_all(p, ec);
  if (ec) {
    auto kind = (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
                  ? model::ErrorKind::PermissionDenied : model::ErrorKind::ActionFailed;
    return make_result(t, model::ActionStatus::Failed, kind, ec.message());
  }
  auto r = make_result(t, model::ActionStatus::Success);
  r.bytes_freed = t.size_bytes;
  return r;
}

model::ActionResult ActionExecutor::terminate_process(const model::CleanupTarget& t) const {
  if (!process_alive(t.pid))
    return make_result(t, model::ActionStatus::Skipped, model::ErrorKind::TargetNotFound, "already exited");
  // The pid may have been recycled, or taken over by a protected program, since planning
  auto now = inventory_.read(t.pid);
  if (!now)
    return make_result(t, model::ActionStatus::Skipped, model::ErrorKind::TargetNotFound, "already exited");
  if (now->command != t.command || now->start_ticks != t.start_ticks)
    return make_result(t, model::ActionStatus::Skipped, model::ErrorKind::TargetNotFound,
                       "pid reused by " + now->command);
  if (now->is_protected)
    return make_result(t, model::ActionStatus::Skipped, std::nullopt, "protected process");
  if (::kill(t.pid, SIGTERM) != 0) {
    int e = errno;
    if (e == ESRCH)
      return make_result(t, model::ActionStatus::Skipped, model::ErrorKind::TargetNotFound, "already exited");
    auto kind = e == EPERM ? model::ErrorKind::PermissionDenied : model::ErrorKind::ActionFailed;
    return make_result(t, model::ActionStatus::Failed, kind, std::strerror(e));
  }
  auto deadline = std::chrono::steady_clock::now() + opt_.grace;
  while (process_alive(t.pid)) {
    if (std::chrono::steady_clock::now() >= deadline)
      return make_result(t, model::ActionStatus::Failed, model::ErrorKind::Timeout,
                         "still running after SIGTERM");
    std::this_thread::sleep_for(opt_.poll);
  }
  return make_result(t, model::ActionStatus::Success);
}

model::ActionResult ActionExecutor::run_command(const model::CleanupTarget& t) const {
  auto cr = util::run_command(t.identifier, opt_.command_timeout);
  if (!cr.started)
    return make_result(t, model::ActionStatus::Failed, model::ErrorKind::ActionFailed, "could not start /bin/sh");
  if (cr.timed_out)
    return make_result(t, model::ActionStatus::Failed, model::ErrorKind::Timeout,
                       "timed out after " + std::to_string(opt_.command_timeout.count() / 1000) + " s");
  if (cr.exit_code != 0) {
    std::string detail = "exit " + std::to_string(cr.exit_code);
    auto line = first_line(cr.output);
    if (!line.empty()) detail += ": " + line;
    return make_result(t, model::ActionStatus::Failed, model::ErrorKind::ActionFailed, detail);
  }
  return make_result(t, model::ActionStatus::Success);
}

model::ActionResult ActionExecutor::execute_one(const model::CleanupTarget& t, model::RunMode mode) const {
  if (mode == model::RunMode::DryRun) {
    auto r = make_result(t, model::ActionStatus::DryRun);
    r.bytes_reclaimable = t.size_bytes;
    return r;
  }
  switch (t.kind) {
    case model::TargetKind::File:
      return remove_file(t);
    case model::TargetKind::Process:
      return terminate_process(t);
    case model::TargetKind::Command:
      return run_command(t);
  }
  return make_result(t, model::ActionStatus::Failed, model::ErrorKind::ActionFailed, "unknown target kind");
}

void ActionExecutor::execute(model::CleanupSession& session) const {
  for (size_t i = 0; i < session.planned.size(); ++i) {
    if (cancel_ && cancel_->load() != 0) {
      session.cancelled = true;
      session.not_attempted = session.planned.size() - i;
      RECLAIM_LOG_WARN("Interrupted: %zu action(s) not attempted", session.not_attempted);
      break;
    }
    const auto& t = session.planned[i];
    RECLAIM_LOG_VERBOSE("reclaim: executor: %s %s", model::to_string(t.kind), t.identifier.c_str());
    auto r = execute_one(t, session.mode);
    switch (r.status) {
      case model::ActionStatus::Success:
        if (t.kind == model::TargetKind::File)
          RECLAIM_LOG_SUCCESS("%s (%s)", t.label.c_str(), ui::format_bytes(r.bytes_freed).c_str());
        else
          RECLAIM_LOG_SUCCESS("%s", t.label.c_str());
        break;
      case model::ActionStatus::Failed:
        RECLAIM_LOG_WARN("%s: %s", t.label.c_str(), r.detail.c_str());
        break;
      case model::ActionStatus::Skipped:
        RECLAIM_LOG_VERBOSE("skipped %s: %s", t.label.c_str(), r.detail.c_str());
        break;
      case model::ActionStatus::DryRun:
        RECLAIM_LOG_VERBOSE("would clean %s (%s)", t.label.c_str(),
                            ui::format_bytes(r.bytes_reclaimable).c_str());
        break;
    }
    session.actions.push_back(std::move(r));
  }
}

} // namespace reclaim::app
