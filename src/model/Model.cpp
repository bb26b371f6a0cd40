#include "model/Action.hpp"
#include "model/Session.hpp"

namespace reclaim::model {

const char* to_string(TargetKind k) {
  switch (k) {
    case TargetKind::File: return "file";
    case TargetKind::Process: return "process";
    case TargetKind::Command: return "command";
  }
  return "?";
}

const char* to_string(ActionStatus s) {
  switch (s) {
    case ActionStatus::Success: return "SUCCESS";
    case ActionStatus::Skipped: return "SKIPPED";
    case ActionStatus::Failed: return "FAILED";
    case ActionStatus::DryRun: return "DRY_RUN";
  }
  return "?";
}

const char* to_string(ErrorKind e) {
  switch (e) {
    case ErrorKind::PlatformUnsupported: return "platform unsupported";
    case ErrorKind::MetricsUnavailable: return "metrics unavailable";
    case ErrorKind::PermissionDenied: return "permission denied";
    case ErrorKind::ActionFailed: return "action failed";
    case ErrorKind::TargetNotFound: return "not found";
    case ErrorKind::Timeout: return "timeout";
  }
  return "?";
}

const char* to_string(SessionStage s) {
  switch (s) {
    case SessionStage::Created: return "created";
    case SessionStage::BaselineCollected: return "baseline-collected";
    case SessionStage::Planned: return "planned";
    case SessionStage::Executed: return "executed";
    case SessionStage::FinalCollected: return "final-collected";
    case SessionStage::Reported: return "reported";
  }
  return "?";
}

} // namespace reclaim::model
