#pragma once
#include "app/ActionExecutor.hpp"
#include "app/ActionPlanner.hpp"
#include "app/Confirmation.hpp"
#include "collectors/MetricsCollector.hpp"
#include "model/Session.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace reclaim::app {

// Drives one session through Created -> ... -> Reported. Only a failed
// baseline sample is fatal; everything after it degrades into results.
class Pipeline {
public:
  struct Options {
    std::chrono::milliseconds settle{0}; // live runs with a success only
    size_t top_processes{0};             // table printed after the baseline; 0 = none
  };

  Pipeline(const collectors::MetricsCollector& metrics, const ActionPlanner& planner,
           const ActionExecutor& executor, ConfirmationGate& gate,
           const std::atomic<int>* cancel, Options opt);

  // Leaves the session at FinalCollected. false with err when the baseline
  // cannot be sampled (session stays at Created, nothing is planned).
  [[nodiscard]] bool run(model::CleanupSession& s, const std::vector<CategorySpec>& categories,
                         std::string& err) const;

  // FinalCollected -> Reported. `full` picks render() over render_oneline().
  [[nodiscard]] std::string report(model::CleanupSession& s, bool full) const;

private:
  [[nodiscard]] bool cancelled() const { return cancel_ && cancel_->load() != 0; }
  void plan(model::CleanupSession& s, const std::vector<CategorySpec>& categories) const;
  void settle() const;
  void show_top_processes(model::CleanupSession& s) const;

  const collectors::MetricsCollector& metrics_;
  const ActionPlanner& planner_;
  const ActionExecutor& executor_;
  ConfirmationGate& gate_;
  const std::atomic<int>* cancel_{};
  Options opt_;
};

} // namespace reclaim::app
