#pragma once
#include "app/Profiles.hpp"
#include "model/Action.hpp"
#include <vector>

namespace reclaim::app {

// Asked once per category. `preview` holds the already planned targets for
// process categories and is empty otherwise (those are asked before planning).
class ConfirmationGate {
public:
  virtual ~ConfirmationGate() = default;
  [[nodiscard]] virtual bool confirm(const CategorySpec& category,
                                     const std::vector<model::CleanupTarget>& preview) = 0;
};

// --yes
class AutoApproveGate : public ConfirmationGate {
public:
  bool confirm(const CategorySpec&, const std::vector<model::CleanupTarget>&) override { return true; }
};

// Prints the preview, then "<question> (y/N): " on the terminal
class PromptGate : public ConfirmationGate {
public:
  bool confirm(const CategorySpec& category, const std::vector<model::CleanupTarget>& preview) override;
};

} // namespace reclaim::app
