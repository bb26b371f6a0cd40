#include "app/Confirmation.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <cstdio>

namespace reclaim::app {

bool PromptGate::confirm(const CategorySpec& category, const std::vector<model::CleanupTarget>& preview) {
  if (!preview.empty()) {
    std::printf("\n");
    for (const auto& t : preview) {
      if (t.kind == model::TargetKind::Process)
        std::printf("  %s  %s\n", ui::trunc_pad(ui::format_bytes(t.resident_bytes), 8).c_str(), t.label.c_str());
      else
        std::printf("  %s\n", t.label.c_str());
    }
  }
  return ui::ask_yes_no(category.question);
}

} // namespace reclaim::app
