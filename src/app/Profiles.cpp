#include "app/Profiles.hpp"
#include <algorithm>

namespace reclaim::app {

static void drop_disabled(std::vector<CategorySpec>& cats, const Config& cfg) {
  std::erase_if(cats, [&](const CategorySpec& c) { return !cfg.category_enabled(c.name); });
}

std::vector<CategorySpec> memory_profile(const Config& cfg, ProfileFlags flags) {
  std::vector<CategorySpec> cats;

  cats.push_back({"purge", "Purge inactive memory pages?", {},
    {{"sh -c 'sync && echo 1 > /proc/sys/vm/drop_caches'", "Purge inactive page cache", true}},
    false});

  cats.push_back({"caches", "Clear system memory caches?",
    {{"~/.cache/thumbnails/*", "Thumbnail cache"},
     {"~/.cache/fontconfig/*", "Font cache"}},
    {{"resolvectl flush-caches", "Flush DNS cache", false}},
    false});

  if (flags.aggressive) {
    cats.push_back({"services", "Restart memory-heavy services?", {},
      {{"sh -c 'sync && echo 3 > /proc/sys/vm/drop_caches'", "Drop dentry and inode caches", true},
       {"sh -c 'swapoff -a && swapon -a'", "Cycle swap", true}},
      false});
  }

  if (flags.quit_apps)
    cats.push_back({"apps", "Quit these applications to free memory?", {}, {}, true});

  drop_disabled(cats, cfg);
  return cats;
}

std::vector<CategorySpec> disk_profile(const Config& cfg) {
  std::vector<CategorySpec> cats;

  cats.push_back({"temp", "Clean temporary files?",
    {{"/tmp/*", "System temp files"},
     {"/var/tmp/*", "Persistent temp files"}},
    {}, false});

  // Browser caches first: the generic ~/.cache/* pass then skips them as covered
  cats.push_back({"caches", "Clean application caches?",
    {{"~/.cache/google-chrome/*", "Chrome cache"},
     {"~/.cache/chromium/*", "Chromium cache"},
     {"~/.cache/mozilla/firefox/*", "Firefox cache"},
     {"~/.cache/microsoft-edge/*", "Edge cache"},
     {"~/.cache/*", "User cache"}},
    {}, false});

  cats.push_back({"trash", "Empty Trash?",
    {{"~/.local/share/Trash/files/*", "Trash files"},
     {"~/.local/share/Trash/info/*", "Trash metadata"}},
    {}, false});

  cats.push_back({"logs", "Clean logs?",
    {{"~/.xsession-errors.old", "X session log"},
     {"~/.local/share/xorg/*.old", "Old Xorg logs"}},
    {{"journalctl --user --vacuum-time=7d", "User journal older than 7 days", false}},
    false});

  cats.push_back({"development", "Clean development caches?",
    {{"~/.cache/pip/*", "pip cache"},
     {"~/.cargo/registry/cache/*", "Cargo registry cache"}},
    {{"npm cache clean --force", "npm cache", false},
     {"brew cleanup -s", "Homebrew cache", false}},
    false});

  if (!cfg.extra_paths.empty()) {
    CategorySpec extra{"extra", "Clean configured extra paths?", {}, {}, false};
    for (const auto& p : cfg.extra_paths) extra.paths.push_back({p, p});
    cats.push_back(std::move(extra));
  }

  drop_disabled(cats, cfg);
  return cats;
}

} // namespace reclaim::app
