#include "app/Protection.hpp"

#include <unistd.h>

namespace reclaim::app {

// kthreadd is always pid 2; its children are kernel threads
static constexpr int32_t kKthreaddPid = 2;

ProtectionPolicy::ProtectionPolicy()
  : ProtectionPolicy(static_cast<int32_t>(::getpid()), static_cast<int32_t>(::getppid())) {}

ProtectionPolicy::ProtectionPolicy(int32_t self_pid, int32_t parent_pid, std::unordered_set<std::string> names)
  : self_pid_(self_pid), parent_pid_(parent_pid), names_(std::move(names)) {}

const std::unordered_set<std::string>& ProtectionPolicy::default_names() {
  // comm is truncated to 15 bytes by the kernel, hence "gnome-terminal-"
  static const std::unordered_set<std::string> names = {
    // kernel / init
    "systemd", "init", "kthreadd", "systemd-journal", "systemd-logind", "dbus-daemon", "dbus-broker",
    // display and window servers
    "Xorg", "Xwayland", "gnome-shell", "kwin_x11", "kwin_wayland", "plasmashell", "mutter", "sway",
    "weston", "Hyprland",
    // login UI
    "gdm", "gdm-session-wor", "sddm", "sddm-helper", "lightdm", "login", "agetty",
    // file managers
    "nautilus", "dolphin", "thunar", "nemo", "pcmanfm",
    // terminals and shells
    "gnome-terminal-", "konsole", "xterm", "kitty", "alacritty", "foot", "wezterm-gui", "tilix",
    "tmux: server", "screen",
    "bash", "zsh", "sh", "dash", "fish", "ksh", "tcsh",
    // remote access, privilege and monitors
    "ssh", "sshd", "sudo", "su", "top", "htop", "btop",
  };
  return names;
}

void ProtectionPolicy::add_name(const std::string& name) {
  if (!name.empty()) names_.insert(name);
}

bool ProtectionPolicy::is_protected(const model::ProcessRecord& p) const {
  return !reason(p).empty();
}

std::string ProtectionPolicy::reason(const model::ProcessRecord& p) const {
  if (p.pid == self_pid_) return "own process";
  if (p.pid == parent_pid_) return "parent process";
  if (p.pid <= kKthreaddPid) return "init/kernel";
  if (p.ppid == kKthreaddPid) return "kernel thread";
  if (names_.count(p.command)) return "protected name";
  return {};
}

} // namespace reclaim::app
