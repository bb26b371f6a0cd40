#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>

namespace reclaim::app {

bool Config::category_enabled(const std::string& name) const {
  for (const auto& [n, on] : categories)
    if (n == name) return on;
  return true;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  // Accept lowercase reclaim_ prefix as well
  std::string alt;
  std::string n(name);
  if (n.rfind("RECLAIM_", 0) == 0) {
    alt = std::string("reclaim_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view sv(v);
  int out = defv;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  if (ec != std::errc() || ptr != sv.data() + sv.size()) return defv;
  return out;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/reclaim/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/reclaim/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                        const char* section, const char* key,
                        const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                   const char* section, const char* key,
                                   const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& explicit_path, std::string& err) {
  Config c{};
  util::TomlReader toml;
  auto path = explicit_path.empty() ? config_file_path() : explicit_path;
  bool have_toml = !path.empty() && toml.load(path);
  if (!have_toml && !explicit_path.empty()) err = "cannot read config file " + explicit_path;
  if (have_toml) c.source_path = path;

  // --- [process] ---
  c.process.threshold_mb = resolve_int(toml, have_toml, "process", "threshold_mb", "RECLAIM_PROCESS_THRESHOLD_MB", 100);
  c.process.grace_ms     = resolve_int(toml, have_toml, "process", "grace_ms",     "RECLAIM_GRACE_MS", 2000);
  if (have_toml) c.process.protect = toml.get_list("process", "protect");

  // --- [commands] / [session] / [planner] ---
  c.commands.timeout_s   = resolve_int(toml, have_toml, "commands", "timeout_s",  "RECLAIM_COMMAND_TIMEOUT_S", 60);
  c.session.settle_ms    = resolve_int(toml, have_toml, "session",  "settle_ms",  "RECLAIM_SETTLE_MS", 5000);
  c.planner.processes_first = have_toml && toml.get_bool("planner", "processes_first", false);

  // --- [paths] / [categories] ---
  if (have_toml) {
    c.extra_paths = toml.get_list("paths", "extra");
    for (const auto& name : toml.keys("categories"))
      c.categories.emplace_back(name, toml.get_bool("categories", name, true));
  }

  // --- [log] ---
  c.log_dir = resolve_string(toml, have_toml, "log", "dir", "RECLAIM_LOG_DIR", "");

  // Negative values make no sense for any of these
  c.process.threshold_mb = std::max(0, c.process.threshold_mb);
  c.process.grace_ms     = std::max(0, c.process.grace_ms);
  c.commands.timeout_s   = std::max(1, c.commands.timeout_s);
  c.session.settle_ms    = std::max(0, c.session.settle_ms);
  return c;
}

} // namespace reclaim::app
