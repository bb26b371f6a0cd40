#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace reclaim::util {

static std::string proc_root() {
  const char* env = std::getenv("RECLAIM_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // procfs files can vanish between open and read (exited pid)
  if (in.bad()) return std::nullopt;
  return s;
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_proc_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

auto parse_strict_u64(std::string_view sv) -> std::optional<uint64_t> {
  if (sv.empty()) return std::nullopt;
  for (char c : sv) if (c < '0' || c > '9') return std::nullopt;
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt; // overflow
  return v;
}

} // namespace reclaim::util
