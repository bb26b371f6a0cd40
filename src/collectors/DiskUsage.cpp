#include "collectors/DiskUsage.hpp"

#include <sys/stat.h>

#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace reclaim::collectors {

namespace {

struct InodeTally {
  std::set<std::pair<dev_t, ino_t>> seen;
  uint64_t bytes{};

  void add(const struct stat& st) {
    if (st.st_nlink > 1 && !S_ISDIR(st.st_mode)) {
      if (!seen.emplace(st.st_dev, st.st_ino).second) return;
    }
    bytes += static_cast<uint64_t>(st.st_blocks) * 512ULL;
  }
};

} // namespace

auto tree_allocated_bytes(const fs::path& root) -> std::optional<uint64_t> {
  struct stat st{};
  if (::lstat(root.c_str(), &st) != 0) return std::nullopt;
  InodeTally tally;
  tally.add(st);
  if (!S_ISDIR(st.st_mode)) return tally.bytes;

  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) return tally.bytes;
  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) { ec.clear(); continue; }
    struct stat est{};
    // entries can disappear while walking a live cache
    if (::lstat(it->path().c_str(), &est) != 0) continue;
    tally.add(est);
  }
  return tally.bytes;
}

} // namespace reclaim::collectors
