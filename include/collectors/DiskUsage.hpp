#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>

namespace reclaim::collectors {

// Allocated bytes of a file or directory tree (st_blocks * 512, the `du -s`
// figure): symlinks are not followed and hard-linked inodes count once.
// nullopt when the root itself cannot be stat'ed.
[[nodiscard]] auto tree_allocated_bytes(const std::filesystem::path& root) -> std::optional<uint64_t>;

} // namespace reclaim::collectors
