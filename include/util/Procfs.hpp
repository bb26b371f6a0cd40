// Helpers for reading /proc with optional root remap
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <string_view>

namespace reclaim::util {

// Map an absolute /proc path to an alternate root if RECLAIM_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns empty vector on error.
auto list_dir(const std::string& abs) -> std::vector<std::string>;

// Strict unsigned decimal: one or more digits, nothing else, no overflow.
[[nodiscard]] auto parse_strict_u64(std::string_view sv) -> std::optional<uint64_t>;

} // namespace reclaim::util
