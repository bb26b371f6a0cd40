#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace reclaim::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Pad with spaces or truncate to exactly w display columns
std::string trunc_pad(const std::string& s, int w);

// "0 B", "512 B", "3 KB", "500 MB", "2 GB" (1024-based, truncating)
std::string format_bytes(uint64_t bytes);

// Whole mebibytes, truncating toward zero (memory deltas are reported in MB)
int64_t to_whole_mb(int64_t bytes);

// Local "YYYY-MM-DD HH:MM:SS"
std::string format_local_time(std::chrono::system_clock::time_point tp);

} // namespace reclaim::ui
