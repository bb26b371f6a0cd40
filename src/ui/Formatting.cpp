#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <ctime>

namespace reclaim::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (use_unicode()? "…" : ".");
}

std::string format_bytes(uint64_t bytes) {
  constexpr uint64_t KiB = 1024ULL, MiB = KiB * 1024ULL, GiB = MiB * 1024ULL;
  if (bytes == 0) return "0 B";
  if (bytes < KiB) return std::to_string(bytes) + " B";
  if (bytes < MiB) return std::to_string(bytes / KiB) + " KB";
  if (bytes < GiB) return std::to_string(bytes / MiB) + " MB";
  return std::to_string(bytes / GiB) + " GB";
}

int64_t to_whole_mb(int64_t bytes) {
  return bytes / (1024LL * 1024LL);
}

std::string format_local_time(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm lt{};
  ::localtime_r(&t, &lt);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &lt);
  return buf;
}

} // namespace reclaim::ui
