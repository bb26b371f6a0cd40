#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace reclaim::util {

// Minimal TOML subset: [sections], key = value, "quoted strings", integers,
// booleans and flat string arrays (which may span several lines).
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']' && sv.find('=') == std::string_view::npos) {
        current_section = std::string(sv.substr(1, sv.size() - 2));
        trim_inplace(current_section);
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (!val.empty() && val.front() == '[') {
        // Array: keep consuming lines until the closing bracket
        while (!array_closed(val) && std::getline(in, line)) {
          auto cont = trim(line);
          if (cont.empty() || cont[0] == '#') continue;
          val += ' ';
          val += cont;
        }
      } else if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
        val = val.substr(1, val.size() - 2);
      }
      ensure_section(current_section).set(key, val);
    }
    return true;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    // Leading integer; a trailing "# comment" is ignored
    const char* first = val.data();
    const char* last = val.data() + val.size();
    if (*first == '+') ++first;
    int out = def;
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc() || ptr == first) return def;
    return out;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    // Case-insensitive true/false
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  // ["a", "b"] -> {a, b}. A bare scalar yields a one-element list.
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key) const {
    std::vector<std::string> out;
    const auto* s = find_section(section);
    if (!s || !s->has(key)) return out;
    auto raw = s->get(key, "");
    std::string_view sv = trim(raw);
    if (sv.empty()) return out;
    if (sv.front() != '[') { out.emplace_back(sv); return out; }
    sv.remove_prefix(1);
    if (!sv.empty() && sv.back() == ']') sv.remove_suffix(1);
    size_t i = 0;
    while (i < sv.size()) {
      while (i < sv.size() && (std::isspace(static_cast<unsigned char>(sv[i])) || sv[i] == ',')) ++i;
      if (i >= sv.size()) break;
      if (sv[i] == '"') {
        size_t end = sv.find('"', i + 1);
        if (end == std::string_view::npos) end = sv.size();
        out.emplace_back(sv.substr(i + 1, end - i - 1));
        i = end + 1;
      } else {
        size_t end = sv.find(',', i);
        if (end == std::string_view::npos) end = sv.size();
        auto item = trim(sv.substr(i, end - i));
        if (!item.empty()) out.emplace_back(item);
        i = end;
      }
    }
    return out;
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    ensure_section(section).set(key, value);
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  // Keys of a section in file order (used for [categories] toggles)
  [[nodiscard]] std::vector<std::string> keys(std::string_view section) const {
    std::vector<std::string> out;
    if (const auto* s = find_section(section))
      for (const auto& [k, v] : s->entries) out.push_back(k);
    return out;
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  // A ']' outside of quotes closes the array
  static bool array_closed(const std::string& val) {
    bool in_str = false;
    for (char c : val) {
      if (c == '"') in_str = !in_str;
      else if (c == ']' && !in_str) return true;
    }
    return false;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static void trim_inplace(std::string& s) {
    auto sv = trim(std::string_view(s));
    s = std::string(sv);
  }
};

} // namespace reclaim::util
