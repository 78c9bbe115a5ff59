#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ssample::util {

// Reader for the flat TOML subset used by ssample's config file:
// [section] headers, key = value pairs, '#' comments, optional double quotes.
class TomlReader {
public:
  bool load(const std::string& path) {
    entries_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        section = std::string(trim(sv.substr(1, sv.size() - 2)));
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      auto key = trim(sv.substr(0, eq));
      auto val = strip_comment(trim(sv.substr(eq + 1)));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      set(section, std::string(key), std::string(val));
    }
    return true;
  }

  [[nodiscard]] std::optional<std::string> get_string(std::string_view section, std::string_view key) const {
    for (const auto& e : entries_)
      if (e.section == section && e.key == key) return e.value;
    return std::nullopt;
  }

  [[nodiscard]] std::optional<long long> get_int(std::string_view section, std::string_view key) const {
    auto v = get_string(section, key);
    if (!v || v->empty()) return std::nullopt;
    long long out = 0;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc{} || ptr != v->data() + v->size()) return std::nullopt;
    return out;
  }

  [[nodiscard]] std::optional<bool> get_bool(std::string_view section, std::string_view key) const {
    auto v = get_string(section, key);
    if (!v) return std::nullopt;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return std::nullopt;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return get_string(section, key).has_value();
  }

private:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };
  std::vector<Entry> entries_;

  void set(const std::string& section, std::string key, std::string value) {
    for (auto& e : entries_) {
      if (e.section == section && e.key == key) { e.value = std::move(value); return; }
    }
    entries_.push_back(Entry{section, std::move(key), std::move(value)});
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // Drop a trailing "# ..." unless it sits inside a quoted string.
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return trim(sv.substr(0, i));
    }
    return sv;
  }
};

} // namespace ssample::util
