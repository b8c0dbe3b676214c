#pragma once

#include <cctype>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relite::util {

// Flat TOML subset: [section] headers, key = value lines, '#' comments,
// double-quoted strings and bare values (booleans, words). Lines that fit none of
// these are skipped and their numbers kept in malformed_lines().
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
      sections_.clear();
      malformed_.clear();
      return false;
    }
    parse(in);
    return true;
  }

  void parse(std::istream& in) {
    sections_.clear();
    malformed_.clear();
    std::string current_section;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[') {
        if (sv.back() != ']' || sv.size() < 3) { malformed_.push_back(lineno); continue; }
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) { malformed_.push_back(lineno); continue; }
      std::string key(trim(sv.substr(0, eq)));
      if (key.empty()) { malformed_.push_back(lineno); continue; }
      std::string val;
      if (!parse_value(sv.substr(eq + 1), val)) { malformed_.push_back(lineno); continue; }
      ensure_section(current_section).set(key, val);
    }
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  // nullopt when the key is missing or its value is not a boolean.
  [[nodiscard]] std::optional<bool> find_bool(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    if (!s) return std::nullopt;
    auto val = s->get(key, "");
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return std::nullopt;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    return find_bool(section, key).value_or(def);
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  [[nodiscard]] const std::vector<int>& malformed_lines() const { return malformed_; }

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
  std::vector<int> malformed_;

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

  // Quoted value: text up to the closing quote, \" and \\ unescaped.
  // Bare value: text up to an inline '#' comment.
  static bool parse_value(std::string_view raw, std::string& out) {
    auto sv = trim(raw);
    out.clear();
    if (!sv.empty() && sv.front() == '"') {
      for (size_t i = 1; i < sv.size(); ++i) {
        char c = sv[i];
        if (c == '\\' && i + 1 < sv.size()) { out.push_back(sv[++i]); continue; }
        if (c == '"') {
          auto rest = trim(sv.substr(i + 1));
          return rest.empty() || rest.front() == '#';
        }
        out.push_back(c);
      }
      return false;  // unterminated
    }
    auto hash = sv.find('#');
    if (hash != std::string_view::npos) sv = trim(sv.substr(0, hash));
    out = std::string(sv);
    return !out.empty();
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace relite::util
