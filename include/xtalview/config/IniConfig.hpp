#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "xtalview/core/Errors.hpp"

namespace xtalview {

// Minimal INI parser:
// - Sections: [section.name]
// - Key: key = value
// - Comments: lines starting with '#' or ';'
// - Values: raw strings; surrounding quotes (single/double) are stripped.
//
// Missing or unparsable values raise InvalidParameterError naming the source,
// section and key.
class IniConfig {
public:
  explicit IniConfig(const std::filesystem::path& file) : source_(file.string()) {
    std::ifstream ifs(file);
    if (!ifs) {
      throw InvalidParameterError(err_prefix_() + "failed to open config");
    }
    parse_(ifs);
  }

  // In-memory config (tests, embedded defaults).
  static IniConfig from_string(const std::string& text, std::string source = "<string>") {
    IniConfig cfg;
    cfg.source_ = std::move(source);
    std::istringstream iss(text);
    cfg.parse_(iss);
    return cfg;
  }

  const std::string& source() const { return source_; }

  // Sorted names of sections starting with `prefix` (e.g. "species.").
  std::vector<std::string> section_names(const std::string& prefix = "") const {
    std::vector<std::string> out;
    for (const auto& kv : data_) {
      if (kv.first.compare(0, prefix.size(), prefix) == 0) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  bool has_key(const std::string& section, const std::string& key) const {
    return get_raw_(section, key).has_value();
  }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    if (auto v = get_raw_(section, key)) {
      return *v;
    }
    if (def) return *def;
    throw InvalidParameterError(err_prefix_() + "missing required key '" + key + "' in section [" + section + "]");
  }

  std::int64_t get_int64(const std::string& section, const std::string& key,
                         const std::optional<std::int64_t>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    const std::string s = get_string(section, key);
    return parse_int64_(s, section + "." + key);
  }

  double get_double(const std::string& section, const std::string& key,
                    const std::optional<double>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    const std::string s = get_string(section, key);
    return parse_double_(s, section + "." + key);
  }

  // Parse comma-separated list. Whitespace around items is trimmed.
  std::vector<std::string> get_list(const std::string& section, const std::string& key,
                                    const std::optional<std::string>& def = std::nullopt) const {
    std::vector<std::string> out;
    split_csv_(get_string(section, key, def), out);
    return out;
  }

  // Comma-separated integers with an exact element count ("2,2,4").
  std::vector<std::int64_t> get_int64_list(const std::string& section, const std::string& key,
                                           std::size_t expected_count) const {
    const auto items = get_list(section, key);
    if (items.size() != expected_count) {
      throw InvalidParameterError(err_prefix_() + section + "." + key + " expects " +
                                  std::to_string(expected_count) + " comma-separated integers, got " +
                                  std::to_string(items.size()));
    }
    std::vector<std::int64_t> out;
    out.reserve(items.size());
    for (const auto& it : items) out.push_back(parse_int64_(it, section + "." + key));
    return out;
  }

private:
  std::string source_;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;

  IniConfig() = default;

  static std::string trim_(std::string s) {
    auto is_ws = [](unsigned char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
    std::size_t b = 0;
    while (b < s.size() && is_ws(static_cast<unsigned char>(s[b]))) ++b;
    std::size_t e = s.size();
    while (e > b && is_ws(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
  }

  static std::string strip_quotes_(std::string s) {
    if (s.size() >= 2) {
      const char a = s.front();
      const char b = s.back();
      if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
        return s.substr(1, s.size() - 2);
      }
    }
    return s;
  }

  static void split_csv_(const std::string& s, std::vector<std::string>& out) {
    out.clear();
    std::string cur;
    for (char ch : s) {
      if (ch == ',') {
        auto t = trim_(cur);
        if (!t.empty()) out.push_back(t);
        cur.clear();
      } else {
        cur.push_back(ch);
      }
    }
    auto t = trim_(cur);
    if (!t.empty()) out.push_back(t);
  }

  std::int64_t parse_int64_(const std::string& s, const std::string& what) const {
    std::size_t pos = 0;
    long long v = 0;
    try {
      v = std::stoll(s, &pos);
    } catch (const std::exception&) {
      pos = 0;
    }
    if (pos == 0 || pos != s.size()) {
      throw InvalidParameterError(err_prefix_() + "failed to parse integer for " + what + " from value: '" + s + "'");
    }
    return static_cast<std::int64_t>(v);
  }

  double parse_double_(const std::string& s, const std::string& what) const {
    std::size_t pos = 0;
    double v = 0.0;
    try {
      v = std::stod(s, &pos);
    } catch (const std::exception&) {
      pos = 0;
    }
    if (pos == 0 || pos != s.size()) {
      throw InvalidParameterError(err_prefix_() + "failed to parse double for " + what + " from value: '" + s + "'");
    }
    return v;
  }

  std::string err_prefix_() const {
    return std::string("IniConfig[") + source_ + "]: ";
  }

  std::optional<std::string> get_raw_(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    if (it == data_.end()) return std::nullopt;
    auto it2 = it->second.find(key);
    if (it2 == it->second.end()) return std::nullopt;
    return it2->second;
  }

  void parse_(std::istream& is) {
    std::string section = "";
    std::string line;
    std::size_t lineno = 0;

    while (std::getline(is, line)) {
      ++lineno;
      std::string s = trim_(line);
      if (s.empty()) continue;
      if (s[0] == '#' || s[0] == ';') continue;

      if (s.front() == '[' && s.back() == ']') {
        section = trim_(s.substr(1, s.size() - 2));
        if (section.empty()) {
          throw InvalidParameterError(err_prefix_() + "empty section header at line " + std::to_string(lineno));
        }
        (void)data_[section];
        continue;
      }

      auto eq = s.find('=');
      if (eq == std::string::npos) {
        throw InvalidParameterError(err_prefix_() + "expected key=value at line " + std::to_string(lineno) + ": " + s);
      }

      std::string key = trim_(s.substr(0, eq));
      std::string val = strip_quotes_(trim_(s.substr(eq + 1)));
      if (key.empty()) {
        throw InvalidParameterError(err_prefix_() + "empty key at line " + std::to_string(lineno));
      }
      if (section.empty()) {
        throw InvalidParameterError(err_prefix_() + "key outside any section at line " + std::to_string(lineno) + ": " + key);
      }

      data_[section][key] = val;
    }
  }
};

} // namespace xtalview
