#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "probegraph/util/Parse.hpp"

namespace probegraph {

// Minimal INI parser:
// - Sections: [name]
// - Key: key = value
// - Comments: lines starting with '#' or ';', and trailing " # ..." / " ; ..."
// - Values: raw strings; surrounding quotes (single/double) are stripped.
//
// Getters fail fast: a missing key without a default, or a value that does
// not parse completely, throws std::runtime_error naming the file and key.
class IniConfig {
public:
  explicit IniConfig(const std::filesystem::path& file) : file_(file) {
    std::ifstream ifs(file_);
    if (!ifs) {
      throw std::runtime_error(where_() + "failed to open config");
    }
    parse_(ifs);
  }

  // In-memory config; relative paths resolve against `base_dir`.
  static IniConfig from_string(const std::string& text, const std::filesystem::path& base_dir = {}) {
    IniConfig cfg;
    cfg.file_ = base_dir / "<string>";
    std::istringstream iss(text);
    cfg.parse_(iss);
    return cfg;
  }

  const std::filesystem::path& file_path() const { return file_; }
  std::filesystem::path base_dir() const { return file_.parent_path(); }

  bool has_section(const std::string& section) const {
    return data_.find(section) != data_.end();
  }

  bool has_key(const std::string& section, const std::string& key) const {
    return lookup_(section, key) != nullptr;
  }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    if (const std::string* v = lookup_(section, key)) return *v;
    return require_default_(def, section, key);
  }

  // Relative paths are taken relative to the config file's directory.
  std::filesystem::path get_path(const std::string& section, const std::string& key,
                                 const std::optional<std::string>& def = std::nullopt) const {
    std::filesystem::path p(get_string(section, key, def));
    if (p.empty()) throw std::runtime_error(where_() + section + "." + key + " is empty");
    if (p.is_relative()) p = base_dir() / p;
    return p;
  }

  std::int64_t get_int64(const std::string& section, const std::string& key,
                         const std::optional<std::int64_t>& def = std::nullopt) const {
    return get_number_<std::int64_t>("integer", section, key, def);
  }

  std::uint64_t get_uint64(const std::string& section, const std::string& key,
                           const std::optional<std::uint64_t>& def = std::nullopt) const {
    return get_number_<std::uint64_t>("unsigned integer", section, key, def);
  }

  std::size_t get_size(const std::string& section, const std::string& key,
                       const std::optional<std::size_t>& def = std::nullopt) const {
    return get_number_<std::size_t>("count", section, key, def);
  }

  // get_size() that also rejects 0.
  std::size_t get_positive_size(const std::string& section, const std::string& key,
                                const std::optional<std::size_t>& def = std::nullopt) const {
    const std::size_t v = get_size(section, key, def);
    if (v == 0) throw std::runtime_error(where_() + section + "." + key + " must be positive");
    return v;
  }

  double get_double(const std::string& section, const std::string& key,
                    const std::optional<double>& def = std::nullopt) const {
    return get_number_<double>("number", section, key, def);
  }

  double get_positive_double(const std::string& section, const std::string& key,
                             const std::optional<double>& def = std::nullopt) const {
    const double v = get_double(section, key, def);
    if (!(v > 0.0)) throw std::runtime_error(where_() + section + "." + key + " must be positive");
    return v;
  }

  // Accepts 1/0, true/false, yes/no, on/off in any case.
  bool get_bool(const std::string& section, const std::string& key,
                const std::optional<bool>& def = std::nullopt) const {
    const auto raw = lookup_(section, key);
    if (!raw) return require_default_(def, section, key);
    std::string v = *raw;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const char* const kTrue[] = {"1", "true", "yes", "on"};
    static const char* const kFalse[] = {"0", "false", "no", "off"};
    if (std::find(std::begin(kTrue), std::end(kTrue), v) != std::end(kTrue)) return true;
    if (std::find(std::begin(kFalse), std::end(kFalse), v) != std::end(kFalse)) return false;
    throw bad_value_("boolean", section, key, *raw);
  }

  // Rejects keys of `section` outside `known` (catches typos in the file).
  void require_known_keys(const std::string& section, std::initializer_list<const char*> known) const {
    auto it = data_.find(section);
    if (it == data_.end()) return;
    std::vector<std::string> unknown;
    for (const auto& kv : it->second) {
      const bool ok = std::any_of(known.begin(), known.end(), [&](const char* k) { return kv.first == k; });
      if (!ok) unknown.push_back(kv.first);
    }
    if (unknown.empty()) return;
    std::sort(unknown.begin(), unknown.end());
    std::string msg = where_() + "unknown key(s) in [" + section + "]:";
    for (const auto& k : unknown) msg += " " + k;
    throw std::runtime_error(msg);
  }

private:
  std::filesystem::path file_;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;

  IniConfig() = default;

  static std::string trim_(std::string_view s) {
    while (!s.empty() && is_ws(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_ws(s.back())) s.remove_suffix(1);
    return std::string(s);
  }

  static std::string unquote_(const std::string& s) {
    const bool quoted = s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front();
    return quoted ? s.substr(1, s.size() - 2) : s;
  }

  // Drops a trailing comment introduced by whitespace + '#' or ';'
  // outside quotes.
  static std::string strip_inline_comment_(const std::string& s) {
    char quote = '\0';
    for (std::size_t i = 0; i < s.size(); ++i) {
      const char c = s[i];
      if (quote) {
        if (c == quote) quote = '\0';
      } else if (c == '"' || c == '\'') {
        quote = c;
      } else if ((c == '#' || c == ';') && i > 0 && (s[i - 1] == ' ' || s[i - 1] == '\t')) {
        return s.substr(0, i);
      }
    }
    return s;
  }

  std::string where_() const { return "IniConfig[" + file_.string() + "]: "; }

  std::runtime_error bad_value_(const char* type, const std::string& section, const std::string& key,
                                const std::string& value) const {
    return std::runtime_error(where_() + section + "." + key + " is not a valid " + type + ": '" + value + "'");
  }

  template <typename T>
  T require_default_(const std::optional<T>& def, const std::string& section, const std::string& key) const {
    if (def) return *def;
    throw std::runtime_error(where_() + "missing required key '" + key + "' in section [" + section + "]");
  }

  template <typename T>
  T get_number_(const char* type, const std::string& section, const std::string& key,
                const std::optional<T>& def) const {
    const auto raw = lookup_(section, key);
    if (!raw) return require_default_(def, section, key);
    T v{};
    bool ok = false;
    if constexpr (std::is_floating_point_v<T>) {
      ok = parse_double(*raw, v);
    } else {
      ok = parse_int(*raw, v);
    }
    if (!ok) throw bad_value_(type, section, key, *raw);
    return v;
  }

  const std::string* lookup_(const std::string& section, const std::string& key) const {
    const auto sec = data_.find(section);
    if (sec == data_.end()) return nullptr;
    const auto kv = sec->second.find(key);
    return kv == sec->second.end() ? nullptr : &kv->second;
  }

  void parse_(std::istream& is) {
    std::string section;
    std::string raw;
    std::size_t lineno = 0;
    const auto fail = [&](const std::string& what) {
      return std::runtime_error(where_() + what + " at line " + std::to_string(lineno));
    };

    while (std::getline(is, raw)) {
      ++lineno;
      const std::string line = trim_(raw);
      if (line.empty() || line.front() == '#' || line.front() == ';') continue;

      if (line.front() == '[') {
        const auto close = line.find(']');
        if (close == std::string::npos || !trim_(strip_inline_comment_(line.substr(close + 1))).empty()) {
          throw fail("malformed section header");
        }
        section = trim_(line.substr(1, close - 1));
        if (section.empty()) throw fail("empty section name");
        data_.try_emplace(section);
        continue;
      }

      const auto eq = line.find('=');
      if (eq == std::string::npos) throw fail("expected 'key = value', got '" + line + "'");
      const std::string key = trim_(line.substr(0, eq));
      if (key.empty()) throw fail("empty key");
      if (section.empty()) throw fail("key '" + key + "' outside any section");

      std::string value = unquote_(trim_(strip_inline_comment_(line.substr(eq + 1))));
      if (!data_[section].emplace(key, std::move(value)).second) {
        throw fail("duplicate key '" + key + "' in [" + section + "]");
      }
    }
  }
};

} // namespace probegraph
