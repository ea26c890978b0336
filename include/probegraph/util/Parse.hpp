#pragma once

#include <charconv>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace probegraph {

inline bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

inline void split_ws(std::string_view s, std::vector<std::string_view>& out) {
  out.clear();
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    while (i < n && is_ws(s[i])) ++i;
    if (i >= n) break;
    std::size_t j = i;
    while (j < n && !is_ws(s[j])) ++j;
    out.emplace_back(s.substr(i, j - i));
    i = j;
  }
}

template <typename IntT>
inline bool parse_int(std::string_view tok, IntT& value) {
  if (!tok.empty() && tok.front() == '+') tok.remove_prefix(1);
  const char* b = tok.data();
  const char* e = tok.data() + tok.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

// Accepts Fortran-style 'D' exponents (1.0D-03) written by some DFT codes.
inline bool parse_double(std::string_view tok, double& value) {
  if (!tok.empty() && tok.front() == '+') tok.remove_prefix(1);
  const char* b = tok.data();
  const char* e = tok.data() + tok.size();
  auto res = std::from_chars(b, e, value);
  if (res.ec == std::errc{} && res.ptr == e) return true;
  if (tok.find_first_of("dD") == std::string_view::npos) return false;
  std::string fixed(tok);
  for (auto& c : fixed) {
    if (c == 'd' || c == 'D') c = 'e';
  }
  res = std::from_chars(fixed.data(), fixed.data() + fixed.size(), value);
  return res.ec == std::errc{} && res.ptr == fixed.data() + fixed.size();
}

// Whitespace-token cursor over an in-memory text file, with line access for
// headers. Errors carry the owner's prefix and the current line number.
class TextCursor {
public:
  TextCursor(std::string_view text, std::string owner)
      : text_(text), owner_(std::move(owner)) {}

  // Rest of the current line (without the newline); advances to the next line.
  std::string_view read_line() {
    if (pos_ >= text_.size()) throw error("unexpected end of file");
    const std::size_t end = text_.find('\n', pos_);
    const std::size_t stop = (end == std::string_view::npos) ? text_.size() : end;
    std::string_view line = text_.substr(pos_, stop - pos_);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    pos_ = (end == std::string_view::npos) ? text_.size() : end + 1;
    ++line_;
    return line;
  }

  // Skips whitespace-only lines; false at end of input.
  bool skip_blank_lines() {
    while (pos_ < text_.size()) {
      const std::string_view line = peek_line();
      for (char c : line) {
        if (!is_ws(c)) return true;
      }
      const std::size_t end = text_.find('\n', pos_);
      pos_ = (end == std::string_view::npos) ? text_.size() : end + 1;
      ++line_;
    }
    return false;
  }

  // Rest of the current line without consuming it.
  std::string_view peek_line() const {
    if (pos_ >= text_.size()) return {};
    const std::size_t end = text_.find('\n', pos_);
    std::string_view line = text_.substr(pos_, (end == std::string_view::npos) ? text_.size() - pos_ : end - pos_);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
  }

  std::string_view next_token() {
    skip_ws_();
    if (pos_ >= text_.size()) throw error("unexpected end of file");
    const std::size_t start = pos_;
    while (pos_ < text_.size() && !is_ws(text_[pos_])) ++pos_;
    return text_.substr(start, pos_ - start);
  }

  double next_double() {
    const auto tok = next_token();
    double v = 0.0;
    if (!parse_double(tok, v)) throw error("expected a number, got '" + std::string(tok) + "'");
    return v;
  }

  long long next_int() {
    const auto tok = next_token();
    long long v = 0;
    if (!parse_int(tok, v)) throw error("expected an integer, got '" + std::string(tok) + "'");
    return v;
  }

  std::runtime_error error(const std::string& msg) const {
    return std::runtime_error(owner_ + ": " + msg + " (line " + std::to_string(line_ + 1) + ")");
  }

private:
  std::string_view text_;
  std::string owner_;
  std::size_t pos_ = 0;
  std::size_t line_ = 0;

  void skip_ws_() {
    while (pos_ < text_.size() && is_ws(text_[pos_])) {
      if (text_[pos_] == '\n') ++line_;
      ++pos_;
    }
  }
};

} // namespace probegraph
