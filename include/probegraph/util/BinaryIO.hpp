#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace probegraph::util {

// Fixed-size record I/O on top of a stream. Used for tar headers and member
// payloads; every failure throws.
class BinaryReader {
public:
  explicit BinaryReader(std::istream& is) : is_(is) {
    if (!is_) throw std::runtime_error("BinaryReader: stream is not readable");
  }

  void read_bytes(void* data, std::size_t n) {
    is_.read(static_cast<char*>(data), static_cast<std::streamsize>(n));
    if (!is_) throw std::runtime_error("BinaryReader: read failed (truncated/corrupt file?)");
  }

  // Reads up to n bytes; returns how many were available (0 at a clean EOF).
  std::size_t read_some(void* data, std::size_t n) {
    is_.read(static_cast<char*>(data), static_cast<std::streamsize>(n));
    const auto got = static_cast<std::size_t>(is_.gcount());
    if (is_.bad()) throw std::runtime_error("BinaryReader: stream error");
    is_.clear();
    return got;
  }

  std::string read_string(std::size_t n) {
    std::string s;
    s.resize(n);
    if (n > 0) read_bytes(s.data(), n);
    return s;
  }

  void seek(std::uint64_t offset) {
    is_.clear();
    is_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!is_) throw std::runtime_error("BinaryReader: seek to " + std::to_string(offset) + " failed");
  }

  void skip(std::uint64_t n) {
    is_.seekg(static_cast<std::streamoff>(n), std::ios::cur);
    if (!is_) throw std::runtime_error("BinaryReader: skip of " + std::to_string(n) + " bytes failed");
  }

  std::uint64_t tell() {
    const auto pos = is_.tellg();
    if (pos < 0) throw std::runtime_error("BinaryReader: tell failed");
    return static_cast<std::uint64_t>(pos);
  }

private:
  std::istream& is_;
};

class BinaryWriter {
public:
  explicit BinaryWriter(std::ostream& os) : os_(os) {
    if (!os_) throw std::runtime_error("BinaryWriter: stream is not writable");
  }

  void write_bytes(const void* data, std::size_t n) {
    os_.write(static_cast<const char*>(data), static_cast<std::streamsize>(n));
    if (!os_) throw std::runtime_error("BinaryWriter: write failed");
  }

  void write_string(std::string_view s) {
    if (!s.empty()) write_bytes(s.data(), s.size());
  }

  void write_zeros(std::size_t n) {
    const std::vector<char> zeros(n, '\0');
    if (n > 0) write_bytes(zeros.data(), n);
  }

private:
  std::ostream& os_;
};

} // namespace probegraph::util
