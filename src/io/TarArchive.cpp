#include "probegraph/io/TarArchive.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace probegraph::io {

namespace {

using Block = std::array<char, TarArchive::kBlockSize>;

constexpr std::size_t kNameOff = 0, kNameLen = 100;
constexpr std::size_t kModeOff = 100;
constexpr std::size_t kUidOff = 108;
constexpr std::size_t kGidOff = 116;
constexpr std::size_t kSizeOff = 124, kSizeLen = 12;
constexpr std::size_t kMtimeOff = 136;
constexpr std::size_t kChksumOff = 148, kChksumLen = 8;
constexpr std::size_t kTypeOff = 156;
constexpr std::size_t kMagicOff = 257;
constexpr std::size_t kVersionOff = 263;
constexpr std::size_t kPrefixOff = 345, kPrefixLen = 155;

[[noreturn]] void die(const std::filesystem::path& p, const std::string& msg) {
  throw std::runtime_error("TarArchive[" + p.string() + "]: " + msg);
}

std::uint64_t padded(std::uint64_t n) {
  const std::uint64_t b = TarArchive::kBlockSize;
  return (n + b - 1) / b * b;
}

std::string field_string(const char* field, std::size_t width) {
  const char* end = static_cast<const char*>(std::memchr(field, '\0', width));
  return std::string(field, end ? static_cast<std::size_t>(end - field) : width);
}

bool is_zero_block(const Block& b) {
  return std::all_of(b.begin(), b.end(), [](char c) { return c == '\0'; });
}

std::uint64_t header_checksum(const Block& b) {
  std::uint64_t sum = 0;
  for (std::size_t i = 0; i < b.size(); ++i) {
    if (i >= kChksumOff && i < kChksumOff + kChksumLen) {
      sum += static_cast<unsigned char>(' ');
    } else {
      sum += static_cast<unsigned char>(b[i]);
    }
  }
  return sum;
}

// "<len> path=<value>\n" records of a pax extended header.
std::string pax_path(std::string_view payload) {
  std::string path;
  while (!payload.empty()) {
    const std::size_t sp = payload.find(' ');
    if (sp == std::string_view::npos) break;
    std::size_t len = 0;
    for (std::size_t i = 0; i < sp; ++i) {
      if (payload[i] < '0' || payload[i] > '9') return path;
      len = len * 10 + static_cast<std::size_t>(payload[i] - '0');
    }
    if (len == 0 || len > payload.size()) break;
    std::string_view rec = payload.substr(sp + 1, len - sp - 1);
    if (!rec.empty() && rec.back() == '\n') rec.remove_suffix(1);
    if (rec.substr(0, 5) == "path=") path = std::string(rec.substr(5));
    payload.remove_prefix(len);
  }
  return path;
}

void put_octal(Block& b, std::size_t off, std::size_t width, std::uint64_t value) {
  // width-1 digits followed by NUL.
  std::string digits(width - 1, '0');
  for (std::size_t i = width - 1; i-- > 0 && value != 0;) {
    digits[i] = static_cast<char>('0' + (value & 7u));
    value >>= 3;
  }
  if (value != 0) throw std::runtime_error("TarArchive: value does not fit a " + std::to_string(width) + "-byte field");
  std::memcpy(b.data() + off, digits.data(), digits.size());
  b[off + width - 1] = '\0';
}

void write_header(util::BinaryWriter& out, const std::string& name, char type, std::uint64_t size) {
  Block b{};
  std::memcpy(b.data() + kNameOff, name.data(), std::min(name.size(), kNameLen));
  put_octal(b, kModeOff, 8, 0644);
  put_octal(b, kUidOff, 8, 0);
  put_octal(b, kGidOff, 8, 0);
  put_octal(b, kSizeOff, kSizeLen, size);
  put_octal(b, kMtimeOff, 12, 0);
  b[kTypeOff] = type;
  std::memcpy(b.data() + kMagicOff, "ustar", 6);
  std::memcpy(b.data() + kVersionOff, "00", 2);

  const std::uint64_t sum = header_checksum(b);
  char chk[8];
  std::snprintf(chk, sizeof(chk), "%06llo", static_cast<unsigned long long>(sum));
  std::memcpy(b.data() + kChksumOff, chk, 6);
  b[kChksumOff + 6] = '\0';
  b[kChksumOff + 7] = ' ';
  out.write_bytes(b.data(), b.size());
}

void write_payload(util::BinaryWriter& out, std::string_view data) {
  out.write_string(data);
  out.write_zeros(static_cast<std::size_t>(padded(data.size()) - data.size()));
}

} // namespace

std::uint64_t parse_tar_number(const char* field, std::size_t width) {
  const auto first = static_cast<unsigned char>(field[0]);
  if (first & 0x80u) {
    std::uint64_t v = first & 0x7fu;
    for (std::size_t i = 1; i < width; ++i) {
      if (v >> 56) throw std::runtime_error("TarArchive: base-256 number overflows 64 bits");
      v = (v << 8) | static_cast<unsigned char>(field[i]);
    }
    return v;
  }
  std::uint64_t v = 0;
  std::size_t i = 0;
  while (i < width && field[i] == ' ') ++i;
  bool any = false;
  for (; i < width; ++i) {
    const char c = field[i];
    if (c == '\0' || c == ' ') break;
    if (c < '0' || c > '7') {
      throw std::runtime_error("TarArchive: invalid octal digit in header field");
    }
    v = (v << 3) | static_cast<std::uint64_t>(c - '0');
    any = true;
  }
  return any ? v : 0;
}

TarArchive::TarArchive(const std::filesystem::path& path) : path_(path) { index_(); }

const TarMember& TarArchive::member(std::size_t i) const {
  if (i >= members_.size()) {
    throw std::out_of_range("TarArchive[" + path_.string() + "]: member " + std::to_string(i) + " out of range (" +
                            std::to_string(members_.size()) + " members)");
  }
  return members_[i];
}

std::string TarArchive::read(const TarMember& m) const {
  std::ifstream ifs(path_, std::ios::binary);
  if (!ifs) die(path_, "failed to open archive");
  util::BinaryReader r(ifs);
  r.seek(m.data_offset);
  try {
    return r.read_string(static_cast<std::size_t>(m.size));
  } catch (const std::runtime_error& e) {
    die(path_, "failed to read member '" + m.name + "': " + e.what());
  }
}

void TarArchive::index_() {
  std::ifstream ifs(path_, std::ios::binary);
  if (!ifs) die(path_, "failed to open archive");
  util::BinaryReader r(ifs);

  std::uint64_t offset = 0;
  std::string pending_name;
  Block h{};
  for (;;) {
    const std::size_t got = r.read_some(h.data(), h.size());
    if (got == 0) break;
    if (got < h.size()) die(path_, "truncated header at offset " + std::to_string(offset));
    if (is_zero_block(h)) break;

    const std::uint64_t stored = parse_tar_number(h.data() + kChksumOff, kChksumLen);
    if (stored != header_checksum(h)) die(path_, "bad header checksum at offset " + std::to_string(offset));

    const std::uint64_t size = parse_tar_number(h.data() + kSizeOff, kSizeLen);
    const char type = h[kTypeOff];
    const std::uint64_t data_offset = offset + kBlockSize;

    if (type == 'L' || type == 'x') {
      const std::string payload = r.read_string(static_cast<std::size_t>(size));
      pending_name = (type == 'L') ? field_string(payload.data(), payload.size()) : pax_path(payload);
    } else if (type == '0' || type == '\0' || type == '7') {
      TarMember m;
      if (!pending_name.empty()) {
        m.name = pending_name;
      } else {
        m.name = field_string(h.data() + kNameOff, kNameLen);
        const std::string prefix = field_string(h.data() + kPrefixOff, kPrefixLen);
        if (std::memcmp(h.data() + kMagicOff, "ustar", 5) == 0 && !prefix.empty()) {
          m.name = prefix + "/" + m.name;
        }
      }
      m.data_offset = data_offset;
      m.size = size;
      members_.push_back(std::move(m));
      pending_name.clear();
    } else if (type != 'g') {
      pending_name.clear();
    }

    offset = data_offset + padded(size);
    r.seek(offset);
  }
}

void write_tar_entry(util::BinaryWriter& out, const std::string& name, const std::string& content) {
  if (name.empty()) throw std::invalid_argument("TarArchive: empty member name");
  if (name.size() > kNameLen) {
    const std::string long_name = name + '\0';
    write_header(out, "././@LongLink", 'L', long_name.size());
    write_payload(out, long_name);
  }
  write_header(out, name, '0', content.size());
  write_payload(out, content);
}

void write_tar_end(util::BinaryWriter& out) { out.write_zeros(2 * TarArchive::kBlockSize); }

} // namespace probegraph::io
