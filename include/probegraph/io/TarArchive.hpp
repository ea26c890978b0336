#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "probegraph/util/BinaryIO.hpp"

namespace probegraph::io {

struct TarMember {
  std::string name;
  std::uint64_t data_offset = 0; // byte offset of the payload in the archive
  std::uint64_t size = 0;
};

// Read-only index of an uncompressed tar archive (ustar, GNU long names,
// pax path records). Only regular files are listed, in archive order.
//
// The archive is scanned once at construction; read() opens its own stream
// so concurrent reads from several threads are fine.
class TarArchive {
public:
  static constexpr std::size_t kBlockSize = 512;

  explicit TarArchive(const std::filesystem::path& path);

  const std::filesystem::path& path() const { return path_; }
  std::size_t size() const { return members_.size(); }
  const std::vector<TarMember>& members() const { return members_; }
  const TarMember& member(std::size_t i) const;

  std::string read(const TarMember& m) const;
  std::string read(std::size_t i) const { return read(member(i)); }

private:
  std::filesystem::path path_;
  std::vector<TarMember> members_;

  void index_();
};

// Parses a numeric header field: NUL/space-terminated octal, or GNU base-256
// when the high bit of the first byte is set.
std::uint64_t parse_tar_number(const char* field, std::size_t width);

// Writes one regular-file entry (header + padded payload) in ustar format.
// Names longer than 100 bytes get a preceding GNU 'L' record.
void write_tar_entry(util::BinaryWriter& out, const std::string& name, const std::string& content);

// Two zero blocks.
void write_tar_end(util::BinaryWriter& out);

} // namespace probegraph::io
