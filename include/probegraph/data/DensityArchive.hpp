#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "probegraph/data/Dataset.hpp"
#include "probegraph/io/TarArchive.hpp"

namespace probegraph::data {

// Dataset over the members of a tar archive of density files.
//
// Members ending in ".zz" (zlib) or ".lz4" (LZ4 frame) are decompressed
// first. Then names ending in ".cube" are read as Gaussian cube files,
// everything else as VASP CHGCAR. Each at() re-reads and parses the member;
// nothing is cached.
class DensityArchive final : public Dataset {
public:
  explicit DensityArchive(const std::filesystem::path& path);

  std::size_t size() const override { return tar_.size(); }
  SamplePtr at(std::size_t i) const override;

  const std::string& member_name(std::size_t i) const { return tar_.member(i).name; }
  const io::TarArchive& archive() const { return tar_; }

private:
  io::TarArchive tar_;
};

// Reader chosen for a member name, with the codec if any: "cube", "chgcar",
// "cube/zlib", "chgcar/lz4", ...
std::string density_format_name(const std::string& name);

// Parses one density file by its name suffix.
Sample read_density_file(const std::string& name, const std::string& content);

} // namespace probegraph::data
