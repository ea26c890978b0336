#include "probegraph/data/DensityArchive.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "probegraph/io/Compression.hpp"
#include "probegraph/io/DensityReaders.hpp"

namespace probegraph::data {

namespace {

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

DensityArchive::DensityArchive(const std::filesystem::path& path) : tar_(path) {
  std::cerr << "[probegraph] indexed " << tar_.size() << " members in " << path.string() << "\n";
}

SamplePtr DensityArchive::at(std::size_t i) const {
  check_index_(i, "DensityArchive");
  const io::TarMember& m = tar_.member(i);
  return std::make_shared<const Sample>(read_density_file(m.name, tar_.read(m)));
}

std::string density_format_name(const std::string& name) {
  const io::Codec codec = io::codec_for_name(name);
  std::string format = ends_with(io::strip_codec_suffix(name), ".cube") ? "cube" : "chgcar";
  if (codec != io::Codec::None) format += std::string("/") + io::codec_name(codec);
  return format;
}

Sample read_density_file(const std::string& name, const std::string& content) {
  const io::Codec codec = io::codec_for_name(name);
  const std::string plain = (codec == io::Codec::None) ? std::string() : io::decompress(codec, content, name);
  const std::string_view text = (codec == io::Codec::None) ? std::string_view(content) : std::string_view(plain);
  io::DensityRecord rec = ends_with(io::strip_codec_suffix(name), ".cube") ? io::read_cube(text, name)
                                                                           : io::read_chgcar(text, name);
  return make_sample(std::move(rec.field), std::move(rec.structure), name);
}

} // namespace probegraph::data
