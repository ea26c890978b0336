#include "probegraph/data/DensityArchive.hpp"
#include "probegraph/io/Compression.hpp"
#include "probegraph/io/DensityReaders.hpp"
#include "probegraph/io/TarArchive.hpp"
#include "probegraph/util/BinaryIO.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "test_utils.hpp"

using namespace probegraph;
using probegraph::testing::near;
using probegraph::testing::throws;

namespace {

// Two atoms on a 2x2x2 grid of 1 Bohr voxels.
std::string cube_text(bool angstrom) {
  std::string s;
  s += "density\n";
  s += "outer loop: a, middle: b, inner: c\n";
  s += "    2    0.500000    0.000000    0.000000\n";
  s += angstrom ? "   -2" : "    2";
  s += "    1.000000    0.000000    0.000000\n";
  s += "    2    0.000000    1.000000    0.000000\n";
  s += "    2    0.000000    0.000000    1.000000\n";
  s += "    1    0.000000    0.000000    0.000000    0.000000\n";
  s += "    8    0.000000    1.000000    0.000000    0.000000\n";
  s += "  1.0 2.0 3.0 4.0 5.0 6.0\n";
  s += "  7.0 8.0\n";
  return s;
}

// 2x1x3 grid; the n-th stored value is n.
std::string chgcar_text(const std::string& scale, const std::string& lattice, const std::string& mode,
                        const std::string& positions) {
  std::string s;
  s += "NaCl test\n";
  s += scale + "\n";
  s += lattice;
  s += "   Na   Cl\n";
  s += "    1    1\n";
  s += mode;
  s += positions;
  s += "\n";
  s += "    2    1    3\n";
  s += " 0.0 1.0 2.0 3.0 4.0\n";
  s += " 5.0\n";
  s += "augmentation occupancies   1   2\n";
  return s;
}

const std::string kCubicLattice = "  4.0 0.0 0.0\n  0.0 4.0 0.0\n  0.0 0.0 4.0\n";
const std::string kUnitLattice = "  1.0 0.0 0.0\n  0.0 1.0 0.0\n  0.0 0.0 1.0\n";

void write_archive(const std::filesystem::path& path, const std::vector<std::pair<std::string, std::string>>& entries) {
  std::ofstream ofs(path, std::ios::binary);
  util::BinaryWriter w(ofs);
  for (const auto& [name, content] : entries) io::write_tar_entry(w, name, content);
  io::write_tar_end(w);
}

} // namespace

// ============================================================================
// Cube
// ============================================================================

bool test_cube_bohr_units() {
  TEST_START("Cube lengths and values are converted from atomic units");

  const io::DensityRecord rec = io::read_cube(cube_text(false), "water.cube");
  const double b = io::kBohr;
  if (rec.structure.size() != 2) TEST_FAIL("expected 2 atoms");
  if (rec.structure.numbers[1] != 8) TEST_FAIL("wrong atomic number");
  if (!near(rec.structure.positions[1][0], b, 1e-12)) TEST_FAIL("atom position not in Å");
  if (!near(rec.field.origin[0], 0.5 * b, 1e-12)) TEST_FAIL("origin not in Å");
  if (!near(rec.structure.cell.vectors[0][0], 2.0 * b, 1e-12)) TEST_FAIL("cell does not span the grid");
  if (rec.structure.cell.any_pbc()) TEST_FAIL("cube structure should be non-periodic");
  // Values are stored c fastest, matching row-major order.
  if (!near(rec.field.at(0, 1, 1), 4.0 / (b * b * b), 1e-9)) TEST_FAIL("value not in e/Å³");

  TEST_PASS();
  return true;
}

bool test_cube_angstrom_and_errors() {
  TEST_START("Negative grid count keeps Å; malformed cubes throw");

  const io::DensityRecord rec = io::read_cube(cube_text(true));
  if (!near(rec.structure.positions[1][0], 1.0, 1e-12)) TEST_FAIL("Å position was rescaled");
  if (rec.field.shape != GridShape{2, 2, 2}) TEST_FAIL("wrong grid shape");

  std::string truncated = cube_text(false);
  truncated.resize(truncated.size() - 5);
  if (!throws<std::runtime_error>([&] { (void)io::read_cube(truncated, "short.cube"); })) {
    TEST_FAIL("truncated values accepted");
  }

  TEST_PASS();
  return true;
}

// ============================================================================
// CHGCAR
// ============================================================================

bool test_chgcar_layout() {
  TEST_START("CHGCAR values are reordered and divided by the volume");

  const io::DensityRecord rec =
      io::read_chgcar(chgcar_text("1.0", kCubicLattice, "Direct\n", " 0.0 0.0 0.0\n 0.5 0.5 0.5\n"));
  if (rec.structure.numbers != std::vector<int>{11, 17}) TEST_FAIL("wrong species");
  if (!near(rec.structure.positions[1][2], 2.0, 1e-12)) TEST_FAIL("direct coordinates not converted");
  if (!rec.structure.cell.any_pbc()) TEST_FAIL("CHGCAR structure should be periodic");
  if (rec.field.shape != GridShape{2, 1, 3}) TEST_FAIL("wrong grid shape");

  // Stored index n = i + nx*(j + ny*k).
  for (std::size_t i = 0; i < 2; ++i) {
    for (std::size_t k = 0; k < 3; ++k) {
      const double expect = static_cast<double>(i + 2 * k) / 64.0;
      if (!near(rec.field.at(i, 0, k), expect, 1e-12)) {
        TEST_FAIL("value at (" + std::to_string(i) + ",0," + std::to_string(k) + ")");
      }
    }
  }

  TEST_PASS();
  return true;
}

bool test_chgcar_volume_scale_and_cartesian() {
  TEST_START("Negative scale, selective dynamics and Cartesian mode");

  const io::DensityRecord rec = io::read_chgcar(chgcar_text(
      "-64.0", kUnitLattice, "Selective dynamics\nCartesian\n", " 0.0 0.0 0.0 T T T\n 0.5 0.5 0.5 F F F\n"));
  if (!near(rec.structure.cell.volume(), 64.0, 1e-9)) TEST_FAIL("target volume not honoured");
  if (!near(rec.structure.positions[1][0], 2.0, 1e-12)) TEST_FAIL("Cartesian positions not scaled");
  if (!near(rec.field.at(1, 0, 2), 5.0 / 64.0, 1e-12)) TEST_FAIL("values not divided by the scaled volume");

  TEST_PASS();
  return true;
}

bool test_chgcar_errors() {
  TEST_START("VASP 4 headers and unknown species are rejected");

  std::string vasp4 = chgcar_text("1.0", kCubicLattice, "Direct\n", " 0.0 0.0 0.0\n 0.5 0.5 0.5\n");
  vasp4.erase(vasp4.find("   Na   Cl\n"), 11);
  if (!throws<std::runtime_error>([&] { (void)io::read_chgcar(vasp4); })) TEST_FAIL("VASP 4 header accepted");

  std::string unknown = chgcar_text("1.0", kCubicLattice, "Direct\n", " 0.0 0.0 0.0\n 0.5 0.5 0.5\n");
  unknown.replace(unknown.find("   Cl\n"), 5, "   Qq");
  if (!throws<std::runtime_error>([&] { (void)io::read_chgcar(unknown); })) TEST_FAIL("unknown element accepted");

  if (io::atomic_number("Fe_pv") != 26 || io::atomic_number("O") != 8) TEST_FAIL("symbol lookup");

  TEST_PASS();
  return true;
}

bool test_chgcar_last_image() {
  TEST_START("Multi-image CHG keeps the last image; magnetization is skipped");

  std::string first = chgcar_text("1.0", kCubicLattice, "Direct\n", " 0.0 0.0 0.0\n 0.5 0.5 0.5\n");
  first.erase(first.find("augmentation"));
  std::string second = chgcar_text("-64.0", kUnitLattice, "Cartesian\n", " 0.0 0.0 0.0\n 1.0 1.0 1.0\n");
  second.replace(second.find(" 5.0\n"), 5, " 50.0\n");

  const io::DensityRecord last = io::read_chgcar(first + second, "CHG");
  if (!near(last.structure.positions[1][0], 1.0, 1e-12)) TEST_FAIL("structure of the first image kept");
  if (!near(last.field.at(1, 0, 2), 50.0 / 64.0, 1e-12)) TEST_FAIL("density of the first image kept");

  const std::string spin = first + "    2    1    3\n 9.0 9.0 9.0 9.0 9.0 9.0\n";
  const io::DensityRecord total = io::read_chgcar(spin, "CHG");
  if (!near(total.field.at(1, 0, 2), 5.0 / 64.0, 1e-12)) TEST_FAIL("magnetization replaced the total density");

  const std::string cut = first + second.substr(0, second.find("    2    1    3"));
  if (!throws<std::runtime_error>([&] { (void)io::read_chgcar(cut, "CHG"); })) TEST_FAIL("truncated image accepted");

  TEST_PASS();
  return true;
}

// ============================================================================
// Compression
// ============================================================================

bool test_zlib_codec() {
  TEST_START("zlib members decompress; damaged streams throw");

  const std::string chg = chgcar_text("1.0", kCubicLattice, "Direct\n", " 0.0 0.0 0.0\n 0.5 0.5 0.5\n");
  const std::string packed = io::compress(io::Codec::Zlib, chg);
  if (packed == chg) TEST_FAIL("payload not compressed");
  if (io::decompress(io::Codec::Zlib, packed, "CHGCAR.zz") != chg) TEST_FAIL("payload changed");
  if (!throws<std::runtime_error>([&] {
        (void)io::decompress(io::Codec::Zlib, packed.substr(0, packed.size() / 2), "CHGCAR.zz");
      })) {
    TEST_FAIL("truncated stream accepted");
  }
  if (!throws<std::runtime_error>([&] { (void)io::decompress(io::Codec::Zlib, "not zlib", "x.zz"); })) {
    TEST_FAIL("garbage accepted");
  }

  if (io::codec_for_name("a/CHGCAR.lz4") != io::Codec::Lz4 || io::codec_for_name("a.cube") != io::Codec::None) {
    TEST_FAIL("codec by suffix");
  }
  if (io::strip_codec_suffix("a/b.cube.zz") != "a/b.cube") TEST_FAIL("suffix not stripped");

  TEST_PASS();
  return true;
}

bool test_compressed_archive_members() {
  TEST_START("Compressed members are read like plain ones");

  testing::TempDir dir("packed");
  const auto path = dir.path() / "packed.tar";
  const std::string chg = chgcar_text("1.0", kCubicLattice, "Direct\n", " 0.0 0.0 0.0\n 0.5 0.5 0.5\n");
  const bool have_lz4 = io::codec_available(io::Codec::Lz4);
  write_archive(path, {{"mol/water.cube.zz", io::compress(io::Codec::Zlib, cube_text(false))},
                       {"bulk/CHGCAR.zz", io::compress(io::Codec::Zlib, chg)},
                       {"mol/water.cube.lz4", have_lz4 ? io::compress(io::Codec::Lz4, cube_text(false)) : "x"}});

  const data::DensityArchive ds(path);
  const Sample plain_cube = data::read_density_file("mol/water.cube", cube_text(false));
  const Sample plain_chg = data::read_density_file("bulk/CHGCAR", chg);

  const auto cube = ds.at(0);
  if (cube->structure.cell.any_pbc()) TEST_FAIL(".cube.zz not read as a cube");
  if (cube->field.values != plain_cube.field.values) TEST_FAIL("cube values differ after zlib");
  if (cube->metadata.source_name != "mol/water.cube.zz") TEST_FAIL("member name not kept");
  const auto bulk = ds.at(1);
  if (bulk->field.values != plain_chg.field.values) TEST_FAIL("CHGCAR values differ after zlib");
  if (data::density_format_name(ds.member_name(0)) != "cube/zlib") TEST_FAIL("wrong reader name");

  if (have_lz4) {
    const auto lz = ds.at(2);
    if (lz->field.values != plain_cube.field.values) TEST_FAIL("cube values differ after lz4");
    if (!throws<std::runtime_error>([] { (void)io::decompress(io::Codec::Lz4, "bad frame", "x.lz4"); })) {
      TEST_FAIL("bad lz4 frame accepted");
    }
  } else if (!throws<std::runtime_error>([&] { (void)ds.at(2); })) {
    TEST_FAIL("lz4 member accepted without liblz4");
  }

  TEST_PASS();
  return true;
}

// ============================================================================
// Tar archives
// ============================================================================

bool test_tar_number_fields() {
  TEST_START("Octal and base-256 size fields");

  const char octal[12] = {'0', '0', '0', '0', '0', '0', '0', '0', '0', '1', '2', '\0'};
  if (io::parse_tar_number(octal, 12) != 10) TEST_FAIL("octal");
  const char padded[8] = {' ', ' ', '7', '7', ' ', '\0', '\0', '\0'};
  if (io::parse_tar_number(padded, 8) != 63) TEST_FAIL("space padded octal");
  const char binary[12] = {'\x80', 0, 0, 0, 0, 0, 0, 0, 0, 0, '\x01', '\x00'};
  if (io::parse_tar_number(binary, 12) != 256) TEST_FAIL("base-256");
  const char bad[8] = {'0', '9', '\0', 0, 0, 0, 0, 0};
  if (!throws<std::runtime_error>([&] { (void)io::parse_tar_number(bad, 8); })) TEST_FAIL("bad digit accepted");

  TEST_PASS();
  return true;
}

bool test_tar_round_trip() {
  TEST_START("Archive members are indexed and read back");

  testing::TempDir dir("tar");
  const std::string long_name = std::string(120, 'd') + "/CHGCAR";
  const std::string chg = chgcar_text("1.0", kCubicLattice, "Direct\n", " 0.0 0.0 0.0\n 0.5 0.5 0.5\n");
  const auto path = dir.path() / "densities.tar";
  write_archive(path, {{"water.cube", cube_text(false)}, {long_name, chg}, {"empty.txt", ""}});

  const io::TarArchive tar(path);
  if (tar.size() != 3) TEST_FAIL("expected 3 members, got " + std::to_string(tar.size()));
  if (tar.member(1).name != long_name) TEST_FAIL("long name lost");
  if (tar.read(1) != chg) TEST_FAIL("payload differs");
  if (tar.member(2).size != 0 || !tar.read(2).empty()) TEST_FAIL("empty member");
  if (!throws<std::out_of_range>([&] { (void)tar.member(3); })) TEST_FAIL("out of range member accepted");

  TEST_PASS();
  return true;
}

bool test_tar_corruption() {
  TEST_START("Corrupt headers are rejected");

  testing::TempDir dir("tarbad");
  const auto path = dir.path() / "bad.tar";
  write_archive(path, {{"a.cube", cube_text(false)}});
  {
    std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
    f.seekp(10);
    f.put('#');
  }
  if (!throws<std::runtime_error>([&] { io::TarArchive tar(path); })) TEST_FAIL("bad checksum accepted");
  if (!throws<std::runtime_error>([&] { io::TarArchive tar(dir.path() / "missing.tar"); })) {
    TEST_FAIL("missing file accepted");
  }

  TEST_PASS();
  return true;
}

bool test_density_archive() {
  TEST_START("DensityArchive dispatches on the member name");

  testing::TempDir dir("archive");
  const auto path = dir.path() / "set.tar";
  const std::string chg = chgcar_text("1.0", kCubicLattice, "Direct\n", " 0.0 0.0 0.0\n 0.5 0.5 0.5\n");
  write_archive(path, {{"mol/water.cube", cube_text(false)}, {"bulk/CHGCAR", chg}, {"bulk/CHGCAR.zz", "x"}});

  const data::DensityArchive ds(path);
  if (ds.size() != 3) TEST_FAIL("wrong size");
  if (ds.member_name(1) != "bulk/CHGCAR") TEST_FAIL("wrong member name");
  if (data::density_format_name(ds.member_name(0)) != "cube" ||
      data::density_format_name(ds.member_name(1)) != "chgcar" ||
      data::density_format_name(ds.member_name(2)) != "chgcar/zlib") {
    TEST_FAIL("wrong reader names");
  }

  const auto cube = ds.at(0);
  if (cube->structure.cell.any_pbc() || cube->grid_positions.size() != 8) TEST_FAIL("cube member misread");
  const auto bulk = ds.at(1);
  if (!bulk->structure.cell.any_pbc() || bulk->metadata.source_name != "bulk/CHGCAR") TEST_FAIL("CHGCAR misread");
  if (!near(bulk->grid_positions.at_flat(1)[2], 4.0 / 3.0, 1e-12)) TEST_FAIL("grid positions");
  if (!throws<std::runtime_error>([&] { (void)ds.at(2); })) TEST_FAIL("corrupt zlib member accepted");
  if (!throws<std::out_of_range>([&] { (void)ds.at(3); })) TEST_FAIL("out of range accepted");

  TEST_PASS();
  return true;
}

int main() {
  std::cout << "\n";
  std::cout << "=========================================\n";
  std::cout << "  Reader / Archive Unit Tests\n";
  std::cout << "=========================================\n\n";

  bool all_passed = true;

  std::cout << "Category 1: Cube\n";
  std::cout << "-------------------------------------\n";
  all_passed &= test_cube_bohr_units();
  all_passed &= test_cube_angstrom_and_errors();
  std::cout << "\n";

  std::cout << "Category 2: CHGCAR\n";
  std::cout << "-------------------------------------\n";
  all_passed &= test_chgcar_layout();
  all_passed &= test_chgcar_volume_scale_and_cartesian();
  all_passed &= test_chgcar_errors();
  all_passed &= test_chgcar_last_image();
  std::cout << "\n";

  std::cout << "Category 3: Compression\n";
  std::cout << "-------------------------------------\n";
  all_passed &= test_zlib_codec();
  all_passed &= test_compressed_archive_members();
  std::cout << "\n";

  std::cout << "Category 4: Tar archives\n";
  std::cout << "-------------------------------------\n";
  all_passed &= test_tar_number_fields();
  all_passed &= test_tar_round_trip();
  all_passed &= test_tar_corruption();
  all_passed &= test_density_archive();
  std::cout << "\n";

  std::cout << (all_passed ? "All tests passed.\n" : "Some tests FAILED.\n");
  return all_passed ? 0 : 1;
}
