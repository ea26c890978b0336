#include "probegraph/io/DensityReaders.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

#include "probegraph/util/Parse.hpp"

namespace probegraph::io {

namespace {

constexpr std::array<std::string_view, 119> kElementSymbols = {
    "X",
    "H",  "He", "Li", "Be", "B",  "C",  "N",  "O",  "F",  "Ne", "Na", "Mg", "Al", "Si", "P",  "S",  "Cl", "Ar",
    "K",  "Ca", "Sc", "Ti", "V",  "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn", "Ga", "Ge", "As", "Se", "Br", "Kr",
    "Rb", "Sr", "Y",  "Zr", "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag", "Cd", "In", "Sn", "Sb", "Te", "I",  "Xe",
    "Cs", "Ba", "La", "Ce", "Pr", "Nd", "Pm", "Sm", "Eu", "Gd", "Tb", "Dy", "Ho", "Er", "Tm", "Yb", "Lu", "Hf",
    "Ta", "W",  "Re", "Os", "Ir", "Pt", "Au", "Hg", "Tl", "Pb", "Bi", "Po", "At", "Rn", "Fr", "Ra", "Ac", "Th",
    "Pa", "U",  "Np", "Pu", "Am", "Cm", "Bk", "Cf", "Es", "Fm", "Md", "No", "Lr", "Rf", "Db", "Sg", "Bh", "Hs",
    "Mt", "Ds", "Rg", "Cn", "Nh", "Fl", "Mc", "Lv", "Ts", "Og"};

std::vector<std::string_view> tokens_of(std::string_view line) {
  std::vector<std::string_view> toks;
  split_ws(line, toks);
  return toks;
}

double token_double(const TextCursor& cur, std::string_view tok) {
  double v = 0.0;
  if (!parse_double(tok, v)) throw cur.error("expected a number, got '" + std::string(tok) + "'");
  return v;
}

long long token_int(const TextCursor& cur, std::string_view tok) {
  long long v = 0;
  if (!parse_int(tok, v)) throw cur.error("expected an integer, got '" + std::string(tok) + "'");
  return v;
}

Vec3 read_vec3_line(TextCursor& cur) {
  const auto toks = tokens_of(cur.read_line());
  if (toks.size() < 3) throw cur.error("expected three numbers");
  return {token_double(cur, toks[0]), token_double(cur, toks[1]), token_double(cur, toks[2])};
}

std::size_t grid_dim(const TextCursor& cur, long long n) {
  if (n == 0) throw cur.error("grid dimension must be non-zero");
  return static_cast<std::size_t>(n < 0 ? -n : n);
}

} // namespace

int atomic_number(std::string_view symbol) {
  const std::size_t cut = symbol.find_first_of("_/.");
  if (cut != std::string_view::npos) symbol = symbol.substr(0, cut);
  for (std::size_t z = 1; z < kElementSymbols.size(); ++z) {
    if (kElementSymbols[z] == symbol) return static_cast<int>(z);
  }
  throw std::runtime_error("unknown element symbol '" + std::string(symbol) + "'");
}

DensityRecord read_cube(std::string_view text, const std::string& source) {
  TextCursor cur(text, "CubeReader[" + source + "]");
  (void)cur.read_line(); // two comment lines
  (void)cur.read_line();

  const auto head = tokens_of(cur.read_line());
  if (head.size() < 4) throw cur.error("expected natoms and origin");
  long long natoms = token_int(cur, head[0]);
  if (head.size() >= 5 && token_int(cur, head[4]) != 1) {
    throw cur.error("multi-valued cube files are not supported");
  }

  std::array<long long, 3> n{};
  std::array<Vec3, 3> voxel{};
  for (int a = 0; a < 3; ++a) {
    const auto toks = tokens_of(cur.read_line());
    if (toks.size() < 4) throw cur.error("expected grid count and voxel vector");
    n[a] = token_int(cur, toks[0]);
    voxel[a] = {token_double(cur, toks[1]), token_double(cur, toks[2]), token_double(cur, toks[3])};
  }
  // A negative first count marks lengths already in Å.
  const double unit = n[0] < 0 ? 1.0 : kBohr;
  const GridShape shape{grid_dim(cur, n[0]), grid_dim(cur, n[1]), grid_dim(cur, n[2])};

  const bool has_dset_ids = natoms < 0;
  if (has_dset_ids) natoms = -natoms;

  DensityRecord rec;
  rec.structure.numbers.reserve(static_cast<std::size_t>(natoms));
  rec.structure.positions.reserve(static_cast<std::size_t>(natoms));
  for (long long i = 0; i < natoms; ++i) {
    const auto toks = tokens_of(cur.read_line());
    if (toks.size() < 5) throw cur.error("expected Z, charge and position of atom " + std::to_string(i));
    rec.structure.numbers.push_back(static_cast<int>(token_int(cur, toks[0])));
    rec.structure.positions.push_back(
        {token_double(cur, toks[2]) * unit, token_double(cur, toks[3]) * unit, token_double(cur, toks[4]) * unit});
  }
  if (has_dset_ids) (void)cur.read_line();

  Cell cell;
  for (int a = 0; a < 3; ++a) {
    cell.vectors[a] = vec_scale(voxel[a], static_cast<double>(shape[a]) * unit);
  }
  cell.pbc = {false, false, false};
  rec.structure.cell = cell;

  const double to_per_a3 = 1.0 / (kBohr * kBohr * kBohr);
  ScalarField& f = rec.field;
  f.shape = shape;
  f.origin = {token_double(cur, head[1]) * unit, token_double(cur, head[2]) * unit, token_double(cur, head[3]) * unit};
  f.cell = cell;
  f.values.resize(grid_point_count(shape));
  for (auto& v : f.values) v = cur.next_double() * to_per_a3;

  rec.structure.validate();
  f.validate();
  return rec;
}

namespace {

// One POSCAR header, grid line and total density block.
DensityRecord read_chgcar_image(TextCursor& cur) {
  (void)cur.read_line(); // title

  const auto scale_toks = tokens_of(cur.read_line());
  if (scale_toks.empty()) throw cur.error("missing scale factor");
  const double scale = token_double(cur, scale_toks[0]);
  if (scale == 0.0) throw cur.error("scale factor must be non-zero");

  Cell cell;
  for (int a = 0; a < 3; ++a) cell.vectors[a] = read_vec3_line(cur);
  double factor = scale;
  if (scale < 0.0) {
    // Negative scale is the target volume.
    const double v0 = cell.volume();
    if (v0 <= 0.0) throw cur.error("degenerate lattice");
    factor = std::cbrt(-scale / v0);
  }
  for (auto& v : cell.vectors) v = vec_scale(v, factor);
  cell.pbc = {true, true, true};

  const auto species = tokens_of(cur.read_line());
  if (species.empty()) throw cur.error("missing species line");
  long long first_count = 0;
  if (parse_int(species[0], first_count)) {
    throw cur.error("species names are missing (VASP 4 format is not supported)");
  }
  const auto counts = tokens_of(cur.read_line());
  if (counts.size() != species.size()) throw cur.error("species and count lines differ in length");

  DensityRecord rec;
  AtomicStructure& s = rec.structure;
  for (std::size_t k = 0; k < species.size(); ++k) {
    const long long c = token_int(cur, counts[k]);
    if (c < 0) throw cur.error("negative atom count");
    int z = 0;
    try {
      z = atomic_number(species[k]);
    } catch (const std::runtime_error& e) {
      throw cur.error(e.what());
    }
    s.numbers.insert(s.numbers.end(), static_cast<std::size_t>(c), z);
  }

  auto mode = cur.read_line();
  while (!mode.empty() && is_ws(mode.front())) mode.remove_prefix(1);
  if (!mode.empty() && (mode.front() == 'S' || mode.front() == 's')) {
    mode = cur.read_line();
    while (!mode.empty() && is_ws(mode.front())) mode.remove_prefix(1);
  }
  if (mode.empty()) throw cur.error("missing coordinate mode line");
  const bool cartesian = mode.front() == 'C' || mode.front() == 'c' || mode.front() == 'K' || mode.front() == 'k';

  s.positions.reserve(s.numbers.size());
  for (std::size_t i = 0; i < s.numbers.size(); ++i) {
    const Vec3 p = read_vec3_line(cur);
    s.positions.push_back(cartesian ? vec_scale(p, factor) : cell.to_cartesian(p));
  }
  s.cell = cell;

  GridShape shape{};
  for (auto& d : shape) {
    const long long v = cur.next_int();
    if (v <= 0) throw cur.error("grid dimensions must be positive");
    d = static_cast<std::size_t>(v);
  }

  const double volume = cell.volume();
  if (volume <= 0.0) throw cur.error("cell volume must be positive");

  ScalarField& f = rec.field;
  f.shape = shape;
  f.origin = {0.0, 0.0, 0.0};
  f.cell = cell;
  f.values.resize(grid_point_count(shape));
  // Stored x fastest (Fortran order).
  for (std::size_t k = 0; k < shape[2]; ++k) {
    for (std::size_t j = 0; j < shape[1]; ++j) {
      for (std::size_t i = 0; i < shape[0]; ++i) {
        f.values[ravel_grid_index(shape, i, j, k)] = cur.next_double() / volume;
      }
    }
  }

  s.validate();
  f.validate();
  return rec;
}

bool is_grid_line(std::string_view line, const GridShape& shape) {
  const auto toks = tokens_of(line);
  if (toks.size() != 3) return false;
  for (std::size_t d = 0; d < 3; ++d) {
    std::size_t v = 0;
    if (!parse_int(toks[d], v) || v != shape[d]) return false;
  }
  return true;
}

} // namespace

DensityRecord read_chgcar(std::string_view text, const std::string& source) {
  TextCursor cur(text, "ChgcarReader[" + source + "]");
  DensityRecord rec = read_chgcar_image(cur);

  // Later images replace earlier ones. Augmentation data closes the file; a
  // repeated grid line opens a magnetization block, which is skipped.
  while (cur.skip_blank_lines()) {
    const std::string_view line = cur.peek_line();
    if (line.find("augmentation") != std::string_view::npos) break;
    if (is_grid_line(line, rec.field.shape)) {
      (void)cur.read_line();
      for (std::size_t n = 0; n < rec.field.size(); ++n) (void)cur.next_double();
      continue;
    }
    rec = read_chgcar_image(cur);
  }
  return rec;
}

} // namespace probegraph::io
