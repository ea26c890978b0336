#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <stdexcept>

namespace probegraph {

using Vec3 = std::array<double,3>;

inline Vec3 vec_add(const Vec3& a, const Vec3& b) { return {a[0] + b[0], a[1] + b[1], a[2] + b[2]}; }
inline Vec3 vec_sub(const Vec3& a, const Vec3& b) { return {a[0] - b[0], a[1] - b[1], a[2] - b[2]}; }
inline Vec3 vec_scale(const Vec3& a, double s) { return {a[0] * s, a[1] * s, a[2] * s}; }
inline double vec_dot(const Vec3& a, const Vec3& b) { return a[0] * b[0] + a[1] * b[1] + a[2] * b[2]; }
inline double vec_norm2(const Vec3& a) { return vec_dot(a, a); }
inline Vec3 vec_cross(const Vec3& a, const Vec3& b) {
  return {a[1] * b[2] - a[2] * b[1],
          a[2] * b[0] - a[0] * b[2],
          a[0] * b[1] - a[1] * b[0]};
}

// Integer lattice translation (number of a, b, c vectors).
using CellShift = std::array<std::int32_t,3>;

inline bool is_zero_shift(const CellShift& s) { return s[0] == 0 && s[1] == 0 && s[2] == 0; }

// Lattice vectors below this length are treated as absent.
inline constexpr double kDegenerateLatticeLength = 1e-4;

// Simulation cell: three lattice vectors stored as rows plus per-axis periodicity.
//
// Cartesian position r = s*a + t*b + u*c for fractional coordinates (s,t,u).
// A zero cell is valid (isolated molecule); fractional conversion then fails.
struct Cell {
  std::array<Vec3,3> vectors{};
  std::array<bool,3> pbc{false, false, false};

  Cell() = default;
  Cell(const std::array<Vec3,3>& v, const std::array<bool,3>& periodic)
      : vectors(v), pbc(periodic) {}

  static Cell orthorhombic(double lx, double ly, double lz, bool periodic) {
    Cell c;
    c.vectors = {Vec3{lx, 0.0, 0.0}, Vec3{0.0, ly, 0.0}, Vec3{0.0, 0.0, lz}};
    c.pbc = {periodic, periodic, periodic};
    return c;
  }

  double length(int axis) const { return std::sqrt(vec_norm2(vectors[axis])); }

  std::array<double,3> lengths() const { return {length(0), length(1), length(2)}; }

  bool any_pbc() const { return pbc[0] || pbc[1] || pbc[2]; }

  // Any lattice vector shorter than kDegenerateLatticeLength.
  bool is_degenerate() const {
    const auto l = lengths();
    return l[0] <= kDegenerateLatticeLength || l[1] <= kDegenerateLatticeLength || l[2] <= kDegenerateLatticeLength;
  }

  double determinant() const { return vec_dot(vectors[0], vec_cross(vectors[1], vectors[2])); }

  double volume() const { return std::abs(determinant()); }

  // Distance between adjacent lattice planes spanned by the two other vectors.
  double plane_spacing(int axis) const {
    const Vec3 n = vec_cross(vectors[(axis + 1) % 3], vectors[(axis + 2) % 3]);
    const double area = std::sqrt(vec_norm2(n));
    if (area == 0.0) throw std::runtime_error("Cell: plane spacing undefined for a flat cell");
    return volume() / area;
  }

  Vec3 to_cartesian(const Vec3& f) const {
    Vec3 r{0.0, 0.0, 0.0};
    for (int a = 0; a < 3; ++a) {
      r[0] += f[a] * vectors[a][0];
      r[1] += f[a] * vectors[a][1];
      r[2] += f[a] * vectors[a][2];
    }
    return r;
  }

  // Inverse of to_cartesian via the reciprocal vectors (Cramer's rule).
  Vec3 to_fractional(const Vec3& r) const {
    const double det = determinant();
    if (std::abs(det) < 1e-12) {
      throw std::runtime_error("Cell: singular cell matrix, fractional coordinates undefined");
    }
    const Vec3 bc = vec_cross(vectors[1], vectors[2]);
    const Vec3 ca = vec_cross(vectors[2], vectors[0]);
    const Vec3 ab = vec_cross(vectors[0], vectors[1]);
    return {vec_dot(r, bc) / det, vec_dot(r, ca) / det, vec_dot(r, ab) / det};
  }

  Vec3 shift_vector(const CellShift& s) const {
    return to_cartesian({static_cast<double>(s[0]), static_cast<double>(s[1]), static_cast<double>(s[2])});
  }
};

} // namespace probegraph
