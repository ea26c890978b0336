#pragma once

#include <array>
#include <cmath>
#include <stdexcept>

#include "probegraph/core/Cell.hpp"

namespace probegraph::neighbor {

// Periodic search frame shared by the neighbor indexes.
//
// Axes that are flagged periodic and have a usable lattice vector keep it.
// Every other axis is replaced by a unit vector orthogonal to the periodic
// ones, which keeps the basis invertible for slabs, wires and molecules.
// Points are wrapped into [0,1) along periodic axes only, and `images` is the
// number of lattice translations per axis a pair search has to cover.
struct PeriodicFrame {
  std::array<bool,3> periodic{false, false, false};
  Cell basis;
  CellShift images{0, 0, 0};

  PeriodicFrame() = default;

  PeriodicFrame(const Cell& cell, double cutoff) {
    const auto len = cell.lengths();
    int n_periodic = 0;
    for (int a = 0; a < 3; ++a) {
      periodic[a] = cell.pbc[a] && len[a] > kDegenerateLatticeLength;
      if (periodic[a]) ++n_periodic;
    }
    basis.pbc = periodic;
    for (int a = 0; a < 3; ++a) basis.vectors[a] = periodic[a] ? cell.vectors[a] : Vec3{0.0, 0.0, 0.0};
    if (n_periodic == 0) {
      basis.vectors = {Vec3{1.0, 0.0, 0.0}, Vec3{0.0, 1.0, 0.0}, Vec3{0.0, 0.0, 1.0}};
      return;
    }

    complete_basis_(n_periodic);
    if (basis.volume() < 1e-12) {
      throw std::runtime_error("PeriodicFrame: periodic lattice vectors are linearly dependent");
    }

    for (int a = 0; a < 3; ++a) {
      if (!periodic[a]) continue;
      images[a] = static_cast<std::int32_t>(std::ceil(cutoff / basis.plane_spacing(a)));
    }
  }

  bool any_periodic() const { return periodic[0] || periodic[1] || periodic[2]; }

  // Wraps periodic components into [0,1); other components are left alone.
  Vec3 wrap(const Vec3& r) const {
    if (!any_periodic()) return r;
    Vec3 f = basis.to_fractional(r);
    for (int a = 0; a < 3; ++a) {
      if (!periodic[a]) continue;
      f[a] -= std::floor(f[a]);
      if (f[a] >= 1.0) f[a] = 0.0;
    }
    return basis.to_cartesian(f);
  }

  // Fractional coordinate of r along axis a of the search basis.
  double fractional(const Vec3& r, int a) const { return basis.to_fractional(r)[a]; }

  Vec3 shift_vector(const CellShift& s) const { return basis.shift_vector(s); }

private:
  static Vec3 normalized_(const Vec3& v) {
    const double n = std::sqrt(vec_norm2(v));
    return vec_scale(v, 1.0 / n);
  }

  void complete_basis_(int n_periodic) {
    if (n_periodic == 3) return;
    if (n_periodic == 2) {
      int p0 = -1, p1 = -1, free_axis = -1;
      for (int a = 0; a < 3; ++a) {
        if (periodic[a]) (p0 < 0 ? p0 : p1) = a;
        else free_axis = a;
      }
      basis.vectors[free_axis] = normalized_(vec_cross(basis.vectors[p0], basis.vectors[p1]));
      if (basis.determinant() < 0.0) basis.vectors[free_axis] = vec_scale(basis.vectors[free_axis], -1.0);
      return;
    }
    int p = 0;
    while (!periodic[p]) ++p;
    const Vec3 u = normalized_(basis.vectors[p]);
    // Helper axis least aligned with u.
    Vec3 e{0.0, 0.0, 0.0};
    int k = 0;
    for (int a = 1; a < 3; ++a) {
      if (std::abs(u[a]) < std::abs(u[k])) k = a;
    }
    e[k] = 1.0;
    const Vec3 v = normalized_(vec_cross(u, e));
    const Vec3 w = normalized_(vec_cross(u, v));
    const int q0 = (p + 1) % 3;
    const int q1 = (p + 2) % 3;
    basis.vectors[q0] = v;
    basis.vectors[q1] = w;
  }
};

} // namespace probegraph::neighbor
