#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "probegraph/core/Cell.hpp"

namespace probegraph {

using GridShape = std::array<std::size_t,3>;

inline std::size_t grid_point_count(const GridShape& s) { return s[0] * s[1] * s[2]; }

// Row-major (C order) flattening: k varies fastest.
inline std::size_t ravel_grid_index(const GridShape& s, std::size_t i, std::size_t j, std::size_t k) {
  return (i * s[1] + j) * s[2] + k;
}

// Volumetric scalar samples on a regular grid spanning the cell.
//
// Grid point (i,j,k) sits at origin + (i/nx)*a + (j/ny)*b + (k/nz)*c.
struct ScalarField {
  GridShape shape{0, 0, 0};
  std::vector<double> values;   // row-major, size nx*ny*nz
  Vec3 origin{0.0, 0.0, 0.0};
  Cell cell;

  std::size_t size() const { return values.size(); }

  void validate() const {
    if (shape[0] == 0 || shape[1] == 0 || shape[2] == 0) {
      throw std::runtime_error("ScalarField: grid shape must be non-zero on every axis");
    }
    if (values.size() != grid_point_count(shape)) {
      throw std::runtime_error("ScalarField: value count " + std::to_string(values.size()) +
                               " does not match grid shape " + std::to_string(grid_point_count(shape)));
    }
  }

  double at(std::size_t i, std::size_t j, std::size_t k) const {
    return values[ravel_grid_index(shape, i, j, k)];
  }

  double at_flat(std::size_t flat) const {
    if (flat >= values.size()) throw std::out_of_range("ScalarField: flat index out of range");
    return values[flat];
  }

  Vec3 grid_position(std::size_t i, std::size_t j, std::size_t k) const {
    const Vec3 f{static_cast<double>(i) / static_cast<double>(shape[0]),
                 static_cast<double>(j) / static_cast<double>(shape[1]),
                 static_cast<double>(k) / static_cast<double>(shape[2])};
    return vec_add(origin, cell.to_cartesian(f));
  }
};

// Physical position of every grid point, laid out like ScalarField::values.
struct GridPositions {
  GridShape shape{0, 0, 0};
  std::vector<Vec3> points;

  std::size_t size() const { return points.size(); }

  const Vec3& at_flat(std::size_t flat) const {
    if (flat >= points.size()) throw std::out_of_range("GridPositions: flat index out of range");
    return points[flat];
  }
};

inline GridPositions calculate_grid_positions(const ScalarField& field) {
  field.validate();
  GridPositions gp;
  gp.shape = field.shape;
  gp.points.resize(grid_point_count(field.shape));
  std::size_t flat = 0;
  for (std::size_t i = 0; i < field.shape[0]; ++i) {
    for (std::size_t j = 0; j < field.shape[1]; ++j) {
      for (std::size_t k = 0; k < field.shape[2]; ++k) {
        gp.points[flat++] = field.grid_position(i, j, k);
      }
    }
  }
  return gp;
}

} // namespace probegraph
