#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "probegraph/core/Cell.hpp"

namespace probegraph {

// Species code reserved for probe pseudo-atoms appended to a structure.
inline constexpr int kProbeSpecies = 0;

// Atoms (species + Cartesian positions in Å) and their cell.
//
// Treated as immutable once loaded; callers that need a variant (periodicity
// switched off, probes appended) get a copy.
struct AtomicStructure {
  std::vector<int> numbers;
  std::vector<Vec3> positions;
  Cell cell;

  AtomicStructure() = default;

  AtomicStructure(std::vector<int> z, std::vector<Vec3> pos, const Cell& c)
      : numbers(std::move(z)), positions(std::move(pos)), cell(c) {
    validate();
  }

  std::size_t size() const { return positions.size(); }
  bool empty() const { return positions.empty(); }

  void validate() const {
    if (numbers.size() != positions.size()) {
      throw std::runtime_error("AtomicStructure: numbers/positions length mismatch (" +
                               std::to_string(numbers.size()) + " vs " + std::to_string(positions.size()) + ")");
    }
  }

  // Copy with every axis set to `periodic`.
  AtomicStructure with_pbc(bool periodic) const {
    AtomicStructure out = *this;
    out.cell.pbc = {periodic, periodic, periodic};
    return out;
  }

  // Copy with `points` appended as atoms of species `species` (same cell).
  AtomicStructure extended_with(std::span<const Vec3> points, int species = kProbeSpecies) const {
    AtomicStructure out;
    out.cell = cell;
    out.numbers = numbers;
    out.positions = positions;
    out.numbers.insert(out.numbers.end(), points.size(), species);
    out.positions.insert(out.positions.end(), points.begin(), points.end());
    return out;
  }
};

} // namespace probegraph
