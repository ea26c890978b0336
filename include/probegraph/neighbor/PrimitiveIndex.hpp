#pragma once

#include <cstddef>
#include <vector>

#include "probegraph/core/AtomicStructure.hpp"
#include "probegraph/neighbor/NeighborIndex.hpp"

namespace probegraph::neighbor {

// Brute-force pair search over every periodic image that can reach the cutoff
// (no skin). Works for any cell, including degenerate ones and periodic cells
// smaller than the cutoff, at O(N^2 * images) build cost.
//
// Axes flagged periodic but with a lattice vector below
// kDegenerateLatticeLength are searched as non-periodic.
class PrimitiveIndex final : public NeighborIndex {
public:
  PrimitiveIndex(const AtomicStructure& structure, double cutoff);

  const char* kind() const override { return "PrimitiveIndex"; }
  std::size_t size() const override { return positions_.size(); }

  using NeighborIndex::neighbors;
  void neighbors(std::size_t i, double cutoff, NeighborList& out) const override;

  // Per-axis image range searched during the build.
  const CellShift& image_range() const { return n_images_; }

private:
  struct Pair {
    std::size_t j;
    CellShift shift;
  };

  std::vector<Vec3> positions_;
  Cell cell_;
  CellShift n_images_{0, 0, 0};
  // Per-center neighbor lists, filled once at construction.
  std::vector<std::vector<Pair>> pairs_;
};

} // namespace probegraph::neighbor
