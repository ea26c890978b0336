#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "probegraph/core/AtomicStructure.hpp"
#include "probegraph/neighbor/NeighborIndex.hpp"
#include "probegraph/neighbor/PeriodicFrame.hpp"

namespace probegraph::neighbor {

// Binned cell list over the atoms and the periodic images lying within one
// cutoff of the wrapped cell. Bins are at least one cutoff wide, so a query
// only inspects the 27 bins around the center.
//
// Supports direct point queries, which lets probe graphs reuse the index built
// for the atom graph.
class CellListIndex final : public NeighborIndex {
public:
  CellListIndex(const AtomicStructure& structure, double cutoff);

  const char* kind() const override { return "CellListIndex"; }
  std::size_t size() const override { return wrapped_.size(); }

  using NeighborIndex::neighbors;
  void neighbors(std::size_t i, double cutoff, NeighborList& out) const override;

  bool supports_point_query() const override { return true; }
  void query_point(const Vec3& point, double cutoff, NeighborList& out) const override;
  void query_points(std::span<const Vec3> points, double cutoff, std::vector<NeighborList>& out) const override;

  std::size_t image_count() const { return images_.size(); }
  std::array<std::int64_t,3> bin_shape() const { return nbins_; }

private:
  struct Image {
    std::size_t atom;
    bool is_primary;  // zero image shift: the wrapped atom itself
    Vec3 pos;
  };

  PeriodicFrame frame_;
  std::vector<Vec3> wrapped_;
  std::vector<Image> images_;       // sorted by bin
  std::vector<std::size_t> bin_start_;  // CSR offsets, size = nbins + 1

  Vec3 lo_{0.0, 0.0, 0.0};
  Vec3 width_{1.0, 1.0, 1.0};
  std::array<std::int64_t,3> nbins_{1, 1, 1};

  std::int64_t bin_coord_(const Vec3& p, int axis) const;
  std::size_t bin_id_(std::int64_t bx, std::int64_t by, std::int64_t bz) const {
    return static_cast<std::size_t>((bx * nbins_[1] + by) * nbins_[2] + bz);
  }

  void search_(const Vec3& center, std::size_t exclude_atom, NeighborList& out) const;
};

} // namespace probegraph::neighbor
