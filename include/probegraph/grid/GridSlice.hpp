#pragma once

#include <cstddef>

#include "probegraph/core/AtomicStructure.hpp"
#include "probegraph/core/ScalarField.hpp"
#include "probegraph/graph/Graph.hpp"
#include "probegraph/neighbor/NeighborIndex.hpp"

namespace probegraph::grid {

// Half-open range of flat (row-major) grid indices.
struct SliceRange {
  std::size_t begin = 0;
  std::size_t end = 0;

  std::size_t size() const { return end - begin; }
};

// ceil(total_points / probe_count); probe_count must be positive.
std::size_t num_slices(std::size_t total_points, std::size_t probe_count);

// [k*probe_count, min((k+1)*probe_count, total_points))
SliceRange slice_range(std::size_t slice_index, std::size_t total_points, std::size_t probe_count);

// Probe-only graph of one grid slice.
struct GridSlice {
  std::size_t slice_index = 0;
  graph::EdgeSet probe_edges;
  std::size_t num_probe_edges = 0;
  std::size_t num_probes = 0;
};

// Recomputes the probe positions of slice `slice_index` and connects them to
// the atoms of `structure`. Pure in its inputs. `index` may be null; it is
// otherwise an index over `structure` built for `cutoff`.
GridSlice static_get_slice(std::size_t slice_index,
                           const AtomicStructure& structure,
                           const GridPositions& grid_positions,
                           std::size_t probe_count,
                           double cutoff,
                           const neighbor::NeighborIndex* index = nullptr);

} // namespace probegraph::grid
