#include "probegraph/grid/GridSlice.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "probegraph/graph/GraphBuilder.hpp"

namespace probegraph::grid {

std::size_t num_slices(std::size_t total_points, std::size_t probe_count) {
  if (probe_count == 0) throw std::invalid_argument("GridSlice: probe_count must be positive");
  return (total_points + probe_count - 1) / probe_count;
}

SliceRange slice_range(std::size_t slice_index, std::size_t total_points, std::size_t probe_count) {
  const std::size_t n = num_slices(total_points, probe_count);
  if (slice_index >= n) {
    throw std::out_of_range("GridSlice: slice " + std::to_string(slice_index) + " out of range (" +
                            std::to_string(n) + " slices)");
  }
  SliceRange r;
  r.begin = slice_index * probe_count;
  r.end = std::min(r.begin + probe_count, total_points);
  return r;
}

GridSlice static_get_slice(std::size_t slice_index,
                           const AtomicStructure& structure,
                           const GridPositions& grid_positions,
                           std::size_t probe_count,
                           double cutoff,
                           const neighbor::NeighborIndex* index) {
  const SliceRange r = slice_range(slice_index, grid_positions.size(), probe_count);
  const std::span<const Vec3> probes(grid_positions.points.data() + r.begin, r.size());

  GridSlice out;
  out.slice_index = slice_index;
  out.probe_edges = graph::probes_to_graph(structure, probes, cutoff, index);
  out.num_probe_edges = out.probe_edges.size();
  out.num_probes = r.size();
  return out;
}

} // namespace probegraph::grid
