#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "probegraph/graph/Graph.hpp"

namespace probegraph::batch {

// N graphs concatenated along their node, edge and probe axes.
//
// Edge indices are rewritten against the concatenated arrays:
//   atom_edges  (src, dst) += (node offset, node offset)
//   probe_edges (src, dst) += (node offset, probe offset)
// The per-sample count vectors (length N) allow split() to undo this.
struct Batch {
  std::vector<int> nodes;
  std::vector<graph::EdgeIndex> atom_edges;
  std::vector<float> atom_edge_features;

  bool has_probes = false;
  std::vector<graph::EdgeIndex> probe_edges;
  std::vector<float> probe_edge_features;
  std::vector<float> probe_target;

  std::vector<std::int64_t> num_nodes;
  std::vector<std::int64_t> num_atom_edges;
  std::vector<std::int64_t> num_probe_edges;
  std::vector<std::int64_t> num_probes;

  std::size_t batch_size() const { return num_nodes.size(); }

  // Names of the fields this batch carries, in a fixed order.
  std::vector<std::string> field_names() const;
};

// Throws if `graphs` is empty or mixes graphs with and without probes.
Batch collate(std::span<const graph::Graph> graphs);

// Inverse of collate().
std::vector<graph::Graph> split(const Batch& batch);

} // namespace probegraph::batch
