#pragma once

#include <cstddef>
#include <memory>
#include <random>
#include <span>

#include "probegraph/core/AtomicStructure.hpp"
#include "probegraph/core/ScalarField.hpp"
#include "probegraph/graph/Graph.hpp"
#include "probegraph/neighbor/NeighborIndex.hpp"

namespace probegraph::graph {

struct AtomGraph {
  EdgeSet atom_edges;
  // Index built for the structure; reusable for probe queries.
  std::shared_ptr<const neighbor::NeighborIndex> index;
};

// Edge (neighbor, i) with the pair distance for every neighbor of every atom.
AtomGraph atoms_to_graph(const AtomicStructure& structure, double cutoff);

// Edge (atom, p) for every atom within cutoff of probe p; probes never connect
// to each other.
//
// `index` must have been built over `structure` with the same cutoff, or be
// null. Without point-query support the probes are appended as pseudo-atoms
// to a copy of the structure and a fresh index is built for that copy.
EdgeSet probes_to_graph(const AtomicStructure& structure,
                        std::span<const Vec3> probe_positions,
                        double cutoff,
                        const neighbor::NeighborIndex* index = nullptr);

// Training sample: `num_probes` grid points drawn uniformly with replacement,
// targets read from `field` at the drawn grid indices.
Graph atoms_and_probe_sample_to_graph(const ScalarField& field,
                                      const AtomicStructure& structure,
                                      const GridPositions& grid_positions,
                                      double cutoff,
                                      std::size_t num_probes,
                                      std::mt19937_64& rng);

// Atom graph without probes.
Graph atoms_to_graph_dict(const AtomicStructure& structure, double cutoff);

} // namespace probegraph::graph
