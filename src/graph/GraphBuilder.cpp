#include "probegraph/graph/GraphBuilder.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#if PROBEGRAPH_HAS_OPENMP
#include <omp.h>
#endif

namespace probegraph::graph {

namespace {

inline std::runtime_error die(const std::string& msg) {
  return std::runtime_error("GraphBuilder: " + msg);
}

void append_neighbors(const neighbor::NeighborList& nl, std::int64_t target,
                      std::size_t max_source, EdgeSet& out) {
  for (std::size_t n = 0; n < nl.size(); ++n) {
    if (nl.indices[n] >= max_source) continue;  // probe pseudo-atom
    out.add(static_cast<std::int64_t>(nl.indices[n]), target, std::sqrt(nl.dist2[n]));
  }
}

} // namespace

AtomGraph atoms_to_graph(const AtomicStructure& structure, double cutoff) {
  AtomGraph g;
  g.index = neighbor::build_neighbor_index(structure, cutoff);
  const auto& index = *g.index;

  const std::size_t n = structure.size();
  std::vector<EdgeSet> per_atom(n);

#if PROBEGRAPH_HAS_OPENMP
  #pragma omp parallel for schedule(dynamic, 32) if (n >= 512)
#endif
  for (std::int64_t ii = 0; ii < static_cast<std::int64_t>(n); ++ii) {
    neighbor::NeighborList nl;
    index.neighbors(static_cast<std::size_t>(ii), cutoff, nl);
    per_atom[static_cast<std::size_t>(ii)].reserve(nl.size());
    append_neighbors(nl, ii, n, per_atom[static_cast<std::size_t>(ii)]);
  }

  std::size_t total = 0;
  for (const auto& e : per_atom) total += e.size();
  g.atom_edges.reserve(total);
  for (const auto& e : per_atom) g.atom_edges.append(e);
  return g;
}

EdgeSet probes_to_graph(const AtomicStructure& structure,
                        std::span<const Vec3> probe_positions,
                        double cutoff,
                        const neighbor::NeighborIndex* index) {
  const std::size_t natoms = structure.size();
  if (index && index->size() != natoms) {
    throw die("index covers " + std::to_string(index->size()) + " atoms but the structure has " +
              std::to_string(natoms));
  }
  if (index && index->cutoff() != cutoff) {
    throw std::invalid_argument("GraphBuilder: index was built for cutoff " + std::to_string(index->cutoff()) +
                                ", probes requested with " + std::to_string(cutoff));
  }

  EdgeSet out;
  neighbor::NeighborList nl;

  if (index && index->supports_point_query()) {
    std::vector<neighbor::NeighborList> lists;
    index->query_points(probe_positions, cutoff, lists);
    for (std::size_t p = 0; p < lists.size(); ++p) {
      append_neighbors(lists[p], static_cast<std::int64_t>(p), natoms, out);
    }
    return out;
  }

  if (probe_positions.empty()) return out;

  const AtomicStructure extended = structure.extended_with(probe_positions);
  const auto ext_index = neighbor::build_neighbor_index(extended, cutoff);
  for (std::size_t p = 0; p < probe_positions.size(); ++p) {
    ext_index->neighbors(natoms + p, cutoff, nl);
    append_neighbors(nl, static_cast<std::int64_t>(p), natoms, out);
  }
  return out;
}

Graph atoms_and_probe_sample_to_graph(const ScalarField& field,
                                      const AtomicStructure& structure,
                                      const GridPositions& grid_positions,
                                      double cutoff,
                                      std::size_t num_probes,
                                      std::mt19937_64& rng) {
  const std::size_t npoints = grid_positions.size();
  if (npoints != field.size()) {
    throw die("grid positions (" + std::to_string(npoints) + ") do not match field size (" +
              std::to_string(field.size()) + ")");
  }
  if (num_probes > 0 && npoints == 0) throw die("cannot sample probes from an empty grid");

  std::vector<Vec3> probe_pos(num_probes);
  Graph g;
  g.has_probes = true;
  g.probe_target.resize(num_probes);
  if (num_probes > 0) {
    std::uniform_int_distribution<std::size_t> pick(0, npoints - 1);
    for (std::size_t p = 0; p < num_probes; ++p) {
      const std::size_t flat = pick(rng);
      probe_pos[p] = grid_positions.points[flat];
      g.probe_target[p] = static_cast<float>(field.values[flat]);
    }
  }

  AtomGraph ag = atoms_to_graph(structure, cutoff);
  g.nodes = structure.numbers;
  g.atom_edges = std::move(ag.atom_edges);
  g.probe_edges = probes_to_graph(structure, probe_pos, cutoff, ag.index.get());
  g.refresh_counts();
  return g;
}

Graph atoms_to_graph_dict(const AtomicStructure& structure, double cutoff) {
  Graph g;
  g.nodes = structure.numbers;
  g.atom_edges = atoms_to_graph(structure, cutoff).atom_edges;
  g.refresh_counts();
  return g;
}

} // namespace probegraph::graph
