#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace probegraph::graph {

// Directed edge (source, target). For probe edges the source is an atom index
// and the target a probe index local to the probe set.
using EdgeIndex = std::array<std::int64_t,2>;

inline constexpr std::size_t kEdgeColumns = 2;
inline constexpr std::size_t kEdgeFeatureColumns = 1;

// Edges [E,2] and their distance features [E,1]. An empty set is a valid
// zero-row array, never a missing field.
struct EdgeSet {
  std::vector<EdgeIndex> edges;
  std::vector<float> features;

  std::size_t size() const { return edges.size(); }
  bool empty() const { return edges.empty(); }

  void reserve(std::size_t n) {
    edges.reserve(n);
    features.reserve(n);
  }

  void add(std::int64_t source, std::int64_t target, double distance) {
    edges.push_back({source, target});
    features.push_back(static_cast<float>(distance));
  }

  void append(const EdgeSet& other) {
    edges.insert(edges.end(), other.edges.begin(), other.edges.end());
    features.insert(features.end(), other.features.begin(), other.features.end());
  }

  void validate(const char* what) const {
    if (edges.size() != features.size()) {
      throw std::runtime_error(std::string("EdgeSet[") + what + "]: " + std::to_string(edges.size()) +
                               " edges but " + std::to_string(features.size()) + " features");
    }
  }
};

// Graph of one sample. Atoms-only graphs leave has_probes false and carry
// no probe fields.
struct Graph {
  std::vector<int> nodes;          // species per atom
  EdgeSet atom_edges;

  bool has_probes = false;
  EdgeSet probe_edges;
  std::vector<float> probe_target;

  // Cached counts, kept in sync by refresh_counts().
  std::size_t num_nodes = 0;
  std::size_t num_atom_edges = 0;
  std::size_t num_probe_edges = 0;
  std::size_t num_probes = 0;

  void refresh_counts() {
    num_nodes = nodes.size();
    num_atom_edges = atom_edges.size();
    num_probe_edges = has_probes ? probe_edges.size() : 0;
    num_probes = has_probes ? probe_target.size() : 0;
  }

  void validate() const {
    atom_edges.validate("atom_edges");
    if (num_nodes != nodes.size() || num_atom_edges != atom_edges.size()) {
      throw std::runtime_error("Graph: cached atom counts are stale");
    }
    const auto n = static_cast<std::int64_t>(nodes.size());
    for (const auto& e : atom_edges.edges) {
      if (e[0] < 0 || e[0] >= n || e[1] < 0 || e[1] >= n) {
        throw std::runtime_error("Graph: atom edge index out of range");
      }
    }
    if (!has_probes) return;
    probe_edges.validate("probe_edges");
    if (num_probe_edges != probe_edges.size() || num_probes != probe_target.size()) {
      throw std::runtime_error("Graph: cached probe counts are stale");
    }
    const auto np = static_cast<std::int64_t>(probe_target.size());
    for (const auto& e : probe_edges.edges) {
      if (e[0] < 0 || e[0] >= n || e[1] < 0 || e[1] >= np) {
        throw std::runtime_error("Graph: probe edge index out of range");
      }
    }
  }
};

} // namespace probegraph::graph
