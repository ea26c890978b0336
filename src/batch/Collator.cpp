#include "probegraph/batch/Collator.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace probegraph::batch {

namespace {

[[noreturn]] void die(const std::string& msg) { throw std::runtime_error("Collator: " + msg); }

std::size_t to_size(std::int64_t v, const char* what) {
  if (v < 0) die(std::string("negative count in ") + what);
  return static_cast<std::size_t>(v);
}

} // namespace

std::vector<std::string> Batch::field_names() const {
  std::vector<std::string> out{"nodes", "atom_edges", "atom_edge_features"};
  if (has_probes) {
    out.insert(out.end(), {"probe_edges", "probe_edge_features", "probe_target"});
  }
  out.insert(out.end(), {"num_nodes", "num_atom_edges"});
  if (has_probes) out.insert(out.end(), {"num_probe_edges", "num_probes"});
  return out;
}

Batch collate(std::span<const graph::Graph> graphs) {
  if (graphs.empty()) die("cannot collate an empty list of graphs");

  Batch b;
  b.has_probes = graphs.front().has_probes;

  std::size_t total_nodes = 0, total_edges = 0, total_probe_edges = 0, total_probes = 0;
  for (std::size_t g = 0; g < graphs.size(); ++g) {
    const auto& gr = graphs[g];
    if (gr.has_probes != b.has_probes) {
      die("graph " + std::to_string(g) + (gr.has_probes ? " has" : " lacks") +
          " probe fields, unlike graph 0");
    }
    gr.validate();
    total_nodes += gr.nodes.size();
    total_edges += gr.atom_edges.size();
    total_probe_edges += gr.probe_edges.size();
    total_probes += gr.probe_target.size();
  }

  b.nodes.reserve(total_nodes);
  b.atom_edges.reserve(total_edges);
  b.atom_edge_features.reserve(total_edges);
  if (b.has_probes) {
    b.probe_edges.reserve(total_probe_edges);
    b.probe_edge_features.reserve(total_probe_edges);
    b.probe_target.reserve(total_probes);
  }

  std::int64_t node_offset = 0;
  std::int64_t probe_offset = 0;
  for (const auto& gr : graphs) {
    b.nodes.insert(b.nodes.end(), gr.nodes.begin(), gr.nodes.end());
    for (const auto& e : gr.atom_edges.edges) {
      b.atom_edges.push_back({e[0] + node_offset, e[1] + node_offset});
    }
    b.atom_edge_features.insert(b.atom_edge_features.end(), gr.atom_edges.features.begin(),
                                gr.atom_edges.features.end());
    b.num_nodes.push_back(static_cast<std::int64_t>(gr.nodes.size()));
    b.num_atom_edges.push_back(static_cast<std::int64_t>(gr.atom_edges.size()));

    if (b.has_probes) {
      for (const auto& e : gr.probe_edges.edges) {
        b.probe_edges.push_back({e[0] + node_offset, e[1] + probe_offset});
      }
      b.probe_edge_features.insert(b.probe_edge_features.end(), gr.probe_edges.features.begin(),
                                   gr.probe_edges.features.end());
      b.probe_target.insert(b.probe_target.end(), gr.probe_target.begin(), gr.probe_target.end());
      b.num_probe_edges.push_back(static_cast<std::int64_t>(gr.probe_edges.size()));
      b.num_probes.push_back(static_cast<std::int64_t>(gr.probe_target.size()));
      probe_offset += static_cast<std::int64_t>(gr.probe_target.size());
    }
    node_offset += static_cast<std::int64_t>(gr.nodes.size());
  }
  return b;
}

std::vector<graph::Graph> split(const Batch& b) {
  const std::size_t n = b.batch_size();
  if (b.num_atom_edges.size() != n) die("count vectors differ in length");
  if (b.has_probes && (b.num_probe_edges.size() != n || b.num_probes.size() != n)) {
    die("probe count vectors differ in length");
  }
  if (b.atom_edges.size() != b.atom_edge_features.size() ||
      b.probe_edges.size() != b.probe_edge_features.size()) {
    die("edge and feature arrays differ in length");
  }

  std::vector<graph::Graph> out(n);
  std::size_t node_pos = 0, edge_pos = 0, probe_edge_pos = 0, probe_pos = 0;
  for (std::size_t g = 0; g < n; ++g) {
    auto& gr = out[g];
    const std::size_t nn = to_size(b.num_nodes[g], "num_nodes");
    const std::size_t ne = to_size(b.num_atom_edges[g], "num_atom_edges");
    if (node_pos + nn > b.nodes.size() || edge_pos + ne > b.atom_edges.size()) {
      die("counts exceed the concatenated arrays at sample " + std::to_string(g));
    }
    const auto node_offset = static_cast<std::int64_t>(node_pos);

    gr.nodes.assign(b.nodes.begin() + static_cast<std::ptrdiff_t>(node_pos),
                    b.nodes.begin() + static_cast<std::ptrdiff_t>(node_pos + nn));
    gr.atom_edges.reserve(ne);
    for (std::size_t e = edge_pos; e < edge_pos + ne; ++e) {
      gr.atom_edges.edges.push_back({b.atom_edges[e][0] - node_offset, b.atom_edges[e][1] - node_offset});
      gr.atom_edges.features.push_back(b.atom_edge_features[e]);
    }

    gr.has_probes = b.has_probes;
    if (b.has_probes) {
      const std::size_t npe = to_size(b.num_probe_edges[g], "num_probe_edges");
      const std::size_t np = to_size(b.num_probes[g], "num_probes");
      if (probe_edge_pos + npe > b.probe_edges.size() || probe_pos + np > b.probe_target.size()) {
        die("probe counts exceed the concatenated arrays at sample " + std::to_string(g));
      }
      const auto probe_offset = static_cast<std::int64_t>(probe_pos);
      gr.probe_edges.reserve(npe);
      for (std::size_t e = probe_edge_pos; e < probe_edge_pos + npe; ++e) {
        gr.probe_edges.edges.push_back({b.probe_edges[e][0] - node_offset, b.probe_edges[e][1] - probe_offset});
        gr.probe_edges.features.push_back(b.probe_edge_features[e]);
      }
      gr.probe_target.assign(b.probe_target.begin() + static_cast<std::ptrdiff_t>(probe_pos),
                             b.probe_target.begin() + static_cast<std::ptrdiff_t>(probe_pos + np));
      probe_edge_pos += npe;
      probe_pos += np;
    }

    gr.refresh_counts();
    node_pos += nn;
    edge_pos += ne;
  }
  return out;
}

} // namespace probegraph::batch
