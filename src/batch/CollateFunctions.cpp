#include "probegraph/batch/CollateFunctions.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "probegraph/graph/GraphBuilder.hpp"

namespace probegraph::batch {

namespace {

const Sample& checked(const data::SamplePtr& s, std::size_t i) {
  if (!s) throw std::invalid_argument("collate: sample " + std::to_string(i) + " is null");
  return *s;
}

} // namespace

CollateRandomSample::CollateRandomSample(double cutoff, std::size_t num_probes, bool disable_pbc, std::uint64_t seed)
    : cutoff_(cutoff), num_probes_(num_probes), disable_pbc_(disable_pbc) {
  if (!(cutoff_ > 0.0)) throw std::invalid_argument("CollateRandomSample: cutoff must be positive");
  if (seed == 0) {
    std::random_device rd;
    seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
  }
  rng_.seed(seed);
}

Batch CollateRandomSample::operator()(std::span<const data::SamplePtr> samples) {
  std::vector<graph::Graph> graphs;
  graphs.reserve(samples.size());
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const Sample& s = checked(samples[i], i);
    if (disable_pbc_) {
      graphs.push_back(graph::atoms_and_probe_sample_to_graph(s.field, s.structure.with_pbc(false), s.grid_positions,
                                                              cutoff_, num_probes_, rng_));
    } else {
      graphs.push_back(
          graph::atoms_and_probe_sample_to_graph(s.field, s.structure, s.grid_positions, cutoff_, num_probes_, rng_));
    }
  }
  return collate(graphs);
}

CollateAtoms::CollateAtoms(double cutoff, bool disable_pbc) : cutoff_(cutoff), disable_pbc_(disable_pbc) {
  if (!(cutoff_ > 0.0)) throw std::invalid_argument("CollateAtoms: cutoff must be positive");
}

Batch CollateAtoms::operator()(std::span<const data::SamplePtr> samples) const {
  std::vector<graph::Graph> graphs;
  graphs.reserve(samples.size());
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const Sample& s = checked(samples[i], i);
    graphs.push_back(disable_pbc_ ? graph::atoms_to_graph_dict(s.structure.with_pbc(false), cutoff_)
                                  : graph::atoms_to_graph_dict(s.structure, cutoff_));
  }
  return collate(graphs);
}

} // namespace probegraph::batch
