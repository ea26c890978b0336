#include "probegraph/graph/GraphBuilder.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "test_utils.hpp"

using namespace probegraph;
using namespace probegraph::graph;
using probegraph::testing::throws;

// ============================================================================
// Atom graphs
// ============================================================================

bool test_two_atom_scenario() {
  TEST_START("Two atoms, cutoff 1.5");

  const AtomicStructure s({1, 8}, {Vec3{0.0, 0.0, 0.0}, Vec3{1.0, 0.0, 0.0}}, Cell{});
  const AtomGraph g = atoms_to_graph(s, 1.5);
  if (g.atom_edges.size() != 2) TEST_FAIL("expected 2 edges, got " + std::to_string(g.atom_edges.size()));

  std::vector<EdgeIndex> edges = g.atom_edges.edges;
  std::sort(edges.begin(), edges.end());
  if (edges[0] != EdgeIndex{0, 1} || edges[1] != EdgeIndex{1, 0}) TEST_FAIL("wrong edge set");
  for (float d : g.atom_edges.features) {
    if (!testing::near(d, 1.0, 1e-6)) TEST_FAIL("distance " + std::to_string(d));
  }

  const EdgeSet none = probes_to_graph(s, {}, 1.5, g.index.get());
  if (!none.empty() || !none.features.empty()) TEST_FAIL("zero probes should give zero-row arrays");

  TEST_PASS();
  return true;
}

bool test_edges_point_into_center() {
  TEST_START("Edge (neighbor, i) for neighbors of i");

  const AtomicStructure s({1, 1, 1}, {Vec3{0.0, 0.0, 0.0}, Vec3{1.0, 0.0, 0.0}, Vec3{5.0, 0.0, 0.0}}, Cell{});
  const AtomGraph g = atoms_to_graph(s, 1.5);
  for (const auto& e : g.atom_edges.edges) {
    if (e[0] == 2 || e[1] == 2) TEST_FAIL("isolated atom got an edge");
  }
  if (g.atom_edges.size() != 2) TEST_FAIL("expected 2 edges");

  TEST_PASS();
  return true;
}

bool test_atom_edges_symmetric() {
  TEST_START("Atom edges are symmetric with equal distances");

  const auto s = testing::random_structure(60, 9.0, 9.0, 9.0, true, 42);
  const AtomGraph g = atoms_to_graph(s, 3.0);

  // Multiset of (src, dst) -> sorted distances.
  std::map<std::pair<std::int64_t, std::int64_t>, std::vector<float>> by_pair;
  for (std::size_t e = 0; e < g.atom_edges.size(); ++e) {
    by_pair[{g.atom_edges.edges[e][0], g.atom_edges.edges[e][1]}].push_back(g.atom_edges.features[e]);
  }
  for (auto& kv : by_pair) {
    auto it = by_pair.find({kv.first.second, kv.first.first});
    if (it == by_pair.end()) TEST_FAIL("missing reverse edge");
    auto a = kv.second;
    auto b = it->second;
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    if (a.size() != b.size()) TEST_FAIL("reverse edge multiplicity differs");
    for (std::size_t k = 0; k < a.size(); ++k) {
      if (!testing::near(a[k], b[k], 1e-5)) TEST_FAIL("reverse edge distance differs");
    }
  }

  TEST_PASS();
  return true;
}

bool test_empty_structure() {
  TEST_START("Empty structure gives an empty graph");

  const AtomicStructure s({}, {}, Cell::orthorhombic(5.0, 5.0, 5.0, false));
  const Graph g = atoms_to_graph_dict(s, 2.0);
  if (g.num_nodes != 0 || g.num_atom_edges != 0 || g.has_probes) TEST_FAIL("non-empty result");
  g.validate();

  TEST_PASS();
  return true;
}

// ============================================================================
// Probe graphs
// ============================================================================

bool test_probe_paths_agree() {
  TEST_START("Point-query and pseudo-atom probe paths agree");

  const double cutoff = 2.5;
  const auto s = testing::random_structure(40, 8.0, 8.0, 8.0, true, 9);
  std::mt19937_64 rng(1);
  std::uniform_real_distribution<double> u(0.0, 8.0);
  std::vector<Vec3> probes(30);
  for (auto& p : probes) p = {u(rng), u(rng), u(rng)};

  const AtomGraph ag = atoms_to_graph(s, cutoff);
  if (!ag.index->supports_point_query()) TEST_FAIL("expected a point-query index for this cell");
  EdgeSet fast = probes_to_graph(s, probes, cutoff, ag.index.get());
  EdgeSet slow = probes_to_graph(s, probes, cutoff, nullptr);

  auto canon = [](const EdgeSet& es) {
    std::vector<std::pair<EdgeIndex, long>> v;
    for (std::size_t e = 0; e < es.size(); ++e) {
      v.emplace_back(es.edges[e], std::lround(es.features[e] * 1e4));
    }
    std::sort(v.begin(), v.end());
    return v;
  };
  if (canon(fast) != canon(slow)) {
    TEST_FAIL("edge sets differ (" + std::to_string(fast.size()) + " vs " + std::to_string(slow.size()) + ")");
  }

  TEST_PASS();
  return true;
}

bool test_no_probe_probe_edges() {
  TEST_START("Probes never connect to each other");

  // Probes packed much closer to each other than to any atom.
  const AtomicStructure s({6}, {Vec3{5.0, 5.0, 5.0}}, Cell::orthorhombic(10.0, 10.0, 10.0, false));
  std::vector<Vec3> probes;
  for (int k = 0; k < 10; ++k) probes.push_back({4.0 + 0.05 * k, 5.0, 5.0});

  const AtomGraph ag = atoms_to_graph(s, 1.5);
  for (const bool prebuilt : {true, false}) {
    const EdgeSet es = probes_to_graph(s, probes, 1.5, prebuilt ? ag.index.get() : nullptr);
    if (es.size() != probes.size()) TEST_FAIL("expected one atom edge per probe, got " + std::to_string(es.size()));
    for (const auto& e : es.edges) {
      if (e[0] != 0) TEST_FAIL("source is not the atom");
      if (e[1] < 0 || e[1] >= static_cast<std::int64_t>(probes.size())) TEST_FAIL("probe index out of range");
    }
  }

  TEST_PASS();
  return true;
}

bool test_index_mismatch_rejected() {
  TEST_START("Index built for another structure or cutoff is rejected");

  const auto s = testing::random_structure(10, 8.0, 8.0, 8.0, true, 4);
  const auto other = testing::random_structure(12, 8.0, 8.0, 8.0, true, 4);
  const AtomGraph ag = atoms_to_graph(s, 3.0);
  const std::vector<Vec3> probes{{1.0, 1.0, 1.0}};
  if (!throws<std::runtime_error>([&] { (void)probes_to_graph(other, probes, 3.0, ag.index.get()); })) {
    TEST_FAIL("size mismatch accepted");
  }
  if (!throws<std::invalid_argument>([&] { (void)probes_to_graph(s, probes, 2.0, ag.index.get()); })) {
    TEST_FAIL("cutoff mismatch accepted");
  }

  TEST_PASS();
  return true;
}

// ============================================================================
// Training sample
// ============================================================================

bool test_sampled_graph() {
  TEST_START("Random probe sample carries consistent targets");

  const auto s = testing::random_structure(20, 6.0, 6.0, 6.0, true, 8);
  const Sample sample = testing::make_test_sample(s, {4, 5, 6});
  std::mt19937_64 rng(123);
  const Graph g =
      atoms_and_probe_sample_to_graph(sample.field, sample.structure, sample.grid_positions, 2.0, 50, rng);
  g.validate();
  if (!g.has_probes || g.num_probes != 50) TEST_FAIL("expected 50 probes");
  if (g.num_nodes != 20) TEST_FAIL("expected 20 nodes");
  for (float t : g.probe_target) {
    // Field values are their own flat index.
    if (t < 0.0f || t >= 120.0f || t != static_cast<float>(static_cast<int>(t))) TEST_FAIL("target not on grid");
  }

  std::mt19937_64 rng0(5);
  const Graph none =
      atoms_and_probe_sample_to_graph(sample.field, sample.structure, sample.grid_positions, 2.0, 0, rng0);
  if (!none.has_probes || none.num_probes != 0 || none.num_probe_edges != 0) TEST_FAIL("zero probes mishandled");

  TEST_PASS();
  return true;
}

int main() {
  std::cout << "\n";
  std::cout << "=========================================\n";
  std::cout << "  GraphBuilder Unit Tests\n";
  std::cout << "=========================================\n\n";

  bool all_passed = true;

  std::cout << "Category 1: Atom graphs\n";
  std::cout << "-------------------------------------\n";
  all_passed &= test_two_atom_scenario();
  all_passed &= test_edges_point_into_center();
  all_passed &= test_atom_edges_symmetric();
  all_passed &= test_empty_structure();
  std::cout << "\n";

  std::cout << "Category 2: Probe graphs\n";
  std::cout << "-------------------------------------\n";
  all_passed &= test_probe_paths_agree();
  all_passed &= test_no_probe_probe_edges();
  all_passed &= test_index_mismatch_rejected();
  std::cout << "\n";

  std::cout << "Category 3: Training samples\n";
  std::cout << "-------------------------------------\n";
  all_passed &= test_sampled_graph();
  std::cout << "\n";

  std::cout << (all_passed ? "All tests passed.\n" : "Some tests FAILED.\n");
  return all_passed ? 0 : 1;
}
