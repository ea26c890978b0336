#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "probegraph/core/AtomicStructure.hpp"
#include "probegraph/core/Cell.hpp"

namespace probegraph::neighbor {

// Neighbors of one center, structure-of-arrays.
//
// vectors[n] = positions[indices[n]] + shift * cell - center  (Å)
// dist2[n]   = |vectors[n]|^2
struct NeighborList {
  std::vector<std::size_t> indices;
  std::vector<Vec3> vectors;
  std::vector<double> dist2;

  std::size_t size() const { return indices.size(); }
  bool empty() const { return indices.empty(); }

  void clear() {
    indices.clear();
    vectors.clear();
    dist2.clear();
  }

  void add(std::size_t j, const Vec3& v, double d2) {
    indices.push_back(j);
    vectors.push_back(v);
    dist2.push_back(d2);
  }
};

// Fixed-radius neighbor search over the atoms of one structure.
//
// An index is built for exactly one cutoff; querying with any other cutoff is
// a contract violation (std::invalid_argument). Lists are "both ways": if j is
// a neighbor of i then i is a neighbor of j. The center itself is excluded,
// its periodic images are not.
class NeighborIndex {
public:
  virtual ~NeighborIndex() = default;

  virtual const char* kind() const = 0;

  // Number of indexed atoms.
  virtual std::size_t size() const = 0;

  double cutoff() const { return cutoff_; }

  virtual void neighbors(std::size_t i, double cutoff, NeighborList& out) const = 0;

  NeighborList neighbors(std::size_t i, double cutoff) const {
    NeighborList out;
    neighbors(i, cutoff, out);
    return out;
  }

  // Direct queries for arbitrary points (no self exclusion).
  virtual bool supports_point_query() const { return false; }

  virtual void query_point(const Vec3& point, double cutoff, NeighborList& out) const {
    (void)point;
    (void)cutoff;
    (void)out;
    throw std::logic_error(std::string(kind()) + ": point queries are not supported");
  }

  // Batched point queries; out[k] receives the neighbors of points[k].
  virtual void query_points(std::span<const Vec3> points, double cutoff, std::vector<NeighborList>& out) const {
    out.resize(points.size());
    for (std::size_t k = 0; k < points.size(); ++k) query_point(points[k], cutoff, out[k]);
  }

protected:
  explicit NeighborIndex(double cutoff) : cutoff_(cutoff) {
    if (!(cutoff > 0.0)) throw std::invalid_argument("NeighborIndex: cutoff must be positive");
  }

  void check_query_(double cutoff) const {
    if (cutoff != cutoff_) {
      throw std::invalid_argument(std::string(kind()) + ": query cutoff " + std::to_string(cutoff) +
                                  " differs from build cutoff " + std::to_string(cutoff_));
    }
  }

private:
  double cutoff_ = 0.0;
};

// The cell-list index cannot be trusted for degenerate cells, or for periodic
// cells with a lattice vector shorter than the cutoff.
inline bool needs_fallback_index(const AtomicStructure& structure, double cutoff) {
  const Cell& cell = structure.cell;
  if (cell.is_degenerate()) return true;
  if (!cell.any_pbc()) return false;
  const auto l = cell.lengths();
  return l[0] < cutoff || l[1] < cutoff || l[2] < cutoff;
}

using IndexFactory = std::function<std::unique_ptr<NeighborIndex>(const AtomicStructure&, double)>;

// Selects the implementation with needs_fallback_index(). If the fast index
// (a CellListIndex unless `fast` is given) throws while building, a warning is
// logged and the primitive index is used instead. std::invalid_argument is
// passed through.
std::unique_ptr<NeighborIndex> build_neighbor_index(const AtomicStructure& structure, double cutoff);
std::unique_ptr<NeighborIndex> build_neighbor_index(const AtomicStructure& structure, double cutoff,
                                                    const IndexFactory& fast);

} // namespace probegraph::neighbor
