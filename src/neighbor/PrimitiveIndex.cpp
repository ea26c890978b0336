#include "probegraph/neighbor/PrimitiveIndex.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

#if PROBEGRAPH_HAS_OPENMP
#include <omp.h>
#endif

#include "probegraph/neighbor/PeriodicFrame.hpp"

namespace probegraph::neighbor {

PrimitiveIndex::PrimitiveIndex(const AtomicStructure& structure, double cutoff)
    : NeighborIndex(cutoff) {
  structure.validate();

  const PeriodicFrame frame(structure.cell, cutoff);
  cell_ = frame.basis;
  n_images_ = frame.images;

  const std::size_t n = structure.size();
  positions_.resize(n);
  for (std::size_t i = 0; i < n; ++i) positions_[i] = frame.wrap(structure.positions[i]);

  std::vector<CellShift> shifts;
  for (std::int32_t sa = -n_images_[0]; sa <= n_images_[0]; ++sa) {
    for (std::int32_t sb = -n_images_[1]; sb <= n_images_[1]; ++sb) {
      for (std::int32_t sc = -n_images_[2]; sc <= n_images_[2]; ++sc) {
        shifts.push_back({sa, sb, sc});
      }
    }
  }
  std::vector<Vec3> shift_vectors(shifts.size());
  for (std::size_t s = 0; s < shifts.size(); ++s) shift_vectors[s] = cell_.shift_vector(shifts[s]);

  const double rc2 = cutoff * cutoff;
  pairs_.assign(n, {});

#if PROBEGRAPH_HAS_OPENMP
  #pragma omp parallel for schedule(dynamic, 16) if (n >= 512)
#endif
  for (std::int64_t ii = 0; ii < static_cast<std::int64_t>(n); ++ii) {
    const std::size_t i = static_cast<std::size_t>(ii);
    auto& list = pairs_[i];
    const Vec3& ri = positions_[i];
    for (std::size_t j = 0; j < n; ++j) {
      const Vec3 d0 = vec_sub(positions_[j], ri);
      for (std::size_t s = 0; s < shifts.size(); ++s) {
        if (i == j && is_zero_shift(shifts[s])) continue;
        const Vec3 d = vec_add(d0, shift_vectors[s]);
        if (vec_norm2(d) <= rc2) list.push_back({j, shifts[s]});
      }
    }
  }
}

void PrimitiveIndex::neighbors(std::size_t i, double cutoff, NeighborList& out) const {
  check_query_(cutoff);
  if (i >= positions_.size()) {
    throw std::out_of_range("PrimitiveIndex: atom index " + std::to_string(i) + " out of range");
  }
  out.clear();
  const auto& list = pairs_[i];
  out.indices.reserve(list.size());
  out.vectors.reserve(list.size());
  out.dist2.reserve(list.size());
  const Vec3& ri = positions_[i];
  for (const auto& p : list) {
    const Vec3 d = vec_sub(vec_add(positions_[p.j], cell_.shift_vector(p.shift)), ri);
    out.add(p.j, d, vec_norm2(d));
  }
}

} // namespace probegraph::neighbor
