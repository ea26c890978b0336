#include "probegraph/neighbor/CellListIndex.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace probegraph::neighbor {

namespace {

constexpr std::size_t kNoExclusion = std::numeric_limits<std::size_t>::max();

// Images are kept if their fractional coordinate along a periodic axis lies
// within this much of the padded range.
constexpr double kFracSlack = 1e-9;

} // namespace

CellListIndex::CellListIndex(const AtomicStructure& structure, double cutoff)
    : NeighborIndex(cutoff), frame_(structure.cell, cutoff) {
  structure.validate();
  if (structure.cell.any_pbc() && structure.cell.is_degenerate()) {
    throw std::runtime_error("CellListIndex: periodic cell with a degenerate lattice vector");
  }

  const std::size_t n = structure.size();
  wrapped_.resize(n);
  for (std::size_t i = 0; i < n; ++i) wrapped_[i] = frame_.wrap(structure.positions[i]);

  // Padding (in fractional units) needed on each periodic axis.
  std::array<double,3> pad{0.0, 0.0, 0.0};
  for (int a = 0; a < 3; ++a) {
    if (frame_.periodic[a]) pad[a] = cutoff / frame_.basis.plane_spacing(a) + kFracSlack;
  }

  const CellShift& ni = frame_.images;
  std::vector<Image> raw;
  raw.reserve(n * static_cast<std::size_t>((2 * ni[0] + 1) * (2 * ni[1] + 1) * (2 * ni[2] + 1)));
  for (std::size_t j = 0; j < n; ++j) {
    const Vec3 fj = frame_.any_periodic() ? frame_.basis.to_fractional(wrapped_[j]) : Vec3{0.0, 0.0, 0.0};
    for (std::int32_t sa = -ni[0]; sa <= ni[0]; ++sa) {
      for (std::int32_t sb = -ni[1]; sb <= ni[1]; ++sb) {
        for (std::int32_t sc = -ni[2]; sc <= ni[2]; ++sc) {
          const CellShift s{sa, sb, sc};
          bool keep = true;
          for (int a = 0; a < 3 && keep; ++a) {
            if (!frame_.periodic[a]) continue;
            const double f = fj[a] + static_cast<double>(s[a]);
            keep = (f >= -pad[a]) && (f <= 1.0 + pad[a]);
          }
          if (!keep) continue;
          raw.push_back({j, is_zero_shift(s), vec_add(wrapped_[j], frame_.shift_vector(s))});
        }
      }
    }
  }

  // Bin geometry over the bounding box of every kept image.
  Vec3 hi{0.0, 0.0, 0.0};
  if (!raw.empty()) {
    lo_ = raw.front().pos;
    hi = raw.front().pos;
    for (const auto& im : raw) {
      for (int d = 0; d < 3; ++d) {
        lo_[d] = std::min(lo_[d], im.pos[d]);
        hi[d] = std::max(hi[d], im.pos[d]);
      }
    }
  }
  for (int d = 0; d < 3; ++d) {
    const double extent = hi[d] - lo_[d];
    nbins_[d] = std::max<std::int64_t>(1, static_cast<std::int64_t>(std::floor(extent / cutoff)));
  }
  const std::int64_t max_bins = std::max<std::int64_t>(64, 8 * static_cast<std::int64_t>(raw.size()));
  while (nbins_[0] * nbins_[1] * nbins_[2] > max_bins) {
    const int d = static_cast<int>(std::max_element(nbins_.begin(), nbins_.end()) - nbins_.begin());
    nbins_[d] = (nbins_[d] + 1) / 2;
  }
  for (int d = 0; d < 3; ++d) {
    const double extent = hi[d] - lo_[d];
    width_[d] = (extent > 0.0) ? std::max(cutoff, extent / static_cast<double>(nbins_[d])) : cutoff;
  }

  // Counting sort of images into bins.
  const std::size_t total_bins = static_cast<std::size_t>(nbins_[0] * nbins_[1] * nbins_[2]);
  std::vector<std::size_t> bin_of(raw.size());
  bin_start_.assign(total_bins + 1, 0);
  for (std::size_t m = 0; m < raw.size(); ++m) {
    std::array<std::int64_t,3> b{};
    for (int d = 0; d < 3; ++d) b[d] = std::clamp<std::int64_t>(bin_coord_(raw[m].pos, d), 0, nbins_[d] - 1);
    bin_of[m] = bin_id_(b[0], b[1], b[2]);
    ++bin_start_[bin_of[m] + 1];
  }
  for (std::size_t b = 0; b < total_bins; ++b) bin_start_[b + 1] += bin_start_[b];
  images_.resize(raw.size());
  std::vector<std::size_t> fill(bin_start_.begin(), bin_start_.end() - 1);
  for (std::size_t m = 0; m < raw.size(); ++m) images_[fill[bin_of[m]]++] = raw[m];
}

std::int64_t CellListIndex::bin_coord_(const Vec3& p, int axis) const {
  const double x = std::floor((p[axis] - lo_[axis]) / width_[axis]);
  // Far-away points only need to land outside [-1, nbins].
  const double lim = static_cast<double>(nbins_[axis] + 2);
  return static_cast<std::int64_t>(std::clamp(x, -2.0, lim));
}

void CellListIndex::search_(const Vec3& center, std::size_t exclude_atom, NeighborList& out) const {
  out.clear();
  const double rc = cutoff();
  const double rc2 = rc * rc;

  std::array<std::int64_t,3> b0{}, b1{};
  for (int d = 0; d < 3; ++d) {
    const std::int64_t b = bin_coord_(center, d);
    b0[d] = std::max<std::int64_t>(0, b - 1);
    b1[d] = std::min<std::int64_t>(nbins_[d] - 1, b + 1);
    if (b0[d] > b1[d]) return;
  }

  for (std::int64_t bx = b0[0]; bx <= b1[0]; ++bx) {
    for (std::int64_t by = b0[1]; by <= b1[1]; ++by) {
      for (std::int64_t bz = b0[2]; bz <= b1[2]; ++bz) {
        const std::size_t id = bin_id_(bx, by, bz);
        for (std::size_t m = bin_start_[id]; m < bin_start_[id + 1]; ++m) {
          const Image& im = images_[m];
          if (im.is_primary && im.atom == exclude_atom) continue;
          const Vec3 d = vec_sub(im.pos, center);
          const double d2 = vec_norm2(d);
          if (d2 <= rc2) out.add(im.atom, d, d2);
        }
      }
    }
  }
}

void CellListIndex::neighbors(std::size_t i, double cutoff, NeighborList& out) const {
  check_query_(cutoff);
  if (i >= wrapped_.size()) {
    throw std::out_of_range("CellListIndex: atom index " + std::to_string(i) + " out of range");
  }
  search_(wrapped_[i], i, out);
}

void CellListIndex::query_point(const Vec3& point, double cutoff, NeighborList& out) const {
  check_query_(cutoff);
  search_(frame_.wrap(point), kNoExclusion, out);
}

void CellListIndex::query_points(std::span<const Vec3> points, double cutoff, std::vector<NeighborList>& out) const {
  check_query_(cutoff);
  out.resize(points.size());
  const std::int64_t n = static_cast<std::int64_t>(points.size());
#if PROBEGRAPH_HAS_OPENMP
  #pragma omp parallel for schedule(static) if (n >= 512)
#endif
  for (std::int64_t k = 0; k < n; ++k) {
    const auto p = static_cast<std::size_t>(k);
    search_(frame_.wrap(points[p]), kNoExclusion, out[p]);
  }
}

} // namespace probegraph::neighbor
