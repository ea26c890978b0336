#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

#include "probegraph/core/AtomicStructure.hpp"
#include "probegraph/core/Sample.hpp"
#include "probegraph/grid/GridSlice.hpp"
#include "probegraph/grid/OrderedWorkerPool.hpp"
#include "probegraph/neighbor/NeighborIndex.hpp"

namespace probegraph::grid {

struct GridIteratorOptions {
  std::size_t num_workers = 6;
  std::chrono::milliseconds idle_timeout{10000};
  std::size_t result_capacity = 100;
  // Per-worker index construction; empty means neighbor::build_neighbor_index.
  neighbor::IndexFactory index_builder;
};

// Streams the probe graph of every grid point of one sample, slice by slice,
// in slice order. Slices are computed by a pool of worker threads, each of
// which builds its own neighbor index once.
//
//   GridIterator it(sample, false, 5000, 4.0);
//   while (auto slice = it.next()) { ... }
class GridIterator {
public:
  GridIterator(std::shared_ptr<const Sample> sample,
               bool ignore_pbc,
               std::size_t probe_count,
               double cutoff,
               GridIteratorOptions opts = {});

  ~GridIterator();

  GridIterator(const GridIterator&) = delete;
  GridIterator& operator=(const GridIterator&) = delete;

  std::size_t num_slices() const { return num_slices_; }
  std::size_t probe_count() const { return probe_count_; }
  double cutoff() const { return cutoff_; }
  const AtomicStructure& structure() const { return *structure_; }

  // Computes one slice on the calling thread (no prebuilt index).
  GridSlice get_slice(std::size_t slice_index) const;

  // (Re)starts a pass over all slices.
  void start();

  // Next slice in order; std::nullopt after the last one (workers joined).
  // Rethrows the first worker failure.
  std::optional<GridSlice> next();

  // Cancels an unfinished pass.
  void stop();

  // Workers of the current pass that run without a prebuilt index because
  // building one failed.
  std::size_t degraded_workers() const { return degraded_->load(); }

private:
  std::shared_ptr<const Sample> sample_;
  std::shared_ptr<const AtomicStructure> structure_;
  std::size_t probe_count_ = 0;
  double cutoff_ = 0.0;
  std::size_t num_slices_ = 0;
  GridIteratorOptions opts_;

  std::unique_ptr<OrderedWorkerPool<GridSlice>> pool_;
  std::shared_ptr<std::atomic<std::size_t>> degraded_ = std::make_shared<std::atomic<std::size_t>>(0);
};

} // namespace probegraph::grid
