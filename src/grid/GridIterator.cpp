#include "probegraph/grid/GridIterator.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "probegraph/neighbor/NeighborIndex.hpp"

namespace probegraph::grid {

GridIterator::GridIterator(std::shared_ptr<const Sample> sample,
                           bool ignore_pbc,
                           std::size_t probe_count,
                           double cutoff,
                           GridIteratorOptions opts)
    : sample_(std::move(sample)), probe_count_(probe_count), cutoff_(cutoff), opts_(opts) {
  if (!sample_) throw std::invalid_argument("GridIterator: sample is null");
  if (!(cutoff_ > 0.0)) throw std::invalid_argument("GridIterator: cutoff must be positive");
  num_slices_ = grid::num_slices(sample_->grid_positions.size(), probe_count_);

  if (ignore_pbc) {
    structure_ = std::make_shared<const AtomicStructure>(sample_->structure.with_pbc(false));
  } else {
    // Aliases the sample's structure; keeps the sample alive.
    structure_ = std::shared_ptr<const AtomicStructure>(sample_, &sample_->structure);
  }
}

GridIterator::~GridIterator() { stop(); }

GridSlice GridIterator::get_slice(std::size_t slice_index) const {
  return static_get_slice(slice_index, *structure_, sample_->grid_positions, probe_count_, cutoff_);
}

void GridIterator::start() {
  stop();

  auto structure = structure_;
  auto sample = sample_;
  const std::size_t probe_count = probe_count_;
  const double cutoff = cutoff_;
  neighbor::IndexFactory builder = opts_.index_builder;
  if (!builder) {
    builder = [](const AtomicStructure& s, double rc) { return neighbor::build_neighbor_index(s, rc); };
  }
  auto degraded = degraded_;
  degraded->store(0);

  auto factory = [structure, sample, probe_count, cutoff, builder, degraded](std::size_t worker_id)
      -> OrderedWorkerPool<GridSlice>::Task {
    std::shared_ptr<const neighbor::NeighborIndex> index;
    try {
      index = builder(*structure, cutoff);
    } catch (const std::exception& e) {
      degraded->fetch_add(1);
      std::cerr << "[probegraph] warning: worker " << worker_id
                << " failed to build a neighbor index, this might get slow: " << e.what() << "\n";
    }
    return [structure, sample, probe_count, cutoff, index](std::size_t slice_index) {
      return static_get_slice(slice_index, *structure, sample->grid_positions, probe_count, cutoff, index.get());
    };
  };

  OrderedWorkerPoolOptions po;
  po.num_workers = opts_.num_workers;
  po.idle_timeout = opts_.idle_timeout;
  po.result_capacity = opts_.result_capacity;
  pool_ = std::make_unique<OrderedWorkerPool<GridSlice>>(num_slices_, std::move(factory), po);
  pool_->start();
}

std::optional<GridSlice> GridIterator::next() {
  if (!pool_) start();
  return pool_->next();
}

void GridIterator::stop() {
  if (pool_) {
    pool_->stop();
    pool_.reset();
  }
}

} // namespace probegraph::grid
