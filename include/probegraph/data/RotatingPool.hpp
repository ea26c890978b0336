#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

#include "probegraph/data/Dataset.hpp"
#include "probegraph/util/BlockingQueue.hpp"

namespace probegraph::data {

struct RotatingPoolOptions {
  // 0 = seed from std::random_device.
  std::uint64_t seed = 0;
  std::size_t handoff_capacity = 2;
  // Start the background loops from the constructor.
  bool autostart = true;
};

// Fixed-size working set over a large, slow dataset.
//
// The constructor fills every slot from random parent indices (with
// replacement). Afterwards two background threads keep the pool fresh:
//   producer: cycles random permutations of the parent indices, loads each
//             sample and pushes it onto a small handoff queue;
//   transfer: pops the handoff queue and overwrites slots 0,1,2,... in turn.
//
// Each slot is replaced as a whole under its own lock, so at() always returns
// a complete sample. slot_version(i) counts the replacements of slot i.
//
// A parent load that throws is not skipped: the producer keeps the exception,
// stops, and every later at() or start() rethrows it.
class RotatingPool final : public Dataset {
public:
  RotatingPool(std::shared_ptr<const Dataset> parent, std::size_t pool_size, RotatingPoolOptions opts = {});
  ~RotatingPool() override;

  RotatingPool(const RotatingPool&) = delete;
  RotatingPool& operator=(const RotatingPool&) = delete;

  std::size_t size() const override { return slots_.size(); }
  SamplePtr at(std::size_t i) const override;

  std::uint64_t slot_version(std::size_t i) const;

  // Samples written into the pool by the transfer loop so far.
  std::uint64_t transfers() const { return transfers_.load(std::memory_order_relaxed); }
  // True once a parent load in the producer has thrown.
  bool failed() const;
  void rethrow_if_failed() const;

  const Dataset& parent() const { return *parent_; }

  void start();
  // Cancels both loops at their next queue wait and joins them.
  void stop();
  bool running() const { return running_; }

private:
  struct Slot {
    mutable std::mutex mu;
    SamplePtr sample;
    std::uint64_t version = 0;
  };

  std::shared_ptr<const Dataset> parent_;
  RotatingPoolOptions opts_;
  std::vector<Slot> slots_;
  BlockingQueue<SamplePtr> handoff_;

  std::mt19937_64 producer_rng_;
  std::size_t next_slot_ = 0;
  std::atomic<std::uint64_t> transfers_{0};
  mutable std::mutex error_mu_;
  std::exception_ptr error_;

  std::jthread producer_;
  std::jthread transfer_;
  bool running_ = false;

  void producer_loop_(std::stop_token st);
  void transfer_loop_(std::stop_token st);
  void store_(std::size_t slot, SamplePtr sample);
};

} // namespace probegraph::data
