#include "probegraph/data/RotatingPool.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace probegraph::data {

namespace {

std::uint64_t resolve_seed(std::uint64_t seed) {
  if (seed != 0) return seed;
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

} // namespace

RotatingPool::RotatingPool(std::shared_ptr<const Dataset> parent, std::size_t pool_size, RotatingPoolOptions opts)
    : parent_(std::move(parent)), opts_(opts), slots_(pool_size), handoff_(opts.handoff_capacity) {
  if (!parent_) throw std::invalid_argument("RotatingPool: parent dataset is null");
  if (pool_size == 0) throw std::invalid_argument("RotatingPool: pool_size must be positive");
  if (opts_.handoff_capacity == 0) throw std::invalid_argument("RotatingPool: handoff_capacity must be positive");
  const std::size_t n = parent_->size();
  if (n == 0) throw std::invalid_argument("RotatingPool: parent dataset is empty");

  const std::uint64_t seed = resolve_seed(opts_.seed);
  std::mt19937_64 fill_rng(seed);
  producer_rng_.seed(seed ^ 0x9e3779b97f4a7c15ULL);

  std::cerr << "[probegraph] filling rotating pool of size " << pool_size << " from " << n << " samples\n";
  std::uniform_int_distribution<std::size_t> pick(0, n - 1);
  for (auto& slot : slots_) {
    slot.sample = parent_->at(pick(fill_rng));
  }

  if (opts_.autostart) start();
}

RotatingPool::~RotatingPool() { stop(); }

SamplePtr RotatingPool::at(std::size_t i) const {
  check_index_(i, "RotatingPool");
  rethrow_if_failed();
  std::lock_guard<std::mutex> lock(slots_[i].mu);
  return slots_[i].sample;
}

std::uint64_t RotatingPool::slot_version(std::size_t i) const {
  check_index_(i, "RotatingPool");
  std::lock_guard<std::mutex> lock(slots_[i].mu);
  return slots_[i].version;
}

bool RotatingPool::failed() const {
  std::lock_guard<std::mutex> lock(error_mu_);
  return static_cast<bool>(error_);
}

void RotatingPool::rethrow_if_failed() const {
  std::exception_ptr e;
  {
    std::lock_guard<std::mutex> lock(error_mu_);
    e = error_;
  }
  if (e) std::rethrow_exception(e);
}

void RotatingPool::start() {
  rethrow_if_failed();
  if (running_) return;
  running_ = true;
  producer_ = std::jthread([this](std::stop_token st) { producer_loop_(st); });
  transfer_ = std::jthread([this](std::stop_token st) { transfer_loop_(st); });
}

void RotatingPool::stop() {
  if (!running_) return;
  producer_.request_stop();
  transfer_.request_stop();
  if (producer_.joinable()) producer_.join();
  if (transfer_.joinable()) transfer_.join();
  running_ = false;
}

void RotatingPool::producer_loop_(std::stop_token st) {
  std::vector<std::size_t> perm(parent_->size());
  std::iota(perm.begin(), perm.end(), std::size_t{0});

  while (!st.stop_requested()) {
    std::shuffle(perm.begin(), perm.end(), producer_rng_);
    for (std::size_t idx : perm) {
      if (st.stop_requested()) return;
      SamplePtr sample;
      try {
        sample = parent_->at(idx);
      } catch (const std::exception& e) {
        std::cerr << "[probegraph] error: rotating pool failed to load sample " << idx << ": " << e.what()
                  << "; producer stopped\n";
        {
          std::lock_guard<std::mutex> lock(error_mu_);
          error_ = std::current_exception();
        }
        // Lets the transfer loop drain what is queued and exit.
        handoff_.close();
        return;
      }
      if (!handoff_.push(std::move(sample), st)) return;
    }
  }
}

void RotatingPool::transfer_loop_(std::stop_token st) {
  while (!st.stop_requested()) {
    auto sample = handoff_.pop(st);
    if (!sample) return;
    store_(next_slot_, std::move(*sample));
    next_slot_ = (next_slot_ + 1) % slots_.size();
    transfers_.fetch_add(1, std::memory_order_relaxed);
  }
}

void RotatingPool::store_(std::size_t slot, SamplePtr sample) {
  Slot& s = slots_[slot];
  std::lock_guard<std::mutex> lock(s.mu);
  s.sample = std::move(sample);
  ++s.version;
}

} // namespace probegraph::data
