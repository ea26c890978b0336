#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

namespace probegraph::data {

// Draws batches of indices from 0..n-1: a fresh random permutation per
// epoch, consumed batch_size at a time (the last batch of an epoch may be
// shorter). Epochs run back to back forever.
class RandomBatchSampler {
public:
  RandomBatchSampler(std::size_t n, std::size_t batch_size, std::uint64_t seed)
      : n_(n), batch_size_(batch_size), rng_(seed), perm_(n) {
    if (n_ == 0) throw std::invalid_argument("RandomBatchSampler: empty index range");
    if (batch_size_ == 0) throw std::invalid_argument("RandomBatchSampler: batch_size must be positive");
    std::iota(perm_.begin(), perm_.end(), std::size_t{0});
    pos_ = n_;
  }

  std::vector<std::size_t> next() {
    if (pos_ >= n_) {
      std::shuffle(perm_.begin(), perm_.end(), rng_);
      pos_ = 0;
      ++epoch_;
    }
    const std::size_t end = std::min(pos_ + batch_size_, n_);
    std::vector<std::size_t> out(perm_.begin() + static_cast<std::ptrdiff_t>(pos_),
                                 perm_.begin() + static_cast<std::ptrdiff_t>(end));
    pos_ = end;
    return out;
  }

  // Number of epochs started so far.
  std::size_t epoch() const { return epoch_; }

private:
  std::size_t n_;
  std::size_t batch_size_;
  std::mt19937_64 rng_;
  std::vector<std::size_t> perm_;
  std::size_t pos_ = 0;
  std::size_t epoch_ = 0;
};

} // namespace probegraph::data
