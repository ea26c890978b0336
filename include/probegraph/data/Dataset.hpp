#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <memory>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "probegraph/core/Sample.hpp"

namespace probegraph::data {

using SamplePtr = std::shared_ptr<const Sample>;

// Indexable source of samples. at() may be slow (disk, parsing) and is called
// from background threads; implementations must be safe to call concurrently.
class Dataset {
public:
  virtual ~Dataset() = default;

  virtual std::size_t size() const = 0;
  virtual SamplePtr at(std::size_t i) const = 0;

protected:
  void check_index_(std::size_t i, const char* who) const {
    if (i >= size()) {
      throw std::out_of_range(std::string(who) + ": index " + std::to_string(i) + " out of range (size " +
                              std::to_string(size()) + ")");
    }
  }
};

// Loads every item of `parent` once at construction.
class BufferDataset final : public Dataset {
public:
  explicit BufferDataset(const Dataset& parent) {
    items_.reserve(parent.size());
    for (std::size_t i = 0; i < parent.size(); ++i) {
      items_.push_back(parent.at(i));
    }
    std::cerr << "[probegraph] buffered " << items_.size() << " samples\n";
  }

  std::size_t size() const override { return items_.size(); }

  SamplePtr at(std::size_t i) const override {
    check_index_(i, "BufferDataset");
    return items_[i];
  }

private:
  std::vector<SamplePtr> items_;
};

// View of `parent` restricted to `indices` (in that order).
class SubsetDataset final : public Dataset {
public:
  SubsetDataset(std::shared_ptr<const Dataset> parent, std::vector<std::size_t> indices)
      : parent_(std::move(parent)), indices_(std::move(indices)) {
    if (!parent_) throw std::invalid_argument("SubsetDataset: parent is null");
    const std::size_t n = parent_->size();
    for (std::size_t idx : indices_) {
      if (idx >= n) {
        throw std::out_of_range("SubsetDataset: parent index " + std::to_string(idx) + " out of range (size " +
                                std::to_string(n) + ")");
      }
    }
  }

  std::size_t size() const override { return indices_.size(); }

  SamplePtr at(std::size_t i) const override {
    check_index_(i, "SubsetDataset");
    return parent_->at(indices_[i]);
  }

  const std::vector<std::size_t>& indices() const { return indices_; }

private:
  std::shared_ptr<const Dataset> parent_;
  std::vector<std::size_t> indices_;
};

struct DataSplit {
  std::vector<std::size_t> train;
  std::vector<std::size_t> validation;
};

// Shuffles 0..n-1 and takes the first ceil(n * validation_fraction) indices
// for validation, the rest for training.
inline DataSplit random_split(std::size_t n, double validation_fraction, std::mt19937_64& rng) {
  if (!(validation_fraction >= 0.0 && validation_fraction <= 1.0)) {
    throw std::invalid_argument("random_split: validation_fraction must be in [0, 1]");
  }
  std::vector<std::size_t> perm(n);
  std::iota(perm.begin(), perm.end(), std::size_t{0});
  std::shuffle(perm.begin(), perm.end(), rng);

  const auto nval = std::min<std::size_t>(
      n, static_cast<std::size_t>(std::ceil(static_cast<double>(n) * validation_fraction)));
  DataSplit out;
  out.validation.assign(perm.begin(), perm.begin() + static_cast<std::ptrdiff_t>(nval));
  out.train.assign(perm.begin() + static_cast<std::ptrdiff_t>(nval), perm.end());
  return out;
}

} // namespace probegraph::data
