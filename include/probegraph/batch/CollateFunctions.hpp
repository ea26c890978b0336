#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>

#include "probegraph/batch/Collator.hpp"
#include "probegraph/data/Dataset.hpp"

namespace probegraph::batch {

// Turns a list of samples into one training batch: atom graph plus
// `num_probes` randomly drawn grid probes per sample.
//
// Not thread-safe (owns the probe RNG); give each consumer thread its own.
class CollateRandomSample {
public:
  // seed 0 = seed from std::random_device.
  CollateRandomSample(double cutoff, std::size_t num_probes, bool disable_pbc = false, std::uint64_t seed = 0);

  Batch operator()(std::span<const data::SamplePtr> samples);

  double cutoff() const { return cutoff_; }
  std::size_t num_probes() const { return num_probes_; }
  bool disable_pbc() const { return disable_pbc_; }

private:
  double cutoff_;
  std::size_t num_probes_;
  bool disable_pbc_;
  std::mt19937_64 rng_;
};

// Atoms-only batch (no probe fields).
class CollateAtoms {
public:
  explicit CollateAtoms(double cutoff, bool disable_pbc = false);

  Batch operator()(std::span<const data::SamplePtr> samples) const;

  double cutoff() const { return cutoff_; }
  bool disable_pbc() const { return disable_pbc_; }

private:
  double cutoff_;
  bool disable_pbc_;
};

} // namespace probegraph::batch
