#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>

#include "probegraph/config/IniConfig.hpp"

namespace probegraph {

// Everything the driver reads from the config file, validated.
struct RunSettings {
  std::filesystem::path archive;

  double cutoff = 4.0;
  std::size_t num_probes = 1000;
  bool ignore_pbc = false;

  std::size_t pool_size = 20;
  std::uint64_t seed = 0;

  std::size_t batch_size = 2;
  std::size_t num_batches = 10;
  double validation_fraction = 0.05;
  std::size_t log_interval = 1;

  bool grid_enabled = false;
  std::size_t grid_member = 0;
  std::size_t grid_probe_count = 5000;
  std::size_t grid_workers = 6;
  std::chrono::milliseconds grid_idle_timeout{10000};
};

RunSettings load_run_settings(const IniConfig& cfg);

// Runner: main() only handles CLI + config, then calls Runner(cfg).run().
//
// The sampling pass splits the archive into training and validation sets,
// keeps a rotating pool over the training set and collates random-probe
// batches from it. The optional grid pass streams the full probe grid of one
// archive member through the ordered worker pool.
class Runner {
public:
  explicit Runner(const IniConfig& cfg);

  // Execute the run. Returns 0 on success.
  int run();

  // Parse and check the config, index the archive, and stop
  // (CLI: --validate-config).
  int validate_config();

  // Print one line per archive member: index, payload bytes, reader, name
  // (CLI: --list-members).
  int list_members(std::ostream& os);

  const RunSettings& settings() const { return settings_; }

private:
  const IniConfig& cfg_;
  RunSettings settings_;

  int run_impl_(bool validate_only);
};

} // namespace probegraph
