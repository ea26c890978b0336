#include "probegraph/app/Runner.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#if PROBEGRAPH_HAS_OPENMP
#include <omp.h>
#endif

#include "probegraph/batch/CollateFunctions.hpp"
#include "probegraph/data/DensityArchive.hpp"
#include "probegraph/data/Dataset.hpp"
#include "probegraph/data/RotatingPool.hpp"
#include "probegraph/data/Sampler.hpp"
#include "probegraph/grid/GridIterator.hpp"
#include "probegraph/util/Timer.hpp"

namespace fs = std::filesystem;

namespace {
volatile std::sig_atomic_t g_stop = 0;
void handle_signal(int) { g_stop = 1; }

// seed 0 = nondeterministic.
std::uint64_t resolve_seed(std::uint64_t seed) {
  if (seed != 0) return seed;
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

// splitmix64 step so the split, collate, pool and sampler streams differ.
std::uint64_t derive_seed(std::uint64_t base, std::uint64_t stream) {
  std::uint64_t z = base + stream * 0x9e3779b97f4a7c15ULL;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  z ^= z >> 31;
  return z == 0 ? 1 : z;
}

struct BatchTotals {
  std::size_t batches = 0;
  std::size_t nodes = 0;
  std::size_t atom_edges = 0;
  std::size_t probe_edges = 0;
  std::size_t probes = 0;

  void add(const probegraph::batch::Batch& b) {
    ++batches;
    nodes += b.nodes.size();
    atom_edges += b.atom_edges.size();
    probe_edges += b.probe_edges.size();
    probes += b.probe_target.size();
  }
};

void print_settings(const probegraph::RunSettings& s) {
  std::cerr << "[probegraph] archive=" << s.archive.string() << "\n"
            << "         cutoff=" << s.cutoff << " num_probes=" << s.num_probes
            << " ignore_pbc=" << (s.ignore_pbc ? "true" : "false") << "\n"
            << "         pool_size=" << s.pool_size << " seed=" << s.seed << " batch_size=" << s.batch_size
            << " num_batches=" << s.num_batches << " validation_fraction=" << s.validation_fraction << "\n";
  if (s.grid_enabled) {
    std::cerr << "         grid: member=" << s.grid_member << " probe_count=" << s.grid_probe_count
              << " workers=" << s.grid_workers << " idle_timeout_ms=" << s.grid_idle_timeout.count() << "\n";
  }
}

} // namespace

namespace probegraph {

RunSettings load_run_settings(const IniConfig& cfg) {
  cfg.require_known_keys("input", {"archive"});
  cfg.require_known_keys("graph", {"cutoff", "num_probes", "ignore_pbc"});
  cfg.require_known_keys("pool", {"size", "seed"});
  cfg.require_known_keys("sampling", {"batch_size", "num_batches", "validation_fraction", "log_interval"});
  cfg.require_known_keys("grid", {"enabled", "member", "probe_count", "workers", "idle_timeout_s"});

  RunSettings s;
  s.archive = cfg.get_path("input", "archive");

  s.cutoff = cfg.get_positive_double("graph", "cutoff", s.cutoff);
  s.num_probes = cfg.get_size("graph", "num_probes", s.num_probes);
  s.ignore_pbc = cfg.get_bool("graph", "ignore_pbc", s.ignore_pbc);

  s.pool_size = cfg.get_positive_size("pool", "size", s.pool_size);
  s.seed = cfg.get_uint64("pool", "seed", s.seed);

  s.batch_size = cfg.get_positive_size("sampling", "batch_size", s.batch_size);
  s.num_batches = cfg.get_size("sampling", "num_batches", s.num_batches);
  s.validation_fraction = cfg.get_double("sampling", "validation_fraction", s.validation_fraction);
  if (!(s.validation_fraction >= 0.0 && s.validation_fraction < 1.0)) {
    throw std::runtime_error("sampling.validation_fraction must be in [0, 1)");
  }
  s.log_interval = cfg.get_positive_size("sampling", "log_interval", s.log_interval);

  s.grid_enabled = cfg.get_bool("grid", "enabled", s.grid_enabled);
  s.grid_member = cfg.get_size("grid", "member", s.grid_member);
  s.grid_probe_count = cfg.get_positive_size("grid", "probe_count", s.grid_probe_count);
  s.grid_workers = cfg.get_positive_size("grid", "workers", s.grid_workers);
  const double idle_s = cfg.get_positive_double("grid", "idle_timeout_s", 10.0);
  s.grid_idle_timeout = std::chrono::milliseconds(static_cast<std::int64_t>(idle_s * 1000.0));
  return s;
}

Runner::Runner(const IniConfig& cfg) : cfg_(cfg), settings_(load_run_settings(cfg)) {}

int Runner::run() {
  return run_impl_(false);
}

int Runner::validate_config() {
  return run_impl_(true);
}

int Runner::list_members(std::ostream& os) {
  if (!fs::exists(settings_.archive)) {
    throw std::runtime_error("input archive not found: " + settings_.archive.string());
  }
  const data::DensityArchive archive(settings_.archive);
  for (std::size_t i = 0; i < archive.size(); ++i) {
    const auto& m = archive.archive().member(i);
    os << i << "\t" << m.size << "\t" << data::density_format_name(m.name) << "\t" << m.name << "\n";
  }
  return 0;
}

int Runner::run_impl_(bool validate_only) {
  WallTimer total_timer;
  const RunSettings& s = settings_;
  print_settings(s);

  if (!fs::exists(s.archive)) {
    throw std::runtime_error("input archive not found: " + s.archive.string());
  }
  auto archive = std::make_shared<const data::DensityArchive>(s.archive);
  if (archive->size() == 0) throw std::runtime_error("input archive has no members: " + s.archive.string());
  if (s.grid_enabled && s.grid_member >= archive->size()) {
    throw std::runtime_error("grid.member " + std::to_string(s.grid_member) + " out of range (archive has " +
                             std::to_string(archive->size()) + " members)");
  }

  if (validate_only) {
    std::cerr << "[probegraph] validation OK (no samples processed)\n"
              << "         config=" << cfg_.file_path().string() << " members=" << archive->size() << "\n";
    return 0;
  }

  g_stop = 0;
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

#if PROBEGRAPH_HAS_OPENMP
  std::cerr << "[probegraph] OpenMP threads: " << omp_get_max_threads() << "\n";
#endif

  const std::uint64_t base_seed = resolve_seed(s.seed);

  // --- Split ---
  std::mt19937_64 split_rng(derive_seed(base_seed, 1));
  data::DataSplit split = data::random_split(archive->size(), s.validation_fraction, split_rng);
  if (split.train.empty()) throw std::runtime_error("training split is empty; lower sampling.validation_fraction");
  std::cerr << "[probegraph] split: train=" << split.train.size() << " validation=" << split.validation.size()
            << "\n";

  auto train = std::make_shared<const data::SubsetDataset>(archive, std::move(split.train));
  batch::CollateRandomSample collate(s.cutoff, s.num_probes, s.ignore_pbc, derive_seed(base_seed, 2));

  // --- Validation batches (loaded once) ---
  std::vector<batch::Batch> val_batches;
  if (!split.validation.empty()) {
    std::cerr << "[probegraph] preloading validation batches\n";
    const data::SubsetDataset val_view(archive, std::move(split.validation));
    const data::BufferDataset val(val_view);
    for (std::size_t b = 0; b < val.size(); b += s.batch_size) {
      std::vector<data::SamplePtr> samples;
      for (std::size_t i = b; i < std::min(b + s.batch_size, val.size()); ++i) samples.push_back(val.at(i));
      val_batches.push_back(collate(samples));
    }
  }

  // --- Sampling pass ---
  data::RotatingPoolOptions pool_opts;
  pool_opts.seed = derive_seed(base_seed, 3);
  data::RotatingPool pool(train, s.pool_size, pool_opts);
  data::RandomBatchSampler sampler(pool.size(), s.batch_size, derive_seed(base_seed, 4));

  AverageMeter data_timer("data_timer");
  AverageMeter collate_timer("collate_timer");
  BatchTotals totals;
  for (std::size_t step = 0; step < s.num_batches && !g_stop; ++step) {
    std::vector<data::SamplePtr> samples;
    {
      ScopedTimer t(&data_timer);
      for (std::size_t i : sampler.next()) samples.push_back(pool.at(i));
    }
    batch::Batch b;
    {
      ScopedTimer t(&collate_timer);
      b = collate(samples);
    }
    totals.add(b);
    if ((step + 1) % s.log_interval == 0 || step + 1 == s.num_batches) {
      std::cerr << "[probegraph] step=" << step << " nodes=" << b.nodes.size() << " atom_edges=" << b.atom_edges.size()
                << " probe_edges=" << b.probe_edges.size() << " " << data_timer.str() << " " << collate_timer.str()
                << "\n";
    }
  }
  pool.stop();
  pool.rethrow_if_failed();

  std::cout << "sampling: batches=" << totals.batches << " nodes=" << totals.nodes
            << " atom_edges=" << totals.atom_edges << " probe_edges=" << totals.probe_edges
            << " probes=" << totals.probes << " validation_batches=" << val_batches.size()
            << " pool_transfers=" << pool.transfers() << "\n";

  // --- Grid pass ---
  if (s.grid_enabled && !g_stop) {
    WallTimer grid_timer;
    auto sample = archive->at(s.grid_member);
    grid::GridIteratorOptions go;
    go.num_workers = s.grid_workers;
    go.idle_timeout = s.grid_idle_timeout;
    grid::GridIterator it(sample, s.ignore_pbc, s.grid_probe_count, s.cutoff, go);
    std::cerr << "[probegraph] grid pass over '" << sample->metadata.source_name << "': "
              << sample->grid_positions.size() << " points in " << it.num_slices() << " slices\n";

    std::size_t slices = 0, probes = 0, probe_edges = 0;
    it.start();
    while (auto slice = it.next()) {
      if (g_stop) {
        it.stop();
        break;
      }
      ++slices;
      probes += slice->num_probes;
      probe_edges += slice->num_probe_edges;
    }
    if (!g_stop && probes != sample->grid_positions.size()) {
      throw std::runtime_error("grid pass covered " + std::to_string(probes) + " of " +
                               std::to_string(sample->grid_positions.size()) + " grid points");
    }
    std::cout << "grid: member=" << s.grid_member << " slices=" << slices << " probes=" << probes
              << " probe_edges=" << probe_edges << " degraded_workers=" << it.degraded_workers() << " seconds=" << std::setprecision(6)
              << grid_timer.elapsed_seconds() << "\n";
  }

  if (g_stop) std::cerr << "[probegraph] interrupted; stopped early\n";
  std::cerr << "[probegraph] profiling\n"
            << "  wall_seconds: " << std::setprecision(6) << total_timer.elapsed_seconds() << "\n"
            << "  " << data_timer.str() << "\n"
            << "  " << collate_timer.str() << "\n";
  return 0;
}

} // namespace probegraph
