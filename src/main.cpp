#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#if PROBEGRAPH_HAS_OPENMP
#include <omp.h>
#endif

#include "probegraph/app/Runner.hpp"
#include "probegraph/config/IniConfig.hpp"
#include "probegraph/util/Parse.hpp"

#ifndef PROBEGRAPH_VERSION_STR
#define PROBEGRAPH_VERSION_STR "probegraph (unversioned)"
#endif

namespace fs = std::filesystem;

namespace {

enum class Mode { Run, ValidateConfig, ListMembers };

struct Options {
  fs::path config;
  int threads = 0; // 0 keeps the OpenMP default
  Mode mode = Mode::Run;
};

void usage(std::ostream& os, const char* argv0) {
  os << "Usage: " << argv0 << " --config <ini> [--threads N] [--validate-config | --list-members]\n"
     << "       " << argv0 << " --version\n"
     << "\n"
     << "  --config <ini>      run configuration; relative paths resolve against its directory\n"
     << "  --threads N         OpenMP threads for neighbor search\n"
     << "  --validate-config   check settings and index the archive, then exit\n"
     << "  --list-members      print the archive members and exit\n";
}

const char* next_value(int& i, int argc, char** argv) {
  const std::string flag = argv[i];
  if (i + 1 >= argc) throw std::runtime_error(flag + " requires a value");
  return argv[++i];
}

void set_mode(Options& opt, Mode m) {
  if (opt.mode != Mode::Run && opt.mode != m) {
    throw std::runtime_error("--validate-config and --list-members are exclusive");
  }
  opt.mode = m;
}

Options parse_options(int argc, char** argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      usage(std::cout, argv[0]);
      std::exit(0);
    }
    if (a == "--version") {
      std::cout << PROBEGRAPH_VERSION_STR << "\n";
      std::exit(0);
    }
    if (a == "--config") {
      opt.config = fs::path(next_value(i, argc, argv));
    } else if (a == "--threads") {
      const std::string v = next_value(i, argc, argv);
      if (!probegraph::parse_int(v, opt.threads) || opt.threads < 0) {
        throw std::runtime_error("--threads expects a non-negative integer, got '" + v + "'");
      }
    } else if (a == "--validate-config") {
      set_mode(opt, Mode::ValidateConfig);
    } else if (a == "--list-members") {
      set_mode(opt, Mode::ListMembers);
    } else {
      usage(std::cerr, argv[0]);
      throw std::runtime_error("unknown argument: " + a);
    }
  }
  if (opt.config.empty()) throw std::runtime_error("--config is required");
  return opt;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Options opt = parse_options(argc, argv);

#if PROBEGRAPH_HAS_OPENMP
    if (opt.threads > 0) omp_set_num_threads(opt.threads);
#else
    if (opt.threads > 1) std::cerr << "[probegraph] built without OpenMP; --threads ignored\n";
#endif

    const probegraph::IniConfig cfg(opt.config);
    probegraph::Runner runner(cfg);
    switch (opt.mode) {
      case Mode::ValidateConfig: return runner.validate_config();
      case Mode::ListMembers: return runner.list_members(std::cout);
      case Mode::Run: break;
    }
    return runner.run();
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
