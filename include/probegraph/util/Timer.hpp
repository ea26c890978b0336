#pragma once

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace probegraph {

class WallTimer {
public:
  using clock = std::chrono::steady_clock;

  WallTimer() : t0_(clock::now()) {}

  void reset() { t0_ = clock::now(); }

  double elapsed_seconds() const {
    return std::chrono::duration<double>(clock::now() - t0_).count();
  }

private:
  clock::time_point t0_;
};

// Running last/mean of a timing series, printed as "name last (mean)".
class AverageMeter {
public:
  explicit AverageMeter(std::string name) : name_(std::move(name)) {}

  void reset() {
    last_ = 0.0;
    sum_ = 0.0;
    count_ = 0;
  }

  void update(double value, std::size_t n = 1) {
    last_ = value;
    sum_ += value * static_cast<double>(n);
    count_ += n;
  }

  double last() const { return last_; }
  double mean() const { return count_ ? sum_ / static_cast<double>(count_) : 0.0; }
  std::size_t count() const { return count_; }

  std::string str() const {
    std::ostringstream oss;
    oss << name_ << ' ' << std::fixed << std::setprecision(4) << last_ << " (" << mean() << ")";
    return oss.str();
  }

private:
  std::string name_;
  double last_ = 0.0;
  double sum_ = 0.0;
  std::size_t count_ = 0;
};

// Adds the scope's wall time to an AverageMeter on exit.
class ScopedTimer {
public:
  explicit ScopedTimer(AverageMeter* meter) : meter_(meter) {}
  ~ScopedTimer() {
    if (meter_) meter_->update(t_.elapsed_seconds());
  }

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
  AverageMeter* meter_ = nullptr;
  WallTimer t_;
};

} // namespace probegraph
