#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "probegraph/util/BlockingQueue.hpp"

namespace probegraph::grid {

struct OrderedWorkerPoolOptions {
  std::size_t num_workers = 6;
  // A worker exits once the work queue has stayed empty this long.
  std::chrono::milliseconds idle_timeout{10000};
  std::size_t result_capacity = 100;
};

// Computes items 0..n-1 on a fixed set of worker threads and hands the results
// to a single consumer strictly in index order.
//
// Each worker obtains its own task from the factory once at startup (this is
// where per-worker state such as a neighbor index is built), then pulls indices
// from the shared work queue. Completed items go through a bounded result
// channel; next() parks out-of-order results in a reorder buffer until the
// expected index arrives.
//
// An exception thrown by a task (or by the factory) is forwarded to the
// consumer and rethrown from next(); the pool is stopped at that point.
template <class Result>
class OrderedWorkerPool {
public:
  using Task = std::function<Result(std::size_t)>;
  using TaskFactory = std::function<Task(std::size_t worker_id)>;

  OrderedWorkerPool(std::size_t num_items, TaskFactory factory, OrderedWorkerPoolOptions opts = {})
      : num_items_(num_items),
        factory_(std::move(factory)),
        opts_(opts),
        results_(opts.result_capacity) {
    if (!factory_) throw std::invalid_argument("OrderedWorkerPool: task factory is empty");
    if (opts_.num_workers == 0) throw std::invalid_argument("OrderedWorkerPool: num_workers must be positive");
  }

  ~OrderedWorkerPool() { stop(); }

  OrderedWorkerPool(const OrderedWorkerPool&) = delete;
  OrderedWorkerPool& operator=(const OrderedWorkerPool&) = delete;

  std::size_t size() const { return num_items_; }
  std::size_t delivered() const { return next_index_; }
  std::size_t buffered() const { return finished_.size(); }
  bool started() const { return started_; }

  // Queues every index, then launches the workers.
  void start() {
    if (started_) throw std::logic_error("OrderedWorkerPool: already started");
    started_ = true;
    for (std::size_t i = 0; i < num_items_; ++i) work_.push(i);
    // No more work will arrive: workers drain the queue and exit without
    // waiting out the idle timeout.
    work_.close();
    const std::size_t nw = std::min(opts_.num_workers, std::max<std::size_t>(num_items_, 1));
    workers_.reserve(nw);
    for (std::size_t w = 0; w < nw; ++w) {
      workers_.emplace_back([this, w](std::stop_token st) { worker_loop_(st, w); });
    }
  }

  // Next result in index order, or std::nullopt once all items were delivered.
  std::optional<Result> next() {
    if (!started_) start();
    if (next_index_ >= num_items_) {
      join_();
      return std::nullopt;
    }

    const std::size_t want = next_index_;
    while (finished_.find(want) == finished_.end()) {
      auto done = results_.pop(stop_.get_token());
      if (!done) {
        throw std::runtime_error("OrderedWorkerPool: result channel closed while waiting for item " +
                                 std::to_string(want));
      }
      if (done->error) {
        stop();
        std::rethrow_exception(done->error);
      }
      finished_.emplace(done->index, std::move(*done->value));
    }

    auto node = finished_.extract(want);
    ++next_index_;
    return std::move(node.mapped());
  }

  // Cancels the workers and joins them. Safe to call more than once.
  void stop() {
    stop_.request_stop();
    work_.close();
    results_.close();
    join_();
  }

private:
  static constexpr std::size_t kNoIndex = std::numeric_limits<std::size_t>::max();

  struct Completed {
    std::size_t index = kNoIndex;
    std::optional<Result> value;
    std::exception_ptr error;
  };

  std::size_t num_items_ = 0;
  TaskFactory factory_;
  OrderedWorkerPoolOptions opts_;

  BlockingQueue<std::size_t> work_;
  BlockingQueue<Completed> results_;
  std::stop_source stop_;
  std::vector<std::jthread> workers_;
  bool started_ = false;

  std::map<std::size_t, Result> finished_;
  std::size_t next_index_ = 0;

  void worker_loop_(std::stop_token st, std::size_t worker_id) {
    Task task;
    try {
      task = factory_(worker_id);
    } catch (...) {
      Completed c;
      c.error = std::current_exception();
      // A false return means the pool is already stopping.
      (void)results_.push(std::move(c), stop_.get_token());
      return;
    }

    while (!st.stop_requested() && !stop_.stop_requested()) {
      auto idx = work_.pop_for(opts_.idle_timeout, stop_.get_token());
      if (!idx) break;
      Completed c;
      c.index = *idx;
      try {
        c.value.emplace(task(*idx));
      } catch (...) {
        c.error = std::current_exception();
      }
      if (!results_.push(std::move(c), stop_.get_token())) break;
    }
  }

  void join_() {
    for (auto& w : workers_) {
      if (w.joinable()) w.join();
    }
    workers_.clear();
  }
};

} // namespace probegraph::grid
