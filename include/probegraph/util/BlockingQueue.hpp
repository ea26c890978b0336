#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace probegraph {

// Bounded multi-producer / multi-consumer FIFO.
//
// - capacity 0 means unbounded.
// - push blocks while full, pop blocks while empty.
// - close() wakes every waiter: push then fails, pop drains what is left and
//   then returns std::nullopt.
// - The stop_token overloads also return early (false / nullopt) once a stop
//   is requested.
template <class T>
class BlockingQueue {
public:
  explicit BlockingQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  BlockingQueue(const BlockingQueue&) = delete;
  BlockingQueue& operator=(const BlockingQueue&) = delete;

  bool push(T value) { return push(std::move(value), std::stop_token{}); }

  bool push(T value, std::stop_token st) {
    std::unique_lock<std::mutex> lock(mu_);
    const bool ok = not_full_.wait(lock, st, [&] { return closed_ || !full_(); });
    if (!ok || closed_) return false;
    items_.push_back(std::move(value));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  std::optional<T> pop() { return pop(std::stop_token{}); }

  std::optional<T> pop(std::stop_token st) {
    std::unique_lock<std::mutex> lock(mu_);
    not_empty_.wait(lock, st, [&] { return closed_ || !items_.empty(); });
    return take_(lock);
  }

  // Waits at most `timeout` for an item.
  template <class Rep, class Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout, std::stop_token st = {}) {
    std::unique_lock<std::mutex> lock(mu_);
    not_empty_.wait_for(lock, st, timeout, [&] { return closed_ || !items_.empty(); });
    return take_(lock);
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return items_.size();
  }

private:
  std::size_t capacity_ = 0;
  mutable std::mutex mu_;
  std::condition_variable_any not_empty_;
  std::condition_variable_any not_full_;
  std::deque<T> items_;
  bool closed_ = false;

  bool full_() const { return capacity_ != 0 && items_.size() >= capacity_; }

  std::optional<T> take_(std::unique_lock<std::mutex>& lock) {
    if (items_.empty()) return std::nullopt;
    std::optional<T> out(std::move(items_.front()));
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return out;
  }
};

} // namespace probegraph
