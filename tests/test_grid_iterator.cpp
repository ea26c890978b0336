#include "probegraph/grid/GridIterator.hpp"
#include "probegraph/grid/GridSlice.hpp"
#include "probegraph/grid/OrderedWorkerPool.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_utils.hpp"

using namespace probegraph;
using namespace probegraph::grid;
using probegraph::testing::throws;

// ============================================================================
// Slicing
// ============================================================================

bool test_slices_partition_grid() {
  TEST_START("Slices partition the flat grid");

  for (std::size_t total : {1u, 7u, 64u, 1000u}) {
    for (std::size_t pc : {1u, 3u, 64u, 5000u}) {
      const std::size_t n = num_slices(total, pc);
      if (n != (total + pc - 1) / pc) TEST_FAIL("num_slices wrong");
      std::size_t expect_begin = 0;
      for (std::size_t k = 0; k < n; ++k) {
        const SliceRange r = slice_range(k, total, pc);
        if (r.begin != expect_begin) TEST_FAIL("gap or overlap at slice " + std::to_string(k));
        if (r.size() == 0 || r.size() > pc) TEST_FAIL("bad slice size");
        expect_begin = r.end;
      }
      if (expect_begin != total) TEST_FAIL("slices do not cover the grid");
    }
  }
  if (num_slices(0, 10) != 0) TEST_FAIL("empty grid should have no slices");
  if (!throws<std::out_of_range>([] { (void)slice_range(3, 30, 10); })) TEST_FAIL("out of range slice accepted");
  if (!throws<std::invalid_argument>([] { (void)num_slices(10, 0); })) TEST_FAIL("zero probe_count accepted");

  TEST_PASS();
  return true;
}

bool test_slice_probe_counts() {
  TEST_START("Slice graph counts");

  const auto s = testing::random_structure(10, 6.0, 6.0, 6.0, true, 3);
  const Sample sample = testing::make_test_sample(s, {5, 5, 5});
  const GridSlice last = static_get_slice(2, sample.structure, sample.grid_positions, 50, 2.0);
  if (last.num_probes != 25) TEST_FAIL("last slice should hold 25 probes");
  if (last.num_probe_edges != last.probe_edges.size()) TEST_FAIL("cached edge count stale");
  for (const auto& e : last.probe_edges.edges) {
    if (e[1] < 0 || e[1] >= 25) TEST_FAIL("probe index not local to the slice");
  }

  TEST_PASS();
  return true;
}

// ============================================================================
// Ordered worker pool
// ============================================================================

bool test_in_order_despite_reverse_completion() {
  TEST_START("Results delivered in order when completed in reverse");

  const std::size_t n = 8;
  std::mutex mu;
  std::condition_variable cv;
  std::vector<bool> done(n + 1, false);
  done[n] = true;  // sentinel: the last item may finish at once
  std::vector<std::size_t> completion;

  OrderedWorkerPoolOptions opts;
  opts.num_workers = n;  // every item runs concurrently
  opts.idle_timeout = std::chrono::milliseconds(200);
  OrderedWorkerPool<std::size_t> pool(
      n,
      [&](std::size_t) {
        return [&](std::size_t i) {
          std::unique_lock<std::mutex> lock(mu);
          cv.wait(lock, [&] { return done[i + 1]; });
          done[i] = true;
          completion.push_back(i);
          cv.notify_all();
          return i * 10;
        };
      },
      opts);

  std::size_t expect = 0;
  while (auto v = pool.next()) {
    if (*v != expect * 10) TEST_FAIL("got " + std::to_string(*v) + ", expected " + std::to_string(expect * 10));
    ++expect;
  }
  if (expect != n) TEST_FAIL("delivered " + std::to_string(expect) + " of " + std::to_string(n));
  for (std::size_t k = 0; k < n; ++k) {
    if (completion[k] != n - 1 - k) TEST_FAIL("items did not complete in reverse");
  }
  if (pool.next().has_value()) TEST_FAIL("extra result after the end");

  TEST_PASS();
  return true;
}

bool test_task_exception_propagates() {
  TEST_START("Task exception is rethrown from next()");

  OrderedWorkerPoolOptions opts;
  opts.num_workers = 3;
  opts.idle_timeout = std::chrono::milliseconds(200);
  OrderedWorkerPool<int> pool(
      20,
      [](std::size_t) {
        return [](std::size_t i) -> int {
          if (i == 5) throw std::runtime_error("slice 5 failed");
          return static_cast<int>(i);
        };
      },
      opts);

  bool caught = false;
  std::size_t got = 0;
  try {
    while (auto v = pool.next()) {
      if (*v != static_cast<int>(got)) TEST_FAIL("out of order before the failure");
      ++got;
    }
  } catch (const std::runtime_error& e) {
    caught = std::string(e.what()) == "slice 5 failed";
  }
  if (!caught) TEST_FAIL("failure was not rethrown");
  if (got > 5) TEST_FAIL("items past the failure were delivered");

  TEST_PASS();
  return true;
}

bool test_factory_exception_propagates() {
  TEST_START("Worker setup failure is rethrown from next()");

  OrderedWorkerPoolOptions opts;
  opts.num_workers = 2;
  opts.idle_timeout = std::chrono::milliseconds(200);
  OrderedWorkerPool<int> pool(
      4,
      [](std::size_t) -> OrderedWorkerPool<int>::Task { throw std::runtime_error("setup failed"); },
      opts);
  if (!throws<std::runtime_error>([&] { (void)pool.next(); })) TEST_FAIL("setup failure swallowed");

  TEST_PASS();
  return true;
}

bool test_stop_before_end() {
  TEST_START("Stopping an unfinished pool does not hang");

  std::atomic<std::size_t> computed{0};
  {
    OrderedWorkerPoolOptions opts;
    opts.num_workers = 4;
    opts.result_capacity = 2;
    OrderedWorkerPool<std::size_t> pool(
        1000,
        [&](std::size_t) {
          return [&](std::size_t i) {
            computed.fetch_add(1);
            return i;
          };
        },
        opts);
    (void)pool.next();
    (void)pool.next();
    pool.stop();
    pool.stop();
  }
  if (computed.load() >= 1000) TEST_FAIL("workers ran to completion despite stop");

  TEST_PASS();
  return true;
}

// ============================================================================
// Grid iterator
// ============================================================================

bool test_iterator_matches_get_slice() {
  TEST_START("Iterator yields every slice in order");

  const auto s = testing::random_structure(15, 7.0, 7.0, 7.0, true, 17);
  auto sample = std::make_shared<const Sample>(testing::make_test_sample(s, {6, 6, 6}));
  GridIteratorOptions opts;
  opts.num_workers = 3;
  opts.idle_timeout = std::chrono::milliseconds(500);
  GridIterator it(sample, false, 40, 2.5, opts);
  if (it.num_slices() != 6) TEST_FAIL("expected 6 slices, got " + std::to_string(it.num_slices()));

  std::size_t k = 0, probes = 0;
  it.start();
  while (auto slice = it.next()) {
    if (slice->slice_index != k) TEST_FAIL("slice " + std::to_string(slice->slice_index) + " out of order");
    auto got = slice->probe_edges.edges;
    auto ref = it.get_slice(k).probe_edges.edges;
    std::sort(got.begin(), got.end());
    std::sort(ref.begin(), ref.end());
    if (got != ref) TEST_FAIL("slice " + std::to_string(k) + " differs");
    probes += slice->num_probes;
    ++k;
  }
  if (k != 6 || probes != 216) TEST_FAIL("incomplete pass");

  TEST_PASS();
  return true;
}

bool test_iterator_degrades_without_index() {
  TEST_START("Workers whose index build fails still deliver every slice");

  const auto s = testing::random_structure(15, 7.0, 7.0, 7.0, true, 23);
  auto sample = std::make_shared<const Sample>(testing::make_test_sample(s, {5, 5, 5}));
  auto attempts = std::make_shared<std::atomic<int>>(0);
  GridIteratorOptions opts;
  opts.num_workers = 3;
  opts.idle_timeout = std::chrono::milliseconds(500);
  opts.index_builder = [attempts](const AtomicStructure&, double) -> std::unique_ptr<neighbor::NeighborIndex> {
    attempts->fetch_add(1);
    throw std::runtime_error("out of memory for bins");
  };
  GridIterator it(sample, false, 30, 2.5, opts);

  std::size_t k = 0, probes = 0;
  it.start();
  while (auto slice = it.next()) {
    if (slice->slice_index != k) TEST_FAIL("slice " + std::to_string(slice->slice_index) + " out of order");
    auto got = slice->probe_edges.edges;
    auto ref = it.get_slice(k).probe_edges.edges;
    std::sort(got.begin(), got.end());
    std::sort(ref.begin(), ref.end());
    if (got != ref) TEST_FAIL("slice " + std::to_string(k) + " differs");
    probes += slice->num_probes;
    ++k;
  }
  if (k != it.num_slices() || probes != 125) TEST_FAIL("incomplete pass");
  if (attempts->load() != 3) TEST_FAIL("expected one build attempt per worker");
  if (it.degraded_workers() != 3) TEST_FAIL("degraded workers not reported");

  TEST_PASS();
  return true;
}

bool test_iterator_ignore_pbc() {
  TEST_START("ignore_pbc clones the structure without periodicity");

  const auto s = testing::random_structure(5, 7.0, 7.0, 7.0, true, 1);
  auto sample = std::make_shared<const Sample>(testing::make_test_sample(s, {2, 2, 2}));
  const GridIterator periodic(sample, false, 4, 2.0);
  const GridIterator open(sample, true, 4, 2.0);
  if (!periodic.structure().cell.any_pbc()) TEST_FAIL("periodicity lost");
  if (open.structure().cell.any_pbc()) TEST_FAIL("periodicity kept");
  if (!sample->structure.cell.any_pbc()) TEST_FAIL("sample was modified");

  TEST_PASS();
  return true;
}

int main() {
  std::cout << "\n";
  std::cout << "=========================================\n";
  std::cout << "  Grid Slicing / Iterator Unit Tests\n";
  std::cout << "=========================================\n\n";

  bool all_passed = true;

  std::cout << "Category 1: Slicing\n";
  std::cout << "-------------------------------------\n";
  all_passed &= test_slices_partition_grid();
  all_passed &= test_slice_probe_counts();
  std::cout << "\n";

  std::cout << "Category 2: Ordered worker pool\n";
  std::cout << "-------------------------------------\n";
  all_passed &= test_in_order_despite_reverse_completion();
  all_passed &= test_task_exception_propagates();
  all_passed &= test_factory_exception_propagates();
  all_passed &= test_stop_before_end();
  std::cout << "\n";

  std::cout << "Category 3: Grid iterator\n";
  std::cout << "-------------------------------------\n";
  all_passed &= test_iterator_matches_get_slice();
  all_passed &= test_iterator_degrades_without_index();
  all_passed &= test_iterator_ignore_pbc();
  std::cout << "\n";

  std::cout << (all_passed ? "All tests passed.\n" : "Some tests FAILED.\n");
  return all_passed ? 0 : 1;
}
