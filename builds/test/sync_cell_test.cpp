#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mvar/mvar.hpp"

using namespace mvar;
using namespace std::chrono_literals;

// =============================================================================
// Test Counters
// =============================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try

#define PASS()                                                                 \
  std::cout << "PASSED" << std::endl;                                          \
  ++tests_passed

#define FAIL(msg)                                                              \
  std::cout << "FAILED: " << msg << std::endl;                                 \
  ++tests_failed

// Polls until another thread has reached the expected cell state
template <typename Pred> void wait_until(Pred pred) {
  while (!pred()) {
    std::this_thread::sleep_for(1ms);
  }
}

// Value whose copy constructor throws once copies_until_failure copies have
// succeeded. Negative: never throws. Moves never throw.
struct fragile {
  static inline int copies_until_failure = -1;

  int value;

  explicit fragile(int v) : value(v) {}

  fragile(const fragile &other) : value(other.value) {
    if (copies_until_failure == 0) {
      throw std::runtime_error("copy failed");
    }
    if (copies_until_failure > 0) {
      --copies_until_failure;
    }
  }

  fragile(fragile &&) noexcept = default;
  fragile &operator=(const fragile &) = default;
  fragile &operator=(fragile &&) noexcept = default;
};

// =============================================================================
// Basic Transitions
// =============================================================================

void test_basic_transitions() {
  TEST("take on a full cell") {
    sync_cell<int> cell(7);

    assert(!cell.is_empty());
    assert(cell.take() == 7);
    assert(cell.is_empty());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("put then read does not consume") {
    sync_cell<int> cell;
    assert(cell.is_empty());

    cell.put(5);
    assert(!cell.is_empty());
    assert(cell.read() == 5);
    assert(cell.read() == 5);
    assert(cell.waiting_takers() == 0);
    assert(cell.waiting_putters() == 0);
    assert(cell.waiting_readers() == 0);

    assert(cell.take() == 5);
    assert(cell.is_empty());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("try operations never block") {
    sync_cell<std::string> cell;

    assert(!cell.try_take().has_value());
    assert(!cell.try_read().has_value());
    assert(cell.try_put("first"));
    assert(!cell.try_put("second")); // Full
    assert(cell.try_read() == "first");
    assert(cell.try_take() == "first");
    assert(!cell.try_take().has_value());
    assert(cell.is_empty());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Waiter Queues
// =============================================================================

void test_waiter_queues() {
  TEST("put hands its value to a waiting taker and keeps it") {
    sync_cell<int> cell;
    int received = 0;

    std::thread taker([&] { received = cell.take(); });
    wait_until([&] { return cell.waiting_takers() == 1; });

    cell.put(42);
    taker.join();

    assert(received == 42);
    assert(cell.waiting_takers() == 0);
    // The handoff does not clear the slot
    assert(!cell.is_empty());
    assert(cell.read() == 42);
    assert(cell.take() == 42);
    assert(cell.is_empty());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("takers are served in arrival order") {
    sync_cell<int> cell;
    int first = 0;
    int second = 0;

    std::thread t1([&] { first = cell.take(); });
    wait_until([&] { return cell.waiting_takers() == 1; });
    std::thread t2([&] { second = cell.take(); });
    wait_until([&] { return cell.waiting_takers() == 2; });

    cell.put(7);
    t1.join();
    assert(first == 7);
    assert(cell.waiting_takers() == 1); // t2 still parked

    // Drain the handed-off copy, then feed t2
    assert(cell.take() == 7);
    assert(cell.is_empty());
    cell.put(8);
    t2.join();
    assert(second == 8);
    assert(cell.try_take() == 8);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("take refills the slot from a waiting putter") {
    sync_cell<int> cell(1);

    std::thread putter([&] { cell.put(2); });
    wait_until([&] { return cell.waiting_putters() == 1; });

    assert(cell.take() == 1);
    putter.join();

    assert(cell.waiting_putters() == 0);
    assert(!cell.is_empty());
    assert(cell.take() == 2);
    assert(cell.is_empty());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("putters are served in arrival order") {
    sync_cell<int> cell(0);

    std::thread p1([&] { cell.put(1); });
    wait_until([&] { return cell.waiting_putters() == 1; });
    std::thread p2([&] { cell.put(2); });
    wait_until([&] { return cell.waiting_putters() == 2; });

    assert(cell.take() == 0);
    assert(cell.take() == 1);
    p1.join();
    assert(cell.take() == 2);
    p2.join();
    assert(cell.is_empty());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("only the head reader is woken per put") {
    sync_cell<int> cell;
    int r1 = 0;
    int r2 = 0;

    std::thread reader1([&] { r1 = cell.read(); });
    wait_until([&] { return cell.waiting_readers() == 1; });
    std::thread reader2([&] { r2 = cell.read(); });
    wait_until([&] { return cell.waiting_readers() == 2; });

    cell.put(5);
    reader1.join();
    assert(r1 == 5);
    assert(cell.waiting_readers() == 1);

    // reader2 needs another empty to full transition
    assert(cell.take() == 5);
    cell.put(6);
    reader2.join();
    assert(r2 == 6);
    assert(cell.waiting_readers() == 0);
    assert(cell.read() == 6);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("one put serves the head taker and the head reader") {
    sync_cell<int> cell;
    int taken = 0;
    int seen = 0;

    std::thread taker([&] { taken = cell.take(); });
    wait_until([&] { return cell.waiting_takers() == 1; });
    std::thread reader([&] { seen = cell.read(); });
    wait_until([&] { return cell.waiting_readers() == 1; });

    cell.put(9);
    taker.join();
    reader.join();

    assert(taken == 9);
    assert(seen == 9);
    assert(cell.try_read() == 9);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Copy Failures
// =============================================================================

void test_copy_failures() {
  TEST("throwing handoff copy leaves waiters queued") {
    sync_cell<fragile> cell;
    int taken = 0;
    int seen = 0;

    std::thread taker([&] { taken = cell.take().value; });
    wait_until([&] { return cell.waiting_takers() == 1; });
    std::thread reader([&] { seen = cell.read().value; });
    wait_until([&] { return cell.waiting_readers() == 1; });

    // The taker's copy succeeds, the reader's copy throws
    fragile::copies_until_failure = 1;
    bool threw = false;
    try {
      cell.put(fragile(5));
    } catch (const std::runtime_error &) {
      threw = true;
    }
    fragile::copies_until_failure = -1;

    assert(threw);
    assert(cell.is_empty());
    assert(cell.waiting_takers() == 1);
    assert(cell.waiting_readers() == 1);

    cell.put(fragile(6));
    taker.join();
    reader.join();

    assert(taken == 6);
    assert(seen == 6);
    assert(cell.waiting_takers() == 0);
    assert(cell.waiting_readers() == 0);
    assert(cell.take().value == 6);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("throwing read copy leaves the slot untouched") {
    sync_cell<fragile> cell(fragile(8));

    fragile::copies_until_failure = 0;
    bool threw = false;
    try {
      (void)cell.read();
    } catch (const std::runtime_error &) {
      threw = true;
    }
    fragile::copies_until_failure = -1;

    assert(threw);
    assert(!cell.is_empty());
    assert(cell.take().value == 8);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Composite Operations
// =============================================================================

void test_composites() {
  TEST("modify applies the function") {
    sync_cell<int> cell(0);

    cell.modify([](int x) { return x + 1; });
    cell.modify([](int x) { return x + 1; });

    assert(cell.take() == 2);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("modify keeps the slot empty while the function runs") {
    sync_cell<int> cell(0);
    int seen_by_second = -1;
    std::thread second;

    cell.modify([&](int x) {
      second = std::thread([&] {
        cell.modify([&](int y) {
          seen_by_second = y;
          return y + 1;
        });
      });
      wait_until([&] { return cell.waiting_takers() == 1; });
      assert(cell.is_empty());
      assert(!cell.try_read().has_value());
      return x + 1;
    });

    // put(1) handed 1 to the second modifier and kept it in the slot, so the
    // second modifier's put(2) parks until the next take.
    wait_until([&] { return cell.waiting_putters() == 1; });
    assert(seen_by_second == 1);
    assert(cell.read() == 1);

    assert(cell.take() == 1);
    second.join();
    assert(cell.waiting_putters() == 0);
    assert(cell.read() == 2);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("modify failure leaves the cell empty") {
    sync_cell<int> cell(3);

    bool threw = false;
    try {
      cell.modify([](int) -> int { throw std::runtime_error("modifier failed"); });
    } catch (const std::runtime_error &) {
      threw = true;
    }

    assert(threw);
    assert(cell.is_empty());
    assert(!cell.try_take().has_value());

    cell.put(4); // Caller restores
    assert(cell.read() == 4);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("modify_and_get, with_value and swap") {
    sync_cell<std::vector<int>> cell(std::vector<int>{1, 2});

    auto size = cell.modify_and_get([](std::vector<int> &v) {
      v.push_back(3);
      return v.size();
    });
    assert(size == 3);

    int sum = cell.with_value([](const std::vector<int> &v) {
      int s = 0;
      for (int x : v) {
        s += x;
      }
      return s;
    });
    assert(sum == 6);
    assert(cell.read().size() == 3);

    auto old = cell.swap(std::vector<int>{9});
    assert(old.size() == 3);
    assert(cell.take() == std::vector<int>{9});

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Threaded Use
// =============================================================================

template <typename Cell> bool conserves_values(Cell &cell) {
  constexpr int num_threads = 4;
  constexpr int iterations = 10000;
  std::atomic<long> put_sum{0};
  std::atomic<long> taken_sum{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < iterations; ++i) {
        long value = static_cast<long>(t) * iterations + i + 1;
        if (auto v = cell.try_take()) {
          taken_sum += *v;
        } else if (cell.try_put(value)) {
          put_sum += value;
        }
      }
    });
  }

  for (auto &t : threads) {
    t.join();
  }

  if (auto v = cell.try_take()) {
    taken_sum += *v;
  }
  return put_sum.load() == taken_sum.load() && cell.is_empty();
}

void test_threaded() {
  TEST("one-shot signal between threads") {
    blocking_cell<int> result;

    std::thread worker([&] {
      std::this_thread::sleep_for(10ms);
      result.put(6 * 7);
    });

    assert(result.take() == 42);
    worker.join();

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("concurrent try_put/try_take conserve values") {
    blocking_cell<long> cell;
    assert(conserves_values(cell));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("spinlock_policy cell conserves values") {
    fast_cell<long> cell;
    assert(conserves_values(cell));

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("shared cell outlives its creator scope") {
    std::shared_ptr<async_cell<int>> cell = new_empty_cell<int>();
    std::thread producer([cell] { cell->put(11); });

    assert(cell->take() == 11);
    producer.join();
    assert(new_cell(5)->read() == 5);

    std::shared_ptr<async_cell<int, spinlock_policy>> spinning =
        new_cell<int, spinlock_policy>(9);
    assert(spinning->take() == 9);
    assert(new_empty_cell<int, spinlock_policy>()->is_empty());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Concept Tests (compile-time)
// =============================================================================

void test_concepts() {
  TEST("concepts compilation") {
    static_assert(Lockable<std::mutex>);
    static_assert(Lockable<spinlock>);

    static_assert(CellLockPolicy<mutex_lock_policy>);
    static_assert(CellLockPolicy<spinlock_policy>);
    static_assert(CellLockPolicy<single_thread_policy>);

    static_assert(CellValue<int>);
    static_assert(CellValue<std::string>);
    static_assert(!CellValue<std::unique_ptr<int>>);

    static_assert(BlockingCell<sync_cell<int>, int>);
    static_assert(BlockingCell<fast_cell<int>, int>);
    static_assert(AsyncCell<async_cell<int>, int>);
    static_assert(!AsyncCell<sync_cell<int>, int>);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== Sync Cell Tests ===" << std::endl << std::endl;

  std::cout << "--- Basic Transitions ---" << std::endl;
  test_basic_transitions();
  std::cout << std::endl;

  std::cout << "--- Waiter Queues ---" << std::endl;
  test_waiter_queues();
  std::cout << std::endl;

  std::cout << "--- Copy Failures ---" << std::endl;
  test_copy_failures();
  std::cout << std::endl;

  std::cout << "--- Composite Operations ---" << std::endl;
  test_composites();
  std::cout << std::endl;

  std::cout << "--- Threaded Use ---" << std::endl;
  test_threaded();
  std::cout << std::endl;

  std::cout << "--- Concept Tests ---" << std::endl;
  test_concepts();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
