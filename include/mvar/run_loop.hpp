#ifndef MVAR_RUN_LOOP_HPP
#define MVAR_RUN_LOOP_HPP

#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <memory_resource>
#include <mutex>
#include <utility>
#include <vector>

#include "coro_task.hpp"

/*
  The run loop is the cooperative host: one thread resumes ready coroutines
  strictly in the order they were posted. Any thread may post. A coroutine
  parked on a cell remembers the loop it suspended on and is posted back to
  that loop when the cell wakes it.

  Lifetime: the cell keeps a plain pointer to that loop. A loop must outlive
  every coroutine parked on a cell from it; destroying the loop while one is
  still queued leaves the next wakeup posting to a dead loop.
*/

namespace mvar {

class run_loop {
public:
  // Binds a loop as run_loop::current() for the enclosing scope.
  class scope {
  public:
    explicit scope(run_loop &loop) noexcept
        : previous_(std::exchange(current_, &loop)) {}
    ~scope() { current_ = previous_; }

    scope(const scope &) = delete;
    scope &operator=(const scope &) = delete;

  private:
    run_loop *previous_;
  };

  run_loop();
  ~run_loop();

  run_loop(const run_loop &) = delete;
  run_loop &operator=(const run_loop &) = delete;

  // Thread-safe
  void post(std::coroutine_handle<> handle);

  // Resume ready coroutines, including ones posted meanwhile, until none is
  // left. Returns how many were resumed.
  std::size_t run_until_idle();

  // Start task on this loop and drive the loop until it finishes. Waits for
  // posts from other threads while idle; a task that can never finish blocks
  // forever.
  template <typename T> T block_on(coro_task<T> task) {
    scope bound(*this);
    task.start();
    while (!task.is_ready()) {
      run_until_idle();
      if (!task.is_ready()) {
        wait_for_work();
      }
    }
    return task.get();
  }

  std::size_t pending() const;

  static run_loop *current() noexcept { return current_; }

private:
  bool run_one();
  void wait_for_work();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::pmr::deque<std::coroutine_handle<>> ready_;

  static thread_local run_loop *current_;
};

// =============================================================================
// Structured Concurrency: when_all
// =============================================================================

// Wait for all tasks to complete, return vector of results
template <typename T>
coro_task<std::vector<T>> when_all(std::vector<coro_task<T>> tasks) {
  for (auto &t : tasks) {
    t.start();
  }

  std::vector<T> results;
  results.reserve(tasks.size());
  for (auto &t : tasks) {
    results.push_back(co_await t);
  }

  co_return results;
}

inline coro_task<void> when_all(std::vector<coro_task<void>> tasks) {
  for (auto &t : tasks) {
    t.start();
  }

  for (auto &t : tasks) {
    co_await t;
  }
}

} // namespace mvar

// =============================================================================
// Entry Point Macro
// =============================================================================

// User defines: mvar::coro_task<int> coro_main() { ... }
// Then uses MVAR_CORO_MAIN to generate the actual main()

#define MVAR_CORO_MAIN                                                         \
  mvar::coro_task<int> coro_main();                                            \
  int main() {                                                                 \
    mvar::run_loop loop;                                                       \
    return loop.block_on(coro_main());                                         \
  }

#endif // MVAR_RUN_LOOP_HPP
