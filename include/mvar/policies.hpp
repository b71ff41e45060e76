#ifndef MVAR_POLICIES_HPP
#define MVAR_POLICIES_HPP

#include <atomic>
#include <mutex>

namespace mvar {

// =============================================================================
// Lock Policies
// =============================================================================
//
// Every cell owns exactly one lock of the policy's mutex_type. It guards the
// slot and the three waiter queues together.

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

struct spinlock {
  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
        // Spin on a plain load until the holder clears the flag
      }
    }
  }

  bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

// For cells used from a single run_loop thread only. Blocking operations
// that would have to park are a caller error under this policy.
struct single_thread_policy {
  struct noop_mutex {
    void lock() noexcept {}
    void unlock() noexcept {}
    bool try_lock() noexcept { return true; }
  };

  using mutex_type = noop_mutex;
  using lock_type = std::unique_lock<noop_mutex>;
};

} // namespace mvar

#endif // MVAR_POLICIES_HPP
