#ifndef MVAR_CRTP_BASE_HPP
#define MVAR_CRTP_BASE_HPP

#include <array>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>

#include "concepts.hpp"
#include "policies.hpp"

namespace mvar {

class run_loop;

// Resume h on loop, or inline on the calling thread when loop is null.
// Defined in run_loop.cpp.
void resume_on(run_loop *loop, std::coroutine_handle<> handle);

// =============================================================================
// Cell Waiter - One suspended take, put or read (Intrusive FIFO Node)
// =============================================================================
//
// Lives in the suspended caller: on the stack of a blocked thread, or inside
// the awaiter kept alive by a coroutine frame. Coroutine waiters carry a
// handle; blocked threads wait for done.

template <typename T> struct cell_waiter {
  // Putter: the value to write. Taker/reader: the value delivered.
  std::optional<T> value;
  std::coroutine_handle<> handle{nullptr};
  run_loop *loop{nullptr}; // Must outlive the wait
  cell_waiter *next{nullptr};
  bool done{false};
};

template <typename Node> class waiter_queue {
  Node *head_{nullptr};
  Node *tail_{nullptr};
  std::size_t size_{0};

public:
  waiter_queue() = default;
  waiter_queue(const waiter_queue &) = delete;
  waiter_queue &operator=(const waiter_queue &) = delete;

  void push_back(Node *node) noexcept {
    node->next = nullptr;
    if (tail_ != nullptr) {
      tail_->next = node;
    } else {
      head_ = node;
    }
    tail_ = node;
    ++size_;
  }

  Node *front() const noexcept { return head_; }

  Node *pop_front() noexcept {
    Node *node = head_;
    if (node != nullptr) {
      head_ = node->next;
      if (head_ == nullptr) {
        tail_ = nullptr;
      }
      node->next = nullptr;
      --size_;
    }
    return node;
  }

  std::size_t size() const noexcept { return size_; }
};

// =============================================================================
// Wakeup Batch - Completions gathered under the lock, delivered after it
// =============================================================================
//
// A single transition wakes at most two waiters: the head putter on take, or
// the head taker and head reader on put.

class wakeup_batch {
  struct entry {
    run_loop *loop;
    std::coroutine_handle<> handle;
  };

  std::array<entry, 2> entries_{};
  std::size_t count_{0};
  bool wake_threads_{false};

public:
  template <typename T> void complete(cell_waiter<T> *node) noexcept {
    node->done = true;
    if (node->handle) {
      entries_[count_++] = entry{node->loop, node->handle};
    } else {
      wake_threads_ = true;
    }
  }

  bool wakes_threads() const noexcept { return wake_threads_; }

  // Must run with the cell lock released: a resumed coroutine may call back
  // into the same cell.
  void dispatch() {
    for (std::size_t i = 0; i < count_; ++i) {
      resume_on(entries_[i].loop, entries_[i].handle);
    }
    count_ = 0;
  }
};

// =============================================================================
// Sync Primitive Base - Provides mutex + condition_variable pattern
// =============================================================================

template <typename Derived, typename LockPolicy = mutex_lock_policy>
class sync_primitive_base {
protected:
  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

  mutable mutex_type mutex_;
  std::condition_variable_any cv_;

  template <typename Predicate>
  void wait_for_condition(lock_type &lock, Predicate pred) {
    cv_.wait(lock, pred);
  }

  void notify_all() { cv_.notify_all(); }

public:
  sync_primitive_base() = default;
  ~sync_primitive_base() = default;

  sync_primitive_base(const sync_primitive_base &) = delete;
  sync_primitive_base &operator=(const sync_primitive_base &) = delete;
  sync_primitive_base(sync_primitive_base &&) = delete;
  sync_primitive_base &operator=(sync_primitive_base &&) = delete;
};

// =============================================================================
// Awaitable Base - Provides standard coroutine awaiter interface via CRTP
// =============================================================================

template <typename Derived, typename T> class awaitable_base {
protected:
  // Derived class must implement:
  // - bool ready_impl()         complete without suspending if possible
  // - bool suspend_impl(h)      false when it completed after all
  // - T resume_impl()

  Derived &derived() { return static_cast<Derived &>(*this); }

public:
  bool await_ready() { return derived().ready_impl(); }

  bool await_suspend(std::coroutine_handle<> h) {
    return derived().suspend_impl(h);
  }

  T await_resume() { return derived().resume_impl(); }
};

// Specialization for void
template <typename Derived> class awaitable_base<Derived, void> {
protected:
  Derived &derived() { return static_cast<Derived &>(*this); }

public:
  bool await_ready() { return derived().ready_impl(); }

  bool await_suspend(std::coroutine_handle<> h) {
    return derived().suspend_impl(h);
  }

  void await_resume() { derived().resume_impl(); }
};

} // namespace mvar

#endif // MVAR_CRTP_BASE_HPP
