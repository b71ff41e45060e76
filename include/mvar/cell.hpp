#ifndef MVAR_CELL_HPP
#define MVAR_CELL_HPP

#include <coroutine>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "concepts.hpp"
#include "coro_task.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"
#include "run_loop.hpp"

namespace mvar {

enum class cell_op { take, put, read };

// =============================================================================
// Sync Cell - Single-slot synchronized variable with blocking operations
// =============================================================================
//
// The slot is either empty or holds one value. Callers that cannot proceed
// wait in one of three FIFO queues (takers, putters, readers) and are served
// strictly in arrival order. Each transition runs under the cell's lock:
//
//   take  full:  move the value out; the head putter, if any, writes its
//                value into the slot in the same step.
//   put   empty: store the value; the head taker and the head reader each
//                receive a copy. The slot keeps the value after handing it
//                to a taker.
//   read  full:  copy the value; the slot is unchanged.
//
// Only one taker and one reader are serviced per put.

template <CellValue T, CellLockPolicy LockPolicy = mutex_lock_policy>
class sync_cell : public sync_primitive_base<sync_cell<T, LockPolicy>, LockPolicy> {
  using base_type = sync_primitive_base<sync_cell<T, LockPolicy>, LockPolicy>;

protected:
  using node_type = cell_waiter<T>;
  using lock_type = typename base_type::lock_type;

  std::optional<T> slot_;
  waiter_queue<node_type> takers_;
  waiter_queue<node_type> putters_;
  waiter_queue<node_type> readers_;

  // --- transitions; caller holds the lock -----------------------------------

  bool take_locked(node_type &self, wakeup_batch &batch) {
    if (!slot_) {
      return false;
    }
    self.value.emplace(std::move(*slot_));
    slot_.reset();
    if (node_type *putter = putters_.front()) {
      slot_.emplace(std::move(*putter->value));
      putter->value.reset();
      putters_.pop_front();
      batch.complete(putter);
    }
    return true;
  }

  bool put_locked(node_type &self, wakeup_batch &batch) {
    if (slot_) {
      return false;
    }
    // Copy for the head taker and head reader before touching the slot or
    // either queue; a throwing copy leaves the cell as it was.
    node_type *taker = takers_.front();
    node_type *reader = readers_.front();
    std::optional<T> for_taker;
    std::optional<T> for_reader;
    if (taker != nullptr) {
      for_taker.emplace(*self.value);
    }
    if (reader != nullptr) {
      for_reader.emplace(*self.value);
    }

    slot_.emplace(std::move(*self.value));
    self.value.reset();
    if (taker != nullptr) {
      taker->value = std::move(for_taker);
      takers_.pop_front();
      batch.complete(taker);
    }
    if (reader != nullptr) {
      reader->value = std::move(for_reader);
      readers_.pop_front();
      batch.complete(reader);
    }
    return true;
  }

  bool read_locked(node_type &self) {
    if (!slot_) {
      return false;
    }
    self.value.emplace(*slot_);
    return true;
  }

  bool apply_locked(cell_op op, node_type &self, wakeup_batch &batch) {
    switch (op) {
    case cell_op::take:
      return take_locked(self, batch);
    case cell_op::put:
      return put_locked(self, batch);
    case cell_op::read:
      return read_locked(self);
    }
    return false;
  }

  waiter_queue<node_type> &queue_for(cell_op op) noexcept {
    switch (op) {
    case cell_op::take:
      return takers_;
    case cell_op::put:
      return putters_;
    case cell_op::read:
      break;
    }
    return readers_;
  }

  void finish(lock_type &lock, wakeup_batch &batch) {
    if (batch.wakes_threads()) {
      this->notify_all();
    }
    lock.unlock();
    batch.dispatch();
  }

  // --- drivers ----------------------------------------------------------------

  // Completes op now or parks the calling thread until another operation
  // completes it.
  void run_or_block(cell_op op, node_type &self) {
    wakeup_batch batch;
    lock_type lock(this->mutex_);
    if (!apply_locked(op, self, batch)) {
      queue_for(op).push_back(&self);
      this->wait_for_condition(lock, [&self] { return self.done; });
    }
    finish(lock, batch);
  }

  bool run_if_ready(cell_op op, node_type &self) {
    wakeup_batch batch;
    lock_type lock(this->mutex_);
    if (!apply_locked(op, self, batch)) {
      return false;
    }
    finish(lock, batch);
    return true;
  }

  // Completes op now, or queues self for a later wakeup through its handle.
  // Returns true when self was queued; self must not be touched afterwards.
  bool run_or_park(cell_op op, node_type &self) {
    wakeup_batch batch;
    lock_type lock(this->mutex_);
    if (apply_locked(op, self, batch)) {
      finish(lock, batch);
      return false;
    }
    queue_for(op).push_back(&self);
    return true;
  }

  std::size_t queued(const waiter_queue<node_type> &queue) const {
    lock_type lock(this->mutex_);
    return queue.size();
  }

public:
  using value_type = T;
  using lock_policy = LockPolicy;

  // Empty cell
  sync_cell() = default;

  // Full cell
  explicit sync_cell(T initial) : slot_(std::in_place, std::move(initial)) {}

  T take() {
    node_type self;
    run_or_block(cell_op::take, self);
    return std::move(*self.value);
  }

  void put(T value) {
    node_type self;
    self.value.emplace(std::move(value));
    run_or_block(cell_op::put, self);
  }

  T read() {
    node_type self;
    run_or_block(cell_op::read, self);
    return std::move(*self.value);
  }

  std::optional<T> try_take() {
    node_type self;
    if (!run_if_ready(cell_op::take, self)) {
      return std::nullopt;
    }
    return std::move(self.value);
  }

  bool try_put(T value) {
    node_type self;
    self.value.emplace(std::move(value));
    return run_if_ready(cell_op::put, self);
  }

  std::optional<T> try_read() {
    node_type self;
    if (!run_if_ready(cell_op::read, self)) {
      return std::nullopt;
    }
    return std::move(self.value);
  }

  bool is_empty() const {
    lock_type lock(this->mutex_);
    return !slot_.has_value();
  }

  // Take, apply func, put the result. The slot stays empty while func runs,
  // so concurrent takers and readers wait. If func throws, the exception
  // propagates and the slot is left empty.
  template <typename Func>
    requires std::is_invocable_r_v<T, Func, T>
  void modify(Func &&func) {
    T value = take();
    put(std::invoke(std::forward<Func>(func), std::move(value)));
  }

  // Take, let func update the value in place, put it back and return func's
  // result. Same failure behaviour as modify.
  template <typename Func>
    requires std::invocable<Func, T &>
  auto modify_and_get(Func &&func) -> std::invoke_result_t<Func, T &> {
    T value = take();
    if constexpr (std::is_void_v<std::invoke_result_t<Func, T &>>) {
      std::invoke(std::forward<Func>(func), value);
      put(std::move(value));
    } else {
      auto result = std::invoke(std::forward<Func>(func), value);
      put(std::move(value));
      return result;
    }
  }

  // Take, run func on the value, put the same value back.
  template <typename Func>
    requires std::invocable<Func, const T &>
  auto with_value(Func &&func) -> std::invoke_result_t<Func, const T &> {
    T value = take();
    if constexpr (std::is_void_v<std::invoke_result_t<Func, const T &>>) {
      std::invoke(std::forward<Func>(func), std::as_const(value));
      put(std::move(value));
    } else {
      auto result = std::invoke(std::forward<Func>(func), std::as_const(value));
      put(std::move(value));
      return result;
    }
  }

  // Take the current value and put replacement in its place. Not atomic:
  // another putter may slip in between.
  T swap(T replacement) {
    T old = take();
    put(std::move(replacement));
    return old;
  }

  std::size_t waiting_takers() const { return queued(takers_); }
  std::size_t waiting_putters() const { return queued(putters_); }
  std::size_t waiting_readers() const { return queued(readers_); }
};

// =============================================================================
// Async Cell Awaiters
// =============================================================================

template <CellValue T, CellLockPolicy LockPolicy> class async_cell;

template <typename T, typename LockPolicy>
class cell_take_awaiter
    : public awaitable_base<cell_take_awaiter<T, LockPolicy>, T> {
  async_cell<T, LockPolicy> &cell_;
  cell_waiter<T> node_;

public:
  explicit cell_take_awaiter(async_cell<T, LockPolicy> &cell) : cell_(cell) {}

  bool ready_impl() { return cell_.complete_now(cell_op::take, node_); }

  bool suspend_impl(std::coroutine_handle<> h) {
    node_.handle = h;
    node_.loop = run_loop::current();
    return cell_.park(cell_op::take, node_);
  }

  T resume_impl() { return std::move(*node_.value); }
};

template <typename T, typename LockPolicy>
class cell_put_awaiter
    : public awaitable_base<cell_put_awaiter<T, LockPolicy>, void> {
  async_cell<T, LockPolicy> &cell_;
  cell_waiter<T> node_;

public:
  cell_put_awaiter(async_cell<T, LockPolicy> &cell, T value) : cell_(cell) {
    node_.value.emplace(std::move(value));
  }

  bool ready_impl() { return cell_.complete_now(cell_op::put, node_); }

  bool suspend_impl(std::coroutine_handle<> h) {
    node_.handle = h;
    node_.loop = run_loop::current();
    return cell_.park(cell_op::put, node_);
  }

  void resume_impl() {}
};

template <typename T, typename LockPolicy>
class cell_read_awaiter
    : public awaitable_base<cell_read_awaiter<T, LockPolicy>, T> {
  async_cell<T, LockPolicy> &cell_;
  cell_waiter<T> node_;

public:
  explicit cell_read_awaiter(async_cell<T, LockPolicy> &cell) : cell_(cell) {}

  bool ready_impl() { return cell_.complete_now(cell_op::read, node_); }

  bool suspend_impl(std::coroutine_handle<> h) {
    node_.handle = h;
    node_.loop = run_loop::current();
    return cell_.park(cell_op::read, node_);
  }

  T resume_impl() { return std::move(*node_.value); }
};

// =============================================================================
// Async Cell - Extends sync with coroutine-awaitable operations
// =============================================================================
//
// Blocking and awaiting callers share the same three queues. A parked
// coroutine is resumed on the run_loop it suspended on.

template <CellValue T, CellLockPolicy LockPolicy = mutex_lock_policy>
class async_cell : public sync_cell<T, LockPolicy> {
  using sync_base = sync_cell<T, LockPolicy>;
  using node_type = typename sync_base::node_type;

  friend class cell_take_awaiter<T, LockPolicy>;
  friend class cell_put_awaiter<T, LockPolicy>;
  friend class cell_read_awaiter<T, LockPolicy>;

  bool complete_now(cell_op op, node_type &node) {
    return this->run_if_ready(op, node);
  }

  bool park(cell_op op, node_type &node) { return this->run_or_park(op, node); }

public:
  using value_type = T;
  using lock_policy = LockPolicy;

  async_cell() = default;

  explicit async_cell(T initial) : sync_base(std::move(initial)) {}

  auto take_async() { return cell_take_awaiter<T, LockPolicy>(*this); }

  auto put_async(T value) {
    return cell_put_awaiter<T, LockPolicy>(*this, std::move(value));
  }

  auto read_async() { return cell_read_awaiter<T, LockPolicy>(*this); }

  // Take, apply func, put the result. func may return T or coro_task<T>; an
  // asynchronous func may suspend while the slot is empty. The cell must
  // outlive the returned task.
  template <typename Func>
    requires std::invocable<Func, T>
  coro_task<void> modify_async(Func func) {
    T value = co_await take_async();
    if constexpr (is_coro_task_v<std::invoke_result_t<Func, T>>) {
      T next = co_await std::invoke(func, std::move(value));
      co_await put_async(std::move(next));
    } else {
      co_await put_async(std::invoke(func, std::move(value)));
    }
  }

  coro_task<T> swap_async(T replacement) {
    T old = co_await take_async();
    co_await put_async(std::move(replacement));
    co_return old;
  }
};

// =============================================================================
// Factories - Shared cells
// =============================================================================

template <CellValue T, CellLockPolicy LockPolicy = mutex_lock_policy>
std::shared_ptr<async_cell<T, LockPolicy>> new_empty_cell() {
  return std::make_shared<async_cell<T, LockPolicy>>();
}

template <CellValue T, CellLockPolicy LockPolicy = mutex_lock_policy>
std::shared_ptr<async_cell<T, LockPolicy>> new_cell(T initial) {
  return std::make_shared<async_cell<T, LockPolicy>>(std::move(initial));
}

// =============================================================================
// Type Aliases
// =============================================================================

template <typename T> using cell = async_cell<T, mutex_lock_policy>;

template <typename T> using blocking_cell = sync_cell<T, mutex_lock_policy>;

template <typename T> using fast_cell = sync_cell<T, spinlock_policy>;

template <typename T> using local_cell = async_cell<T, single_thread_policy>;

} // namespace mvar

#endif // MVAR_CELL_HPP
