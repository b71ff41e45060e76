#ifndef MVAR_CORO_TASK_HPP
#define MVAR_CORO_TASK_HPP

#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <variant>

#include "allocator.hpp"
#include "continuation_handoff.hpp"

namespace mvar {

// Forward declaration for scheduler integration
void schedule_coro_handle(std::coroutine_handle<> handle);

// =============================================================================
// Shared state for coroutine result communication
// =============================================================================

template <typename T> struct coro_result {
  std::variant<std::monostate, T, std::exception_ptr> result;

  void set_value(T value) { result.template emplace<1>(std::move(value)); }

  void set_exception(std::exception_ptr e) { result.template emplace<2>(e); }

  T take() {
    if (auto *e = std::get_if<2>(&result)) {
      std::rethrow_exception(*e);
    }
    return std::get<1>(std::move(result));
  }
};

template <> struct coro_result<void> {
  std::exception_ptr exception;

  void set_value() noexcept {}

  void set_exception(std::exception_ptr e) { exception = e; }

  void take() {
    if (exception) {
      std::rethrow_exception(exception);
    }
  }
};

template <typename T> struct coro_shared_state : coro_result<T> {
  continuation_handoff handoff;
  // Set by whichever of {final suspend, task destructor} runs first; the
  // second one destroys the frame.
  std::atomic<bool> released{false};
  std::mutex mutex;
  std::condition_variable cv;

  // Returns true when an awaiter is registered and must be resumed.
  bool publish() {
    bool has_awaiter;
    {
      std::lock_guard lock(mutex);
      has_awaiter = handoff.finish();
    }
    cv.notify_all();
    return has_awaiter;
  }

  void wait() {
    std::unique_lock lock(mutex);
    cv.wait(lock, [this] { return handoff.finished(); });
  }

  bool is_ready() const { return handoff.finished(); }
};

namespace detail {

template <typename T> struct promise_base {
  std::shared_ptr<coro_shared_state<T>> state =
      std::make_shared<coro_shared_state<T>>();

  static void *operator new(std::size_t size) {
    return mi_resource()->allocate(size, alignof(std::max_align_t));
  }

  static void operator delete(void *frame, std::size_t size) {
    mi_resource()->deallocate(frame, size, alignof(std::max_align_t));
  }

  std::suspend_always initial_suspend() noexcept { return {}; }

  struct final_awaiter {
    bool await_ready() noexcept { return false; }

    template <typename Promise>
    std::coroutine_handle<>
    await_suspend(std::coroutine_handle<Promise> h) noexcept {
      auto state = h.promise().state;
      std::coroutine_handle<> next = std::noop_coroutine();
      if (state->publish()) {
        next = state->handoff.continuation();
      }
      if (state->released.exchange(true, std::memory_order_acq_rel)) {
        h.destroy();
      }
      return next;
    }

    void await_resume() noexcept {}
  };

  final_awaiter final_suspend() noexcept { return {}; }

  void unhandled_exception() {
    state->set_exception(std::current_exception());
  }
};

template <typename T> struct promise_returns : promise_base<T> {
  void return_value(T value) { this->state->set_value(std::move(value)); }
};

template <> struct promise_returns<void> : promise_base<void> {
  void return_void() { this->state->set_value(); }
};

} // namespace detail

// =============================================================================
// coro_task<T> - Lazily started coroutine with a single awaiter
// =============================================================================

template <typename T = void> class [[nodiscard]] coro_task {
public:
  struct promise_type : detail::promise_returns<T> {
    coro_task get_return_object() {
      return coro_task{handle_type::from_promise(*this)};
    }
  };

  using handle_type = std::coroutine_handle<promise_type>;
  using value_type = T;

  coro_task(const coro_task &) = delete;
  coro_task &operator=(const coro_task &) = delete;

  coro_task(coro_task &&other) noexcept
      : handle_(std::exchange(other.handle_, nullptr)),
        state_(std::move(other.state_)),
        started_(other.started_.load()) {}

  coro_task &operator=(coro_task &&other) noexcept {
    if (this != &other) {
      release();
      handle_ = std::exchange(other.handle_, nullptr);
      state_ = std::move(other.state_);
      started_.store(other.started_.load());
    }
    return *this;
  }

  // A task dropped while its coroutine is suspended leaves the frame to be
  // destroyed by its own final suspend.
  ~coro_task() { release(); }

  // Awaitable interface for co_await
  bool await_ready() const noexcept { return state_ && state_->is_ready(); }

  std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) {
    auto resume_now = state_->handoff.attach(awaiting);
    start();
    return resume_now;
  }

  T await_resume() { return state_->take(); }

  // Blocking get for non-coroutine contexts
  T get() {
    start();
    state_->wait();
    return state_->take();
  }

  bool is_ready() const { return state_ && state_->is_ready(); }

  // Posts the coroutine to the current run_loop, or runs it inline when the
  // calling thread has none.
  void start() {
    bool expected = false;
    if (started_.compare_exchange_strong(expected, true) && handle_ &&
        !handle_.done()) {
      schedule_coro_handle(handle_);
    }
  }

  bool is_started() const { return started_.load(); }

private:
  explicit coro_task(handle_type h)
      : handle_(h), state_(h.promise().state), started_(false) {}

  void release() noexcept {
    if (!handle_) {
      return;
    }
    auto handle = std::exchange(handle_, nullptr);
    if (!started_.load()) {
      handle.destroy();
    } else if (state_->released.exchange(true, std::memory_order_acq_rel)) {
      handle.destroy();
    }
  }

  handle_type handle_;
  std::shared_ptr<coro_shared_state<T>> state_;
  std::atomic<bool> started_;
};

// Type trait for detecting coro_task
template <typename T> struct is_coro_task : std::false_type {};

template <typename T> struct is_coro_task<coro_task<T>> : std::true_type {};

template <typename T>
inline constexpr bool is_coro_task_v = is_coro_task<T>::value;

} // namespace mvar

#endif // MVAR_CORO_TASK_HPP
