#ifndef MVAR_YIELD_HPP
#define MVAR_YIELD_HPP

#include <coroutine>

namespace mvar {

// Forward declaration
void schedule_coro_handle(std::coroutine_handle<> handle);

// Re-queues the awaiting coroutine behind everything already ready on its
// run_loop. Outside a loop it resumes immediately.
struct yield_awaiter {
  bool await_ready() noexcept { return false; }

  void await_suspend(std::coroutine_handle<> h) { schedule_coro_handle(h); }

  void await_resume() noexcept {}
};

inline yield_awaiter yield() { return {}; }

} // namespace mvar

#endif // MVAR_YIELD_HPP
