#include "mvar/run_loop.hpp"

#include <coroutine>
#include <mutex>

#include "mvar/allocator.hpp"
#include "mvar/crtp_base.hpp"

namespace mvar {

thread_local run_loop *run_loop::current_ = nullptr;

run_loop::run_loop() : ready_(mi_resource()) { init_allocator(); }

// Drain what is still queued so no posted coroutine is stranded
run_loop::~run_loop() { run_until_idle(); }

void run_loop::post(std::coroutine_handle<> handle) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_.push_back(handle);
  }
  cv_.notify_one();
}

bool run_loop::run_one() {
  std::coroutine_handle<> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ready_.empty()) {
      return false;
    }
    handle = ready_.front();
    ready_.pop_front();
  }
  if (handle && !handle.done()) {
    handle.resume();
  }
  return true;
}

std::size_t run_loop::run_until_idle() {
  scope bound(*this);
  std::size_t resumed = 0;
  while (run_one()) {
    ++resumed;
  }
  return resumed;
}

void run_loop::wait_for_work() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !ready_.empty(); });
}

std::size_t run_loop::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ready_.size();
}

// Schedule a coroutine handle on the calling thread's loop
void schedule_coro_handle(std::coroutine_handle<> handle) {
  if (!handle || handle.done()) {
    return;
  }
  resume_on(run_loop::current(), handle);
}

void resume_on(run_loop *loop, std::coroutine_handle<> handle) {
  if (loop != nullptr) {
    loop->post(handle);
    return;
  }
  // No loop bound: run inline on the waking thread
  handle.resume();
}

} // namespace mvar
