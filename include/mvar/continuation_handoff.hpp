#ifndef MVAR_CONTINUATION_HANDOFF_HPP
#define MVAR_CONTINUATION_HANDOFF_HPP

#include <atomic>
#include <coroutine>
#include <cstdint>

namespace mvar {

// One-shot rendezvous between a finishing coroutine and the coroutine that
// awaits it. Whichever side arrives second owns resuming the awaiter.
//
// One atomic word:
//   bit 0      task finished
//   bits 1..   awaiter frame address (frames are at least 2-aligned)
class continuation_handoff {
public:
  static constexpr std::uintptr_t finished_bit = 1;
  static constexpr std::uintptr_t address_mask = ~std::uintptr_t(1);

  continuation_handoff() = default;
  continuation_handoff(const continuation_handoff &) = delete;
  continuation_handoff &operator=(const continuation_handoff &) = delete;

  // Task side. True when an awaiter was already registered; the caller then
  // transfers to continuation().
  bool finish() noexcept {
    std::uintptr_t old_word = word_.fetch_or(finished_bit, std::memory_order_acq_rel);
    return (old_word & address_mask) != 0;
  }

  // Awaiter side. Returns h when the task already finished and the awaiter
  // must resume itself, noop_coroutine otherwise.
  std::coroutine_handle<> attach(std::coroutine_handle<> h) noexcept {
    auto address = reinterpret_cast<std::uintptr_t>(h.address());
    std::uintptr_t old_word = word_.load(std::memory_order_acquire);
    while (!word_.compare_exchange_weak(old_word,
                                        (old_word & finished_bit) | address,
                                        std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
    }
    if (old_word & finished_bit) {
      return h;
    }
    return std::noop_coroutine();
  }

  std::coroutine_handle<> continuation() const noexcept {
    std::uintptr_t word = word_.load(std::memory_order_acquire);
    void *address = reinterpret_cast<void *>(word & address_mask);
    return address ? std::coroutine_handle<>::from_address(address)
                   : std::noop_coroutine();
  }

  bool finished() const noexcept {
    return (word_.load(std::memory_order_acquire) & finished_bit) != 0;
  }

private:
  std::atomic<std::uintptr_t> word_{0};
};

} // namespace mvar

#endif // MVAR_CONTINUATION_HANDOFF_HPP
