#ifndef MVAR_CONCEPTS_HPP
#define MVAR_CONCEPTS_HPP

#include <concepts>
#include <coroutine>
#include <cstddef>
#include <optional>
#include <type_traits>

namespace mvar {

// =============================================================================
// Value Concepts
// =============================================================================

// read() and the taker/reader handoff both hand out copies of the slot.
template <typename T>
concept CellValue = std::copy_constructible<T> && std::move_constructible<T> &&
                    std::is_object_v<T>;

// =============================================================================
// Coroutine Awaiter Concept
// =============================================================================

template <typename T>
concept Awaiter = requires(T a, std::coroutine_handle<> h) {
  { a.await_ready() } -> std::convertible_to<bool>;
  { a.await_suspend(h) };
  { a.await_resume() };
};

// =============================================================================
// Lockable Concepts (std::mutex-like)
// =============================================================================

template <typename T>
concept BasicLockable = requires(T m) {
  { m.lock() } -> std::same_as<void>;
  { m.unlock() } -> std::same_as<void>;
};

template <typename T>
concept Lockable = BasicLockable<T> && requires(T m) {
  { m.try_lock() } -> std::convertible_to<bool>;
};

// =============================================================================
// Policy Concepts
// =============================================================================

template <typename P>
concept CellLockPolicy = Lockable<typename P::mutex_type> && requires {
  typename P::lock_type;
};

// =============================================================================
// Cell Concepts
// =============================================================================

template <typename C, typename T>
concept BlockingCell = requires(C c, const C cc, T value) {
  { c.take() } -> std::same_as<T>;
  { c.put(value) } -> std::same_as<void>;
  { c.read() } -> std::same_as<T>;
  { c.try_take() } -> std::same_as<std::optional<T>>;
  { c.try_put(value) } -> std::same_as<bool>;
  { c.try_read() } -> std::same_as<std::optional<T>>;
  { cc.is_empty() } -> std::same_as<bool>;
};

template <typename C, typename T>
concept AsyncCell = BlockingCell<C, T> && requires(C c, T value) {
  { c.take_async() } -> Awaiter;
  { c.put_async(value) } -> Awaiter;
  { c.read_async() } -> Awaiter;
};

} // namespace mvar

#endif // MVAR_CONCEPTS_HPP
