#ifndef MVAR_MVAR_HPP
#define MVAR_MVAR_HPP

// =============================================================================
// mvar - Single-slot synchronized cells
// =============================================================================
//
// A cell holds at most one value. take() empties it, put() fills it, read()
// observes it; each waits while the cell is in the wrong state. Waiters of
// one kind are served in arrival order.
//
// Every operation comes in two forms:
// - blocking (sync_cell): parks the calling thread
// - awaitable (async_cell): suspends the calling coroutine, which is resumed
//   on the run_loop it was running on
//
// Building blocks:
// - policies: per-cell lock selection (mutex, spinlock, single thread)
// - coro_task / run_loop / yield: a minimal cooperative host for coroutines
//
// =============================================================================

// Foundation headers
#include "concepts.hpp"
#include "policies.hpp"
#include "crtp_base.hpp"

// Host
#include "allocator.hpp"
#include "coro_task.hpp"
#include "run_loop.hpp"
#include "yield.hpp"

// Cell
#include "cell.hpp"

#endif // MVAR_MVAR_HPP
