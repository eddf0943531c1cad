#pragma once
#include <atomic>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include "slot.hpp"
#include "utils.hpp"

namespace arcslot {

// Fixed-capacity table of N refcounted slots, each holding at most one T.
//
// Lock-free: every operation is a bounded sequence of atomics on a single
// slot's refcount. Slots never synchronize with each other.
//
// Two tiers of use:
//   - Handle<T, N> (handle.hpp) keeps the refcount protocol by construction;
//     prefer it.
//   - The raw index operations below, for callers that keep their own
//     bookkeeping. get_ref/inc_count/dec_count require that the caller holds
//     a live reference on the index; violating that is undefined behaviour
//     (asserted in debug builds).
template <class T, std::size_t N>
class SlotRegistry {
    static_assert(N > 0, "SlotRegistry needs at least one slot");
    static_assert(std::is_destructible_v<T>, "T must be destructible");

public:
    using value_type = T;

    SlotRegistry() noexcept = default;

    ~SlotRegistry() {
        assert(live_count() == 0 && "SlotRegistry destroyed with live slots");
    }

    SlotRegistry(const SlotRegistry&) = delete;
    SlotRegistry& operator=(const SlotRegistry&) = delete;

    // Process-wide registry for (T, N). Created on first use, lives until exit.
    static SlotRegistry& global() noexcept {
        static SlotRegistry instance;
        return instance;
    }

    static constexpr std::size_t capacity() noexcept { return N; }

    // Claims the first free slot (0 -> 1) and constructs init()'s result in it.
    // init is only invoked once the claim has succeeded. Returns nullopt when
    // every slot is taken. If init throws, the claim is dropped and the
    // exception propagates.
    template <class F>
    std::optional<std::size_t> acquire_and_init(F&& init)
        noexcept(nothrow_init<F>)
    {
        for (std::size_t i = 0; i < N; ++i) {
            Slot<T>& s = slots_[i];
            if (s.refcount.load(RELAXED) != 0) continue; // skip the RMW on busy slots

            std::uint64_t expected = 0;
            if (s.refcount.compare_exchange_strong(expected, 1, ACQ_REL, RELAXED)) {
                construct_claimed(s, std::forward<F>(init));
                return i;
            }
        }
        return std::nullopt; // full
    }

    T& get_ref(std::size_t index) noexcept {
        assert(index < N && "get_ref: index out of range");
        assert(slots_[index].refcount.load(RELAXED) != 0 && "get_ref: slot is free");
        return *slots_[index].ptr();
    }

    const T& get_ref(std::size_t index) const noexcept {
        assert(index < N && "get_ref: index out of range");
        assert(slots_[index].refcount.load(RELAXED) != 0 && "get_ref: slot is free");
        return *slots_[index].ptr();
    }

    // Caller already holds a reference, so ordering the payload is not needed.
    void inc_count(std::size_t index) noexcept {
        assert(index < N && "inc_count: index out of range");
        const std::uint64_t prev = slots_[index].refcount.fetch_add(1, RELAXED);
        assert(prev > 0 && "inc_count: slot is free");
        (void)prev;
    }

    // Consumes one reference. The holder that finds itself last destroys the
    // value while the count still reads 1, then publishes the slot as free.
    // No other thread can move the count off 1 meanwhile: increments need a
    // live reference and claims need 0.
    //
    // This is a load + CAS loop rather than a single fetch_sub: a fetch_sub
    // reaching 0 would let acquire_and_init reclaim the slot while ~T() is
    // still running. The loop is lock-free, not wait-free; it only retries
    // when another holder's decrement lands in between.
    void dec_count(std::size_t index) noexcept {
        assert(index < N && "dec_count: index out of range");
        Slot<T>& s = slots_[index];

        std::uint64_t cur = s.refcount.load(RELAXED);
        for (;;) {
            assert(cur > 0 && "dec_count: refcount underflow (double release)");
            if (cur == 1) {
                // Pairs with the RELEASE decrements of every earlier holder.
                std::atomic_thread_fence(ACQUIRE);
                s.destroy();
                s.refcount.store(0, RELEASE);
                return;
            }
            if (s.refcount.compare_exchange_weak(cur, cur - 1, RELEASE, RELAXED)) {
                return;
            }
        }
    }

    // Diagnostics only: snapshots that may be stale as soon as they return.
    std::uint64_t use_count(std::size_t index) const noexcept {
        assert(index < N && "use_count: index out of range");
        return slots_[index].refcount.load(RELAXED);
    }

    std::size_t live_count() const noexcept {
        std::size_t live = 0;
        for (const auto& s : slots_) {
            if (s.refcount.load(RELAXED) != 0) ++live;
        }
        return live;
    }

private:
    template <class F>
    static constexpr bool nothrow_init =
        noexcept(std::declval<Slot<T>&>().construct(std::declval<F&&>()));

    template <class F>
    static void construct_claimed(Slot<T>& s, F&& init)
        noexcept(nothrow_init<F>)
    {
        if constexpr (nothrow_init<F>) {
            s.construct(std::forward<F>(init));
        } else {
            try {
                s.construct(std::forward<F>(init));
            } catch (...) {
                s.refcount.store(0, RELEASE); // nothing was constructed
                throw;
            }
        }
    }

private:
    Slot<T> slots_[N];
};

} // namespace arcslot
