#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>
#include "utils.hpp"

namespace arcslot {

// Invariant (refcounted slot):
//    - refcount == 0  : storage holds no live T, slot may be claimed
//    - refcount == k>0: storage holds exactly one live T, k handles refer to it
//    - only the 0 -> 1 claim constructs, only the 1 -> 0 release destroys
//
// Slots are cache-line aligned so refcount traffic on one slot never
// invalidates its neighbours. Over-aligned T raises the slot alignment.

template <class T>
struct alignas(alignof(T) > CACHE_LINE ? alignof(T) : CACHE_LINE) Slot {
    std::atomic<std::uint64_t> refcount{0};
    std::aligned_storage_t<sizeof(T), alignof(T)> storage;

    T*       ptr()       noexcept { return std::launder(reinterpret_cast<T*>(&storage)); }
    const T* ptr() const noexcept { return std::launder(reinterpret_cast<const T*>(&storage)); }

    template <class F>
    void construct(F&& init) noexcept(noexcept(T(std::declval<F&&>()()))) {
        ::new (static_cast<void*>(&storage)) T(std::forward<F>(init)());
    }

    void destroy() noexcept {
        if constexpr (!std::is_trivially_destructible_v<T>) {
            ptr()->~T();
        }
    }
};

} // namespace arcslot
