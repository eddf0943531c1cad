#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>

#if defined(_MSC_VER)
  #include <immintrin.h>
  #define ARCSLOT_PAUSE() _mm_pause()
#elif defined(__x86_64__) || defined(__i386__)
  #define ARCSLOT_PAUSE() __builtin_ia32_pause()
#else
  #define ARCSLOT_PAUSE() do {} while(0)
#endif

namespace arcslot {

// 64B cache line (common on x86_64); adjust if you profile different HW.
constexpr std::size_t CACHE_LINE = 64;

// Memory order helpers for readability
constexpr auto RELAXED = std::memory_order_relaxed;
constexpr auto ACQUIRE = std::memory_order_acquire;
constexpr auto RELEASE = std::memory_order_release;
constexpr auto ACQ_REL = std::memory_order_acq_rel;

} // namespace arcslot
