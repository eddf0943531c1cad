// benchmarks/bench_throughput.cpp — acquire/clone/release throughput

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "arcslot/handle.hpp"

#if defined(_WIN32)
  // Prevent windows.h from defining min/max macros that break std::min/std::max
  #ifndef NOMINMAX
  #define NOMINMAX
  #endif
  #include <windows.h>
  static inline void pin_to_core(unsigned core_index) {
      DWORD_PTR mask = 1ull << (core_index % 64);
      SetThreadAffinityMask(GetCurrentThread(), mask);
  }
#else
  static inline void pin_to_core(unsigned) {}
#endif

using SteadyClock = std::chrono::steady_clock;

constexpr std::size_t CAPACITY = 256;

// Stand-in for a native handle: a few words of state, destroyed once.
struct Resource {
    std::uint64_t id;
    std::uint64_t words[7];
};

using Registry = arcslot::SlotRegistry<Resource, CAPACITY>;
using ResourceHandle = arcslot::Handle<Resource, CAPACITY>;

static std::uint64_t parse_u64(const char* s, std::uint64_t def) {
    if (!s) return def;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    return (end && *end == '\0') ? static_cast<std::uint64_t>(v) : def;
}

static void report(const char* name, double ops, double secs) {
    const double ops_per_s = (secs > 0.0) ? (ops / secs) : 0.0;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << name << ":\n"
              << "  elapsed (s): " << secs << "\n"
              << "  total ops :  " << ops << "\n"
              << "  throughput:  " << (ops_per_s / 1e6) << " Mops/s\n";
}

int main(int argc, char** argv) {
    // Args: [iterations_per_thread] [num_threads] [clones_per_iteration]
    const std::uint64_t ITERATIONS = parse_u64(argc > 1 ? argv[1] : nullptr, 1'000'000ULL);
    const int           NUM_THREADS = static_cast<int>(parse_u64(argc > 2 ? argv[2] : nullptr, 4));
    const std::uint64_t CLONES      = parse_u64(argc > 3 ? argv[3] : nullptr, 4);

    std::cout << "Benchmark config:\n"
              << "  iterations_per_thread = " << ITERATIONS << "\n"
              << "  threads               = " << NUM_THREADS << "\n"
              << "  clones_per_iteration  = " << CLONES << "\n"
              << "  registry_capacity     = " << CAPACITY << "\n";

    Registry reg;

    // -------- Private slots: acquire, clone, release --------
    {
        std::atomic<bool> go{false};
        std::atomic<std::uint64_t> ops{0}, full{0};

        // Latency reservoir (ns) for acquisition p50/p95/p99
        std::atomic<std::uint64_t> lat_samples_count{0};
        constexpr std::size_t LAT_RESERVOIR = 4096;
        std::vector<std::uint32_t> lat_ns(LAT_RESERVOIR);

        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(NUM_THREADS));
        for (int t = 0; t < NUM_THREADS; ++t) {
            workers.emplace_back([&, t] {
                pin_to_core(static_cast<unsigned>(t));
                while (!go.load(std::memory_order_acquire)) {}

                std::vector<ResourceHandle> clones;
                clones.reserve(static_cast<std::size_t>(CLONES));
                std::uint64_t local_ops = 0;
                std::uint64_t sample_token = 0;

                for (std::uint64_t i = 0; i < ITERATIONS; ++i) {
                    const bool sample = (++sample_token & 0x3FFu) == 0u;
                    auto t0 = sample ? SteadyClock::now() : SteadyClock::time_point{};
                    auto h = ResourceHandle::create(reg, [i] { return Resource{i, {}}; });
                    if (sample) {
                        auto t1 = SteadyClock::now();
                        std::uint64_t ns = static_cast<std::uint64_t>(
                            std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
                        std::uint64_t idx = lat_samples_count.fetch_add(1, std::memory_order_relaxed);
                        if (idx < LAT_RESERVOIR) lat_ns[static_cast<std::size_t>(idx)] = static_cast<std::uint32_t>(ns);
                    }
                    if (!h) {
                        full.fetch_add(1, std::memory_order_relaxed);
                        ARCSLOT_PAUSE();
                        continue;
                    }
                    for (std::uint64_t c = 0; c < CLONES; ++c) clones.push_back(*h);
                    clones.clear();
                    h.reset();
                    local_ops += 2 + 2 * CLONES;
                }
                ops.fetch_add(local_ops, std::memory_order_relaxed);
            });
        }

        auto t0 = SteadyClock::now();
        go.store(true, std::memory_order_release);
        for (auto& th : workers) th.join();
        auto t1 = SteadyClock::now();

        report("Private slots (acquire + clones + release)",
               static_cast<double>(ops.load()), std::chrono::duration<double>(t1 - t0).count());
        std::cout << "  exhausted acquisitions: " << full.load() << "\n";

        const std::size_t nlat = static_cast<std::size_t>(
            std::min<std::uint64_t>(lat_samples_count.load(std::memory_order_relaxed), LAT_RESERVOIR));
        if (nlat >= 8) {
            std::vector<std::uint32_t> v(lat_ns.begin(), lat_ns.begin() + static_cast<std::ptrdiff_t>(nlat));
            auto pct = [&](double p) -> std::uint32_t {
                const double idxd = std::clamp((p / 100.0) * (nlat - 1.0), 0.0, static_cast<double>(nlat - 1));
                const std::size_t k = static_cast<std::size_t>(idxd);
                std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(k), v.end());
                return v[k];
            };
            const auto p50 = pct(50), p95 = pct(95), p99 = pct(99);
            std::cout << "  acquire latency p50/p95/p99 (ns): " << p50 << " / " << p95 << " / " << p99 << "\n";
        }
    }

    // -------- One shared slot: every thread clones and drops the same value --------
    {
        std::atomic<bool> go{false};
        ResourceHandle shared = ResourceHandle::create_or_throw(reg, [] { return Resource{0, {}}; });

        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(NUM_THREADS));
        for (int t = 0; t < NUM_THREADS; ++t) {
            workers.emplace_back([&, t, mine = shared] {
                pin_to_core(static_cast<unsigned>(t));
                while (!go.load(std::memory_order_acquire)) {}
                for (std::uint64_t i = 0; i < ITERATIONS; ++i) {
                    ResourceHandle c = mine;
                    if (c->id != 0) std::abort();
                }
            });
        }

        auto t0 = SteadyClock::now();
        go.store(true, std::memory_order_release);
        for (auto& th : workers) th.join();
        auto t1 = SteadyClock::now();

        report("Shared slot (clone + release on one refcount)",
               2.0 * static_cast<double>(ITERATIONS) * NUM_THREADS,
               std::chrono::duration<double>(t1 - t0).count());
    }

    return 0;
}
