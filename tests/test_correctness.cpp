#include <cassert>
#include <cstdint>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

#include "arcslot/slot_registry.hpp"

// Writes its value into an external cell when destroyed, and counts drops.
struct DropSet {
    std::int64_t  v;
    std::int64_t* cell;
    int*          drops;

    DropSet(std::int64_t value, std::int64_t* c, int* d) : v(value), cell(c), drops(d) {}
    DropSet(DropSet&& o) noexcept
        : v(o.v), cell(std::exchange(o.cell, nullptr)), drops(std::exchange(o.drops, nullptr)) {}
    DropSet(const DropSet&) = delete;

    ~DropSet() {
        if (cell) *cell = v;
        if (drops) ++*drops;
    }

    void set(std::int64_t x) { *cell = x; }
};

static void fill_capacity() {
    arcslot::SlotRegistry<std::int64_t, 3> reg;
    auto i1 = reg.acquire_and_init([] { return std::int64_t{1}; });
    auto i2 = reg.acquire_and_init([] { return std::int64_t{2}; });
    auto i3 = reg.acquire_and_init([] { return std::int64_t{3}; });
    auto i4 = reg.acquire_and_init([] { return std::int64_t{4}; });

    assert(i1 && i2 && i3);
    assert(!i4);
    std::set<std::size_t> distinct{*i1, *i2, *i3};
    assert(distinct.size() == 3);
    assert(reg.get_ref(*i1) == 1 && reg.get_ref(*i2) == 2 && reg.get_ref(*i3) == 3);
    assert(reg.live_count() == 3);

    // Freeing one slot makes room again, and the scan finds the freed index.
    reg.dec_count(*i2);
    auto i5 = reg.acquire_and_init([] { return std::int64_t{5}; });
    assert(i5 && *i5 == *i2);
    assert(reg.get_ref(*i5) == 5);
    assert(!reg.acquire_and_init([] { return std::int64_t{6}; }));

    reg.dec_count(*i1);
    reg.dec_count(*i3);
    reg.dec_count(*i5);
    assert(reg.live_count() == 0);
    std::cout << "fill_capacity ok\n";
}

static void drop_sets_cell_once() {
    std::int64_t cell = 0;
    int drops = 0;
    arcslot::SlotRegistry<DropSet, 11> reg;

    auto idx = reg.acquire_and_init([&] { return DropSet(11, &cell, &drops); });
    assert(idx);
    assert(cell == 0 && drops == 0);

    reg.get_ref(*idx).set(6);
    assert(cell == 6);

    reg.dec_count(*idx);
    assert(cell == 11);
    assert(drops == 1);
    assert(reg.use_count(*idx) == 0);
    std::cout << "drop_sets_cell_once ok\n";
}

static void destroyed_on_last_release_only() {
    std::int64_t cell = 0;
    int drops = 0;
    arcslot::SlotRegistry<DropSet, 4> reg;

    auto idx = reg.acquire_and_init([&] { return DropSet(7, &cell, &drops); });
    assert(idx);
    for (int i = 0; i < 3; ++i) reg.inc_count(*idx);
    assert(reg.use_count(*idx) == 4);

    for (int i = 0; i < 3; ++i) {
        reg.dec_count(*idx);
        assert(drops == 0);
        assert(reg.get_ref(*idx).v == 7); // still live
    }
    assert(reg.use_count(*idx) == 1);

    reg.dec_count(*idx);
    assert(drops == 1 && cell == 7);
    assert(reg.live_count() == 0);
    std::cout << "destroyed_on_last_release_only ok\n";
}

static void reuse_constructs_fresh_value() {
    std::int64_t cell_a = 0, cell_b = 0;
    int drops_a = 0, drops_b = 0;
    arcslot::SlotRegistry<DropSet, 1> reg;

    auto a = reg.acquire_and_init([&] { return DropSet(1, &cell_a, &drops_a); });
    assert(a && *a == 0);
    reg.dec_count(*a);
    assert(drops_a == 1);

    auto b = reg.acquire_and_init([&] { return DropSet(2, &cell_b, &drops_b); });
    assert(b && *b == 0);
    assert(reg.get_ref(*b).v == 2);
    reg.dec_count(*b);

    assert(drops_a == 1 && drops_b == 1);
    assert(cell_a == 1 && cell_b == 2);
    std::cout << "reuse_constructs_fresh_value ok\n";
}

static void init_skipped_when_full() {
    arcslot::SlotRegistry<int, 1> reg;
    auto idx = reg.acquire_and_init([] { return 1; });
    assert(idx);

    bool called = false;
    auto none = reg.acquire_and_init([&] { called = true; return 2; });
    assert(!none);
    assert(!called);

    reg.dec_count(*idx);
    std::cout << "init_skipped_when_full ok\n";
}

static void throwing_init_releases_claim() {
    arcslot::SlotRegistry<std::string, 2> reg;

    bool thrown = false;
    try {
        (void)reg.acquire_and_init([]() -> std::string { throw std::runtime_error("boom"); });
    } catch (const std::runtime_error& e) {
        thrown = std::string(e.what()) == "boom";
    }
    assert(thrown);
    assert(reg.live_count() == 0);

    auto idx = reg.acquire_and_init([] { return std::string("after"); });
    assert(idx && *idx == 0);
    assert(reg.get_ref(*idx) == "after");
    reg.dec_count(*idx);
    std::cout << "throwing_init_releases_claim ok\n";
}

struct alignas(128) Wide {
    std::int64_t v;
};

static void over_aligned_values() {
    static_assert(alignof(arcslot::Slot<Wide>) == 128, "slot honours alignof(T) above a cache line");
    static_assert(alignof(arcslot::Slot<std::int64_t>) == arcslot::CACHE_LINE, "small T keeps line alignment");

    arcslot::SlotRegistry<Wide, 2> reg;
    auto a = reg.acquire_and_init([] { return Wide{1}; });
    auto b = reg.acquire_and_init([] { return Wide{2}; });
    assert(a && b);
    assert(reinterpret_cast<std::uintptr_t>(&reg.get_ref(*a)) % 128 == 0);
    assert(reinterpret_cast<std::uintptr_t>(&reg.get_ref(*b)) % 128 == 0);
    assert(reg.get_ref(*a).v == 1 && reg.get_ref(*b).v == 2);
    reg.dec_count(*a);
    reg.dec_count(*b);
    std::cout << "over_aligned_values ok\n";
}

static void capacity_is_compile_time() {
    static_assert(arcslot::SlotRegistry<int, 5>::capacity() == 5, "capacity");
    auto nothrow_init = []() noexcept { return 1; };
    auto throwing_init = []() { return std::string("x"); };
    static_assert(noexcept(std::declval<arcslot::SlotRegistry<int, 5>&>()
                               .acquire_and_init(nothrow_init)),
                  "nothrow init keeps acquisition noexcept");
    static_assert(!noexcept(std::declval<arcslot::SlotRegistry<std::string, 5>&>()
                                .acquire_and_init(throwing_init)),
                  "throwing init makes acquisition throwing");
    std::cout << "capacity_is_compile_time ok\n";
}

int main() {
    fill_capacity();
    drop_sets_cell_once();
    destroyed_on_last_release_only();
    reuse_constructs_fresh_value();
    init_skipped_when_full();
    throwing_init_releases_claim();
    capacity_is_compile_time();
    over_aligned_values();
    std::cout << "PASS: correctness\n";
    return 0;
}
