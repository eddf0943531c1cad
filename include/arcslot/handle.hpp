#pragma once
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include "slot_registry.hpp"

namespace arcslot {

// Thrown by Handle::create_or_throw when every slot is taken.
class CapacityError : public std::runtime_error {
public:
    explicit CapacityError(std::size_t capacity)
        : std::runtime_error("arcslot: no free slot (capacity " + std::to_string(capacity) + ")"),
          capacity_(capacity) {}

    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
};

// Owns one reference on a live slot of a SlotRegistry<T, N>.
//
// Handles only come from a successful acquisition or from copying another
// handle, so a non-empty handle always points at a live value:
//   - copy         -> inc_count before the copy exists
//   - destruction  -> dec_count exactly once
//   - move         -> no refcount traffic, source becomes empty
//
// The value is shared: concurrent readers are fine, mutation through get()
// needs T's own synchronization.
template <class T, std::size_t N>
class Handle {
public:
    using registry_type = SlotRegistry<T, N>;

    Handle() noexcept = default;

    template <class F>
    static std::optional<Handle> create(registry_type& registry, F&& init) {
        std::optional<std::size_t> idx = registry.acquire_and_init(std::forward<F>(init));
        if (!idx) return std::nullopt;
        return Handle(registry, *idx);
    }

    template <class F>
    static std::optional<Handle> create(F&& init) {
        return create(registry_type::global(), std::forward<F>(init));
    }

    template <class F>
    static Handle create_or_throw(registry_type& registry, F&& init) {
        std::optional<Handle> h = create(registry, std::forward<F>(init));
        if (!h) throw CapacityError(N);
        return std::move(*h);
    }

    template <class F>
    static Handle create_or_throw(F&& init) {
        return create_or_throw(registry_type::global(), std::forward<F>(init));
    }

    Handle(const Handle& other) noexcept
        : registry_(other.registry_), index_(other.index_) {
        if (registry_) registry_->inc_count(index_);
    }

    Handle(Handle&& other) noexcept
        : registry_(std::exchange(other.registry_, nullptr)), index_(other.index_) {}

    Handle& operator=(const Handle& other) noexcept {
        if (this != &other) {
            Handle tmp(other);
            swap(tmp);
        }
        return *this;
    }

    Handle& operator=(Handle&& other) noexcept {
        if (this != &other) {
            reset();
            registry_ = std::exchange(other.registry_, nullptr);
            index_ = other.index_;
        }
        return *this;
    }

    ~Handle() { reset(); }

    // Gives up this handle's reference now. No-op on an empty handle.
    void reset() noexcept {
        if (registry_) {
            std::exchange(registry_, nullptr)->dec_count(index_);
        }
    }

    void swap(Handle& other) noexcept {
        std::swap(registry_, other.registry_);
        std::swap(index_, other.index_);
    }

    const T& get() const noexcept {
        assert(registry_ && "get on empty handle");
        return registry_->get_ref(index_);
    }
    const T& operator*() const noexcept { return get(); }
    const T* operator->() const noexcept { return &get(); }

    explicit operator bool() const noexcept { return registry_ != nullptr; }

    std::size_t index() const noexcept { return index_; }
    registry_type* registry() const noexcept { return registry_; }

    // Snapshot; 0 for an empty handle.
    std::uint64_t use_count() const noexcept {
        return registry_ ? registry_->use_count(index_) : 0;
    }

    friend bool operator==(const Handle& a, const Handle& b) noexcept {
        if (!a.registry_ || !b.registry_) return a.registry_ == b.registry_;
        return a.registry_ == b.registry_ && a.index_ == b.index_;
    }
    friend bool operator!=(const Handle& a, const Handle& b) noexcept { return !(a == b); }

private:
    Handle(registry_type& registry, std::size_t index) noexcept
        : registry_(&registry), index_(index) {}

    registry_type* registry_ = nullptr;
    std::size_t    index_ = 0;
};

template <class T, std::size_t N>
void swap(Handle<T, N>& a, Handle<T, N>& b) noexcept { a.swap(b); }

} // namespace arcslot
