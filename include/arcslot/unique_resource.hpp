#pragma once
#include <type_traits>
#include <utility>

namespace arcslot {

// Move-only owner of a raw native resource (file, socket, API object...).
// Runs the deleter exactly once, unless the resource was released.
// Stored in a SlotRegistry it becomes a native handle shared by refcount.
template <class R, class D>
class UniqueResource {
    static_assert(std::is_nothrow_move_constructible_v<R>, "resource must be nothrow-movable");

public:
    UniqueResource(R resource, D deleter)
        noexcept(std::is_nothrow_move_constructible_v<D>)
        : resource_(std::move(resource)), deleter_(std::move(deleter)), owns_(true) {}

    UniqueResource(UniqueResource&& other)
        noexcept(std::is_nothrow_move_constructible_v<D>)
        : resource_(std::move(other.resource_)),
          deleter_(std::move(other.deleter_)),
          owns_(std::exchange(other.owns_, false)) {}

    UniqueResource(const UniqueResource&) = delete;
    UniqueResource& operator=(const UniqueResource&) = delete;
    UniqueResource& operator=(UniqueResource&&) = delete;

    ~UniqueResource() {
        if (owns_) deleter_(resource_);
    }

    const R& get() const noexcept { return resource_; }
    const R& operator*() const noexcept { return resource_; }

    // Stops ownership; the caller becomes responsible for the resource.
    R release() noexcept {
        owns_ = false;
        return std::move(resource_);
    }

    bool owns() const noexcept { return owns_; }

private:
    R    resource_;
    D    deleter_;
    bool owns_;
};

template <class R, class D>
UniqueResource<R, std::decay_t<D>> make_unique_resource(R resource, D&& deleter) {
    return UniqueResource<R, std::decay_t<D>>(std::move(resource), std::forward<D>(deleter));
}

} // namespace arcslot
