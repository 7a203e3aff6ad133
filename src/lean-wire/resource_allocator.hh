#pragma once

#include <lean-wire/allocation.hh>
#include <lean-wire/utility.hh>

#include <cstddef>
#include <limits>
#include <new>

/// Standard-library allocator on top of an lw::memory_resource.
///
/// Lets standard containers (std::unordered_set, std::unordered_map, ...) allocate from the same resource
/// as lean-wire's own containers. The decoder hands its resource to any container whose allocator is
/// constructible from a memory_resource pointer.
///
/// Allocation uses the fallible entry point; a refusal throws std::bad_alloc,
/// the only failure channel the standard containers have.
/// A default-constructed allocator uses lw::default_memory_resource.
template <class T>
struct lw::resource_allocator
{
    using value_type = T;

    resource_allocator() = default;
    explicit resource_allocator(lw::memory_resource const* resource) : _resource(resource) {}

    template <class U>
    resource_allocator(resource_allocator<U> const& rhs) : _resource(rhs.resource()) // NOLINT
    {
    }

    [[nodiscard]] lw::memory_resource const* resource() const { return _resource; }

    [[nodiscard]] T* allocate(std::size_t count)
    {
        isize bytes = 0;
        if (count > std::size_t(std::numeric_limits<isize>::max()) || !lw::checked_mul(isize(count), isize(sizeof(T)), bytes))
            throw std::bad_alloc();

        auto const& res = get();
        lw::byte* p = nullptr;
        // min == max, so the block is exactly `bytes` long and deallocate can recompute its size
        if (res.try_allocate_bytes(&p, bytes, bytes, isize(alignof(T)), res.userdata) < 0)
            throw std::bad_alloc();
        return reinterpret_cast<T*>(p);
    }

    void deallocate(T* p, std::size_t count)
    {
        if (p == nullptr)
            return;
        auto const& res = get();
        res.deallocate_bytes(reinterpret_cast<lw::byte*>(p), isize(count * sizeof(T)), isize(alignof(T)), res.userdata);
    }

    template <class U>
    [[nodiscard]] friend bool operator==(resource_allocator const& a, resource_allocator<U> const& b)
    {
        return &a.get() == &b.get();
    }

    [[nodiscard]] lw::memory_resource const& get() const { return _resource ? *_resource : *lw::default_memory_resource; }

private:
    lw::memory_resource const* _resource = nullptr;
};
