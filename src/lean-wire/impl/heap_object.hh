#pragma once

#include <lean-wire/allocation.hh>
#include <lean-wire/errors.hh>
#include <lean-wire/result.hh>

// Single-object heap allocation from an lw::memory_resource.
// Backs lw::box, lw::rc and lw::arc.
//
// The fallible path reports failure as out_of_memory{oom_source::alloc, sizeof(T)}.
// If T's constructor throws, the bytes are returned before the exception leaves.

namespace lw::impl
{
template <class T>
struct heap_object_bytes
{
    lw::byte* bytes = nullptr;
    lw::memory_resource const* resource = nullptr;

    heap_object_bytes(lw::byte* b, lw::memory_resource const* r) : bytes(b), resource(r) {}
    heap_object_bytes(heap_object_bytes const&) = delete;
    heap_object_bytes& operator=(heap_object_bytes const&) = delete;

    /// frees the bytes unless release() was called (constructor threw)
    ~heap_object_bytes()
    {
        if (bytes != nullptr)
        {
            auto const& res = resource ? *resource : *default_memory_resource;
            res.deallocate_bytes(bytes, isize(sizeof(T)), isize(alignof(T)), res.userdata);
        }
    }

    T* release() { return reinterpret_cast<T*>(lw::exchange(bytes, nullptr)); }
};

/// Allocates and constructs one T. Allocation failure is fatal.
template <class T, class... Args>
[[nodiscard]] T* create_heap_object(lw::memory_resource const* resource, Args&&... args)
{
    auto const& res = resource ? *resource : *default_memory_resource;
    lw::byte* p = nullptr;
    res.allocate_bytes(&p, isize(sizeof(T)), isize(sizeof(T)), isize(alignof(T)), res.userdata);

    heap_object_bytes<T> guard(p, resource);
    new (lw::placement_new, p) T(lw::forward<Args>(args)...);
    return guard.release();
}

/// Allocates and constructs one T, reporting allocation failure.
template <class T, class... Args>
[[nodiscard]] lw::result<T*, lw::out_of_memory> try_create_heap_object(lw::memory_resource const* resource, Args&&... args)
{
    auto const& res = resource ? *resource : *default_memory_resource;
    lw::byte* p = nullptr;
    auto const got = res.try_allocate_bytes(&p, isize(sizeof(T)), isize(sizeof(T)), isize(alignof(T)), res.userdata);
    if (got < 0 || p == nullptr)
        return lw::error(lw::out_of_memory{.source = oom_source::alloc, .requested_bytes = isize(sizeof(T))});

    heap_object_bytes<T> guard(p, resource);
    new (lw::placement_new, p) T(lw::forward<Args>(args)...);
    return guard.release();
}

/// Destroys and frees an object created by (try_)create_heap_object with the same resource.
template <class T>
void destroy_heap_object(T* p, lw::memory_resource const* resource)
{
    if (p == nullptr)
        return;
    p->~T();
    auto const& res = resource ? *resource : *default_memory_resource;
    res.deallocate_bytes(reinterpret_cast<lw::byte*>(p), isize(sizeof(T)), isize(alignof(T)), res.userdata);
}
} // namespace lw::impl
