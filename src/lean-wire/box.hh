#pragma once

#include <lean-wire/impl/heap_object.hh>

/// Unique owner of a single heap-allocated T (like std::unique_ptr, but never null after creation
/// unless moved from, and allocating from an lw::memory_resource).
/// Copies are deep: copying a box allocates a new T from the same resource.
template <class T>
struct lw::box
{
    // factories
public:
    template <class... Args>
    [[nodiscard]] static box create(Args&&... args)
    {
        return box(impl::create_heap_object<T>(nullptr, lw::forward<Args>(args)...), nullptr);
    }

    template <class... Args>
    [[nodiscard]] static box create_in(lw::memory_resource const* resource, Args&&... args)
    {
        return box(impl::create_heap_object<T>(resource, lw::forward<Args>(args)...), resource);
    }

    /// Fallible creation: out_of_memory{alloc} when the resource has no memory left.
    template <class... Args>
    [[nodiscard]] static lw::result<box, lw::out_of_memory> try_create_in(lw::memory_resource const* resource, Args&&... args)
    {
        auto p = impl::try_create_heap_object<T>(resource, lw::forward<Args>(args)...);
        if (p.has_error())
            return lw::error(p.error());
        return box(p.value(), resource);
    }

    // access
public:
    /// False only for moved-from boxes.
    [[nodiscard]] bool is_valid() const { return _ptr != nullptr; }

    [[nodiscard]] T& get()
    {
        LW_ASSERT(_ptr != nullptr, "accessing a moved-from box");
        return *_ptr;
    }
    [[nodiscard]] T const& get() const
    {
        LW_ASSERT(_ptr != nullptr, "accessing a moved-from box");
        return *_ptr;
    }

    [[nodiscard]] T& operator*() { return get(); }
    [[nodiscard]] T const& operator*() const { return get(); }
    [[nodiscard]] T* operator->() { return &get(); }
    [[nodiscard]] T const* operator->() const { return &get(); }

    [[nodiscard]] lw::memory_resource const* resource() const { return _resource; }

    [[nodiscard]] friend bool operator==(box const& a, box const& b) { return a.get() == b.get(); }

    // lifecycle
public:
    box(box&& rhs) noexcept : _ptr(lw::exchange(rhs._ptr, nullptr)), _resource(rhs._resource) {}
    box& operator=(box&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto tmp = lw::move(rhs);
            impl::destroy_heap_object(_ptr, _resource);
            _ptr = lw::exchange(tmp._ptr, nullptr);
            _resource = tmp._resource;
        }
        return *this;
    }

    box(box const& rhs) : _ptr(impl::create_heap_object<T>(rhs._resource, rhs.get())), _resource(rhs._resource) {}
    box& operator=(box const& rhs)
    {
        if (this != &rhs)
            *this = box(rhs);
        return *this;
    }

    ~box() { impl::destroy_heap_object(_ptr, _resource); }

private:
    box(T* p, lw::memory_resource const* resource) : _ptr(p), _resource(resource) {}

    T* _ptr = nullptr;
    lw::memory_resource const* _resource = nullptr;
};
