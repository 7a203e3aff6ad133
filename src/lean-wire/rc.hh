#pragma once

#include <lean-wire/impl/heap_object.hh>

/// Single-thread shared owner of a heap-allocated T with a plain (non-atomic) reference count.
/// Copies share the object; the last owner destroys it.
/// Mutation requires unique ownership: get_mut() returns nullptr while the object is shared.
/// Use lw::arc when owners live on different threads.
template <class T>
struct lw::rc
{
    // factories
public:
    template <class... Args>
    [[nodiscard]] static rc create(Args&&... args)
    {
        return rc(impl::create_heap_object<block>(nullptr, lw::forward<Args>(args)...), nullptr);
    }

    /// Fallible creation: out_of_memory{alloc} when the resource has no memory left.
    template <class... Args>
    [[nodiscard]] static lw::result<rc, lw::out_of_memory> try_create_in(lw::memory_resource const* resource, Args&&... args)
    {
        auto p = impl::try_create_heap_object<block>(resource, lw::forward<Args>(args)...);
        if (p.has_error())
            return lw::error(p.error());
        return rc(p.value(), resource);
    }

    // access
public:
    [[nodiscard]] bool is_valid() const { return _block != nullptr; }

    [[nodiscard]] T const& get() const
    {
        LW_ASSERT(_block != nullptr, "accessing a moved-from rc");
        return _block->value;
    }
    [[nodiscard]] T const& operator*() const { return get(); }
    [[nodiscard]] T const* operator->() const { return &get(); }

    /// Number of rc instances sharing the object (0 for moved-from).
    [[nodiscard]] isize use_count() const { return _block != nullptr ? _block->count : 0; }

    /// Mutable access if this is the only owner, nullptr otherwise.
    [[nodiscard]] T* get_mut() { return _block != nullptr && _block->count == 1 ? &_block->value : nullptr; }

    /// True iff both share the same object.
    [[nodiscard]] bool ptr_eq(rc const& rhs) const { return _block == rhs._block; }

    [[nodiscard]] friend bool operator==(rc const& a, rc const& b) { return a.get() == b.get(); }

    // lifecycle
public:
    rc(rc const& rhs) : _block(rhs._block), _resource(rhs._resource)
    {
        if (_block != nullptr)
            ++_block->count;
    }
    rc& operator=(rc const& rhs)
    {
        if (this != &rhs)
        {
            rc tmp(rhs);
            lw::swap(_block, tmp._block);
            lw::swap(_resource, tmp._resource);
        }
        return *this;
    }
    rc(rc&& rhs) noexcept : _block(lw::exchange(rhs._block, nullptr)), _resource(rhs._resource) {}
    rc& operator=(rc&& rhs) noexcept
    {
        if (this != &rhs)
        {
            rc tmp(lw::move(rhs));
            lw::swap(_block, tmp._block);
            lw::swap(_resource, tmp._resource);
        }
        return *this;
    }
    ~rc()
    {
        if (_block != nullptr && --_block->count == 0)
            impl::destroy_heap_object(_block, _resource);
    }

private:
    struct block
    {
        isize count = 1;
        T value;

        template <class... Args>
        explicit block(Args&&... args) : value(lw::forward<Args>(args)...)
        {
        }
    };

    rc(block* b, lw::memory_resource const* resource) : _block(b), _resource(resource) {}

    block* _block = nullptr;
    lw::memory_resource const* _resource = nullptr;
};
