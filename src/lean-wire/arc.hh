#pragma once

#include <lean-wire/impl/heap_object.hh>

#include <atomic>

/// Thread-safe shared owner of a heap-allocated T with an atomic reference count.
/// Same surface as lw::rc; only the counting discipline differs.
/// The pointee itself is not synchronized: get_mut() only hands out access while uniquely owned.
template <class T>
struct lw::arc
{
    // factories
public:
    template <class... Args>
    [[nodiscard]] static arc create(Args&&... args)
    {
        return arc(impl::create_heap_object<block>(nullptr, lw::forward<Args>(args)...), nullptr);
    }

    /// Fallible creation: out_of_memory{alloc} when the resource has no memory left.
    template <class... Args>
    [[nodiscard]] static lw::result<arc, lw::out_of_memory> try_create_in(lw::memory_resource const* resource, Args&&... args)
    {
        auto p = impl::try_create_heap_object<block>(resource, lw::forward<Args>(args)...);
        if (p.has_error())
            return lw::error(p.error());
        return arc(p.value(), resource);
    }

    // access
public:
    [[nodiscard]] bool is_valid() const { return _block != nullptr; }

    [[nodiscard]] T const& get() const
    {
        LW_ASSERT(_block != nullptr, "accessing a moved-from arc");
        return _block->value;
    }
    [[nodiscard]] T const& operator*() const { return get(); }
    [[nodiscard]] T const* operator->() const { return &get(); }

    /// Snapshot of the owner count; may be stale as soon as it returns.
    [[nodiscard]] isize use_count() const
    {
        return _block != nullptr ? std::atomic_ref<isize>(_block->count).load(std::memory_order_acquire) : 0;
    }

    /// Mutable access if this is the only owner, nullptr otherwise.
    [[nodiscard]] T* get_mut() { return use_count() == 1 ? &_block->value : nullptr; }

    [[nodiscard]] bool ptr_eq(arc const& rhs) const { return _block == rhs._block; }

    [[nodiscard]] friend bool operator==(arc const& a, arc const& b) { return a.get() == b.get(); }

    // lifecycle
public:
    arc(arc const& rhs) : _block(rhs._block), _resource(rhs._resource)
    {
        if (_block != nullptr)
            std::atomic_ref<isize>(_block->count).fetch_add(1, std::memory_order_relaxed);
    }
    arc& operator=(arc const& rhs)
    {
        if (this != &rhs)
        {
            arc tmp(rhs);
            lw::swap(_block, tmp._block);
            lw::swap(_resource, tmp._resource);
        }
        return *this;
    }
    arc(arc&& rhs) noexcept : _block(lw::exchange(rhs._block, nullptr)), _resource(rhs._resource) {}
    arc& operator=(arc&& rhs) noexcept
    {
        if (this != &rhs)
        {
            arc tmp(lw::move(rhs));
            lw::swap(_block, tmp._block);
            lw::swap(_resource, tmp._resource);
        }
        return *this;
    }
    ~arc()
    {
        if (_block != nullptr && std::atomic_ref<isize>(_block->count).fetch_sub(1, std::memory_order_acq_rel) == 1)
            impl::destroy_heap_object(_block, _resource);
    }

private:
    struct block
    {
        alignas(std::atomic_ref<isize>::required_alignment) isize count = 1;
        T value;

        template <class... Args>
        explicit block(Args&&... args) : value(lw::forward<Args>(args)...)
        {
        }
    };

    arc(block* b, lw::memory_resource const* resource) : _block(b), _resource(resource) {}

    block* _block = nullptr;
    lw::memory_resource const* _resource = nullptr;
};
