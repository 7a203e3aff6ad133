#pragma once

#include <lean-wire/allocation.hh>

// lw::partial_init_guard<T> fills reserved but uninitialized storage one object at a time
// and owns exactly the prefix that has been constructed so far.
//
// The guard binds an lw::allocation<T> whose live window [obj_start, obj_end) is empty.
// It keeps its own cursor; objects in [obj_start, cursor) are alive, [cursor, ...) is raw storage.
//
//   Armed(k)  --emplace-->  Armed(k + 1)
//   Armed(k)  --disarm-->   Disarmed     (allocation's live window becomes [obj_start, obj_start + k))
//   Armed(k)  --~guard-->   Unwound      (destroys [obj_start, obj_start + k) in reverse)
//
// The guard never frees memory: the bytes belong to the allocation and are returned by its destructor.
// Declaring the guard after the allocation makes the unwind order "objects first, bytes second".
//
// Usage:
//   auto alloc = ...;                      // empty live window, capacity for n
//   lw::partial_init_guard<T> guard(alloc);
//   for (isize i = 0; i < n; ++i)
//   {
//       auto r = decode_element();
//       if (r.has_error())
//           return lw::error(r.error());  // guard destroys the i elements built so far
//       guard.emplace(lw::move(r.value()));
//   }
//   guard.disarm();                        // alloc now owns n live objects

template <class T>
struct lw::partial_init_guard
{
    /// Binds to an allocation with an empty live window.
    explicit partial_init_guard(lw::allocation<T>& target) : _target(&target), _cursor(target.obj_start)
    {
        LW_ASSERT(target.obj_start == target.obj_end, "partial_init_guard requires an empty live window");
    }

    partial_init_guard(partial_init_guard const&) = delete;
    partial_init_guard& operator=(partial_init_guard const&) = delete;
    partial_init_guard(partial_init_guard&&) = delete;
    partial_init_guard& operator=(partial_init_guard&&) = delete;

    ~partial_init_guard()
    {
        if (_target != nullptr)
            impl::destroy_objects_in_reverse(_target->obj_start, _cursor);
    }

    // operations
public:
    /// Constructs the next object in place and advances the cursor.
    /// Precondition: armed, and there is room for one more object in the allocation.
    /// If T(...) throws, the cursor is unchanged.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        LW_ASSERT(_target != nullptr, "partial_init_guard is no longer armed");
        LW_ASSERT((lw::byte*)(_cursor + 1) <= _target->alloc_end, "partial_init_guard ran past the allocation");
        auto const p = new (lw::placement_new, _cursor) T(lw::forward<Args>(args)...);
        ++_cursor;
        return *p;
    }

    /// Number of constructed objects so far.
    [[nodiscard]] isize initialized() const { return _target != nullptr ? _cursor - _target->obj_start : 0; }

    [[nodiscard]] bool is_armed() const { return _target != nullptr; }

    /// Hands the constructed prefix over to the allocation. Terminal.
    void disarm()
    {
        LW_ASSERT(_target != nullptr, "partial_init_guard disarmed twice");
        _target->obj_end = _cursor;
        _target = nullptr;
    }

private:
    lw::allocation<T>* _target = nullptr;
    T* _cursor = nullptr;
};
