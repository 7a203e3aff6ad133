#pragma once

#include <lean-wire/fwd.hh>
#include <lean-wire/utility.hh>

#include <type_traits>

// Object lifetime primitives over raw storage.
//
// All "create" functions follow the same cursor protocol:
//   the caller passes a T*& cursor pointing at the first uninitialized slot,
//   the function constructs one object at a time and advances the cursor _after_ each construction.
// If a constructor throws, the cursor still marks the end of the constructed prefix,
// so the owner (lw::allocation or lw::partial_init_guard) destroys exactly what exists.
//
// Empty ranges and nullptr ranges are valid no-ops everywhere.

namespace lw::impl
{
/// Runs destructors on [start, end), last object first.
/// Compiles to nothing for trivially destructible T.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Constructs `count` value-initialized objects at dest_end (T() zero-initializes trivial types).
template <class T>
constexpr void default_create_objects_to(T*& dest_end, isize count)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_default_constructible_v<T>, "T must be default constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (lw::placement_new, dest_end) T();
        ++dest_end;
    }
}

/// Constructs `count` copies of `value` at dest_end.
template <class T>
constexpr void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (lw::placement_new, dest_end) T(value);
        ++dest_end;
    }
}

/// Copy-constructs [src_start, src_end) at dest_end.
/// Trivially copyable T is a single memcpy.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const count = src_end - src_start;
        if (count > 0)
        {
            lw::memcpy(dest_end, src_start, count * isize(sizeof(T)));
            dest_end += count;
        }
    }
    else
    {
        for (; src_start != src_end; ++src_start)
        {
            new (lw::placement_new, dest_end) T(*src_start);
            ++dest_end;
        }
    }
}

/// Move-constructs [src_start, src_end) at dest_end.
/// The sources stay alive (moved-from) and are still owned by their allocation.
/// No guarantees beyond "structurally valid" if a move constructor throws.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const count = src_end - src_start;
        if (count > 0)
        {
            lw::memcpy(dest_end, src_start, count * isize(sizeof(T)));
            dest_end += count;
        }
    }
    else
    {
        for (; src_start != src_end; ++src_start)
        {
            new (lw::placement_new, dest_end) T(lw::move(*src_start));
            ++dest_end;
        }
    }
}

/// Move-constructs [src_start, src_end) so that the last source lands at dest_start - 1,
/// walking backwards. dest_start is decremented after each construction.
template <class T>
constexpr void move_create_objects_to_reverse(T*& dest_start, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const count = src_end - src_start;
        if (count > 0)
        {
            dest_start -= count;
            lw::memcpy(dest_start, src_start, count * isize(sizeof(T)));
        }
    }
    else
    {
        while (src_end != src_start)
        {
            --src_end;
            new (lw::placement_new, dest_start - 1) T(lw::move(*src_end));
            --dest_start;
        }
    }
}

/// Moves the object at `last` down to `pos` by successive swaps, shifting [pos, last) up by one slot.
/// All objects in [pos, last] must be alive. Used to turn an append into an ordered insert.
template <class T>
constexpr void rotate_last_to(T* pos, T* last)
{
    while (last != pos)
    {
        lw::swap(*(last - 1), *last);
        --last;
    }
}

/// Move-assigns (pos, end) down by one slot over pos, leaving end - 1 in a moved-from state.
/// All objects in [pos, end) must be alive. The caller destroys end - 1 afterwards.
template <class T>
constexpr void shift_objects_down_over(T* pos, T* end)
{
    for (auto p = pos + 1; p != end; ++p)
        *(p - 1) = lw::move(*p);
}
} // namespace lw::impl
