#pragma once

#include <lean-wire/assert.hh>
#include <lean-wire/fwd.hh>

#include <cstring>
#include <limits>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b) / min(a, b)       - larger / smaller of two values (requires operator<)
//   less                        - transparent operator< function object
//
// Swapping:
//   swap(a, b)                  - swap values, respects ADL swap overloads
//
// Overflow-checked arithmetic:
//   checked_add(a, b, out)      - false if a + b overflows
//   checked_mul(a, b, out)      - false if a * b overflows
//
// Alignment (value or pointer):
//   is_power_of_two(value)      - check if value is a power of 2
//   align_up(value, alignment)  - increment to next aligned boundary (power of 2)
//   is_aligned(value, alignment)- check if aligned at boundary (power of 2)
//
// Raw memory:
//   placement_new               - tag for lw-owned placement new (no <new> dependency)
//   memcpy(dest, src, bytes)    - isize-sized memcpy
//   storage_for<T>              - uninitialized storage with the size and alignment of T
//
// Template metaprogramming:
//   always_false_t<T...>        - always false for static_assert with type parameters
//   function_ptr<Signature>     - convert function signature to function pointer type
//

namespace lw
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   vec.push_back(lw::move(obj));
template <class T>
[[nodiscard]] LW_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] LW_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] LW_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto ptr = lw::exchange(p, nullptr);     // take ownership of p, set p to null
template <class T, class U = T>
[[nodiscard]] LW_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a (consistent with max returning b)
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Transparent "a < b" function object
/// Default ordering of lw::set, lw::map and lw::priority_queue
struct less
{
    template <class A, class B>
    [[nodiscard]] constexpr bool operator()(A const& a, B const& b) const
    {
        return a < b;
    }
};

// =========================================================================================================
// Swapping
// =========================================================================================================

namespace impl
{
struct swap_fn
{
    template <class T>
    constexpr void operator()(T& a, T& b) const;
};
} // namespace impl

/// ADL-aware swap that respects custom swap overloads
/// Implemented as a function object (not a function) so it cannot be found by ADL
[[maybe_unused]] constexpr impl::swap_fn swap;

// =========================================================================================================
// Overflow-checked arithmetic
// =========================================================================================================

/// Computes a + b into out
/// Returns false (and leaves out unspecified) if the result does not fit T
/// Usage:
///   isize total;
///   if (!lw::checked_add(claimed, amount, total))
///       return lw::error(decode_error::limit_exceeded());
template <class T>
[[nodiscard]] constexpr bool checked_add(T a, T b, T& out)
{
    static_assert(std::is_integral_v<T>, "checked_add requires an integral type");
    return !__builtin_add_overflow(a, b, &out);
}

/// Computes a * b into out
/// Returns false (and leaves out unspecified) if the result does not fit T
template <class T>
[[nodiscard]] constexpr bool checked_mul(T a, T b, T& out)
{
    static_assert(std::is_integral_v<T>, "checked_mul requires an integral type");
    return !__builtin_mul_overflow(a, b, &out);
}

// =========================================================================================================
// Alignment (for values or pointers)
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    LW_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Increment value to align at the given boundary
/// Usage:
///   int val = lw::align_up(300, 64);             // = 320 (next multiple of 64)
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    LW_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of 2");
    auto const mask = alignment - 1;
    return (T)(((isize)value + mask) & ~mask);
}

/// Check if value is aligned at the given boundary
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    LW_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of 2");
    return 0 == ((isize)value & (alignment - 1));
}

// =========================================================================================================
// Raw memory
// =========================================================================================================

/// Tag selecting the lean-wire placement new overload
/// Usage:
///   new (lw::placement_new, ptr) T(args...);
struct placement_new_tag
{
};
constexpr placement_new_tag placement_new = {};

/// memcpy taking a signed byte count
/// bytes == 0 is valid, even with nullptr arguments
inline void memcpy(void* dest, void const* src, isize bytes)
{
    LW_ASSERT(bytes >= 0, "memcpy: byte count must be non-negative");
    if (bytes > 0)
        std::memcpy(dest, src, size_t(bytes));
}

/// Uninitialized storage with size and alignment of T
/// The value member is never constructed or destroyed automatically
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

// =========================================================================================================
// Template metaprogramming
// =========================================================================================================

/// Always false, for static_assert in templates that must not be instantiated
/// Usage:
///   static_assert(lw::always_false_t<T>, "no codec for this type");
template <class... T>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   lw::function_ptr<int(float, double)>          -> int (*)(float, double)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

} // namespace lw

// placement new without <new>
// the tag makes sure this never collides with the standard placement form
inline void* operator new(std::size_t, lw::placement_new_tag, void* buffer) noexcept
{
    return buffer;
}
inline void operator delete(void*, lw::placement_new_tag, void*) noexcept {}

// =========================================================================================================
// Implementation
// =========================================================================================================

// must be done outside of the lw namespace so lw::swap cannot be found anymore
namespace _no_lw_namespace // NOLINT
{
template <class T>
constexpr void do_swap_impl(T& a, T& b)
{
    if constexpr (requires { swap(a, b); })
    {
        swap(a, b);
    }
    else
    {
        T tmp = static_cast<T&&>(a);
        a = static_cast<T&&>(b);
        b = static_cast<T&&>(tmp);
    }
}
} // namespace _no_lw_namespace

template <class T>
constexpr void lw::impl::swap_fn::operator()(T& a, T& b) const
{
    _no_lw_namespace::do_swap_impl(a, b);
}
