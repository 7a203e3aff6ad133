#pragma once

#include <lean-wire/assert.hh>
#include <lean-wire/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// Stores a pointer and runtime size.
/// Trivially copyable regardless of T's triviality.
/// Does not own the underlying memory; caller must ensure the referenced data outlives the span.
/// Readers and writers exchange bytes as span<byte const> / span<byte>.
template <class T>
struct lw::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    // keep triviality
    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        LW_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span viewing [begin, end).
    /// Precondition: begin <= end.
    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        LW_ASSERT(begin <= end, "invalid pointer range");
    }

    /// Creates a span from an initializer_list.
    /// Only available when T is const; allows calling foo({1, 2, 3}) for foo(span<int const>).
    /// WARNING: initializer_list temporaries are destroyed at the end of the full expression.
    /// Safe ONLY as an immediate function argument.
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    /// Creates a span viewing the entire C array.
    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    /// Creates a span from any container providing .data() and .size().
    /// The span does not own the container; the container must outlive the span.
    template <class Container>
        requires requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size()))
    {
    }

    /// span<T> converts implicitly to span<T const>.
    template <class U>
        requires(std::is_same_v<T, U const> && !std::is_same_v<T, U>)
    constexpr span(span<U> rhs) : _data(rhs.data()), _size(rhs.size())
    {
    }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        LW_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T& front() const
    {
        LW_ASSERT(_size > 0, "front() called on empty span");
        return _data[0];
    }

    [[nodiscard]] constexpr T& back() const
    {
        LW_ASSERT(_size > 0, "back() called on empty span");
        return _data[_size - 1];
    }

    /// May be nullptr if the span is default-constructed or empty.
    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr isize size_bytes() const { return _size * isize(sizeof(T)); }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // subviews
public:
    /// Returns the view [offset, offset + count).
    /// Precondition: 0 <= offset, 0 <= count, offset + count <= size().
    [[nodiscard]] constexpr span subspan(isize offset, isize count) const
    {
        LW_ASSERT(0 <= offset && 0 <= count && offset + count <= _size, "subspan out of bounds");
        return span(_data + offset, count);
    }

    /// Returns the view [offset, size()).
    [[nodiscard]] constexpr span subspan(isize offset) const
    {
        LW_ASSERT(0 <= offset && offset <= _size, "subspan out of bounds");
        return span(_data + offset, _size - offset);
    }

    /// Returns the first count elements.
    [[nodiscard]] constexpr span first(isize count) const { return subspan(0, count); }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};

namespace lw
{
/// Views the object representation of a span as bytes.
/// Only meaningful for trivially copyable T.
template <class T>
[[nodiscard]] span<byte const> as_bytes(span<T> s)
{
    static_assert(std::is_trivially_copyable_v<std::remove_const_t<T>>, "as_bytes requires a trivially copyable type");
    return span<byte const>(reinterpret_cast<byte const*>(s.data()), s.size_bytes());
}
} // namespace lw
