#pragma once

#include <lean-wire/assert.hh>
#include <lean-wire/fwd.hh>
#include <lean-wire/utility.hh>

#include <type_traits>

// =========================================================================================================
// lw::result<T, E> - value or error
// =========================================================================================================
//
// The return type of every operation that can fail for reasons outside the programmer's control:
// malformed input, an exhausted decode budget, allocation failure.
//
// Construction:
//   lw::result<int, decode_error> r = 42;                          // value
//   lw::result<int, decode_error> r = lw::error(some_error);       // error
//   lw::result<void, decode_error> r = {};                         // success (void results only)
//
// Propagation pattern:
//   auto len = lw::decode_len(dec);
//   if (len.has_error())
//       return lw::error(lw::move(len.error()));
//
//   LW_TRY(enc.write_bytes(bytes));  // shorthand for result<void, E>
//
// Semantics:
//   - A default-constructed result<T, E> holds a value-initialized error (there is no "empty" state).
//   - A default-constructed result<void, E> is a success.
//   - result<T, E> is trivially copyable/destructible when both T and E are.
//   - Errors convert along E: a result<U, G> converts into result<T, E> if T is constructible from U
//     and E from G, and lw::error(g) initializes any result whose E is constructible from G.
//

namespace lw
{
/// Wrapper marking a value as an error for result construction
/// Usually produced by lw::error(e)
template <class E>
struct as_error_t
{
    E value;
};

/// Marks e as the error alternative of a result
/// Usage:
///   return lw::error(decode_error::limit_exceeded());
template <class E>
[[nodiscard]] constexpr as_error_t<std::remove_cvref_t<E>> error(E&& e)
{
    return as_error_t<std::remove_cvref_t<E>>{lw::forward<E>(e)};
}

namespace impl
{
template <class T>
constexpr bool is_as_error = false;
template <class E>
constexpr bool is_as_error<as_error_t<E>> = true;

template <class T>
constexpr bool is_result = false;
template <class T, class E>
constexpr bool is_result<result<T, E>> = true;
} // namespace impl
} // namespace lw

/// Early-return the error of a result<void, E> expression
/// The enclosing function must return a result whose error type is constructible from E
#define LW_TRY(expr)                                                       \
    do                                                                     \
    {                                                                      \
        auto&& _lw_try_res = (expr);                                       \
        if (_lw_try_res.has_error()) [[unlikely]]                          \
            return ::lw::error(::lw::move(_lw_try_res.error()));           \
    } while (false)

template <class T, class E>
struct lw::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support references");

    static constexpr bool is_trivially_copyable = std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>;
    static constexpr bool is_trivially_destructible
        = std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>;

    // construction
public:
    /// Default result holds a value-initialized error.
    constexpr result() : _has_value(false) { new (lw::placement_new, &_error) E(); }

    /// Constructs a result holding a value; anything T is constructible from is accepted.
    template <class U = T>
        requires(std::is_constructible_v<T, U &&> && !impl::is_as_error<std::remove_cvref_t<U>>
                 && !impl::is_result<std::remove_cvref_t<U>>)
    constexpr result(U&& value) : _has_value(true) // NOLINT
    {
        new (lw::placement_new, &_value) T(lw::forward<U>(value));
    }

    /// Constructs a result holding an error.
    template <class G>
        requires std::is_constructible_v<E, G &&>
    constexpr result(as_error_t<G>&& err) : _has_value(false) // NOLINT
    {
        new (lw::placement_new, &_error) E(lw::move(err.value));
    }
    template <class G>
        requires std::is_constructible_v<E, G const&>
    constexpr result(as_error_t<G> const& err) : _has_value(false) // NOLINT
    {
        new (lw::placement_new, &_error) E(err.value);
    }

    /// Converts from a result with compatible value and error types.
    template <class U, class G>
        requires(!std::is_same_v<result<U, G>, result> && std::is_constructible_v<T, U &&> && std::is_constructible_v<E, G &&>)
    constexpr result(result<U, G>&& rhs) : _has_value(rhs.has_value())
    {
        if (_has_value)
            new (lw::placement_new, &_value) T(lw::move(rhs).value());
        else
            new (lw::placement_new, &_error) E(lw::move(rhs).error());
    }

    // trivial copy/move/destroy
public:
    constexpr result(result const&)
        requires is_trivially_copyable
    = default;
    constexpr result(result&&)
        requires is_trivially_copyable
    = default;
    constexpr result& operator=(result const&)
        requires is_trivially_copyable
    = default;
    constexpr result& operator=(result&&)
        requires is_trivially_copyable
    = default;
    constexpr ~result()
        requires is_trivially_destructible
    = default;

    // non-trivial copy/move/destroy
public:
    constexpr result(result const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (lw::placement_new, &_value) T(rhs._value);
        else
            new (lw::placement_new, &_error) E(rhs._error);
    }

    constexpr result(result&& rhs) noexcept
        requires(!is_trivially_copyable)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (lw::placement_new, &_value) T(lw::move(rhs._value));
        else
            new (lw::placement_new, &_error) E(lw::move(rhs._error));
    }

    /// Same alternative: copy-assigns. Different alternative: destroys ours, copy-constructs theirs.
    constexpr result& operator=(result const& rhs)
        requires(!is_trivially_copyable && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
        {
            if (_has_value && rhs._has_value)
                _value = rhs._value;
            else if (!_has_value && !rhs._has_value)
                _error = rhs._error;
            else
            {
                destroy_active();
                _has_value = rhs._has_value;
                if (_has_value)
                    new (lw::placement_new, &_value) T(rhs._value);
                else
                    new (lw::placement_new, &_error) E(rhs._error);
            }
        }
        return *this;
    }

    constexpr result& operator=(result&& rhs) noexcept
        requires(!is_trivially_copyable)
    {
        if (this != &rhs)
        {
            if (_has_value && rhs._has_value)
                _value = lw::move(rhs._value);
            else if (!_has_value && !rhs._has_value)
                _error = lw::move(rhs._error);
            else
            {
                destroy_active();
                _has_value = rhs._has_value;
                if (_has_value)
                    new (lw::placement_new, &_value) T(lw::move(rhs._value));
                else
                    new (lw::placement_new, &_error) E(lw::move(rhs._error));
            }
        }
        return *this;
    }

    constexpr ~result()
        requires(!is_trivially_destructible)
    {
        destroy_active();
    }

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    /// Returns the held value, preserving the value category of the result.
    /// Precondition: has_value().
    template <class Self>
    [[nodiscard]] constexpr auto&& value(this Self&& self)
    {
        LW_ASSERT(self._has_value, "attempted to access value of a result holding an error");
        return static_cast<Self&&>(self)._value;
    }

    /// Returns the held error, preserving the value category of the result.
    /// Precondition: has_error().
    template <class Self>
    [[nodiscard]] constexpr auto&& error(this Self&& self)
    {
        LW_ASSERT(!self._has_value, "attempted to access error of a result holding a value");
        return static_cast<Self&&>(self)._error;
    }

    /// Returns the value or the given fallback.
    template <class Self, class U>
    [[nodiscard]] constexpr T value_or(this Self&& self, U&& fallback)
    {
        if (self._has_value)
            return static_cast<Self&&>(self)._value;
        return static_cast<T>(lw::forward<U>(fallback));
    }

    /// Returns the error or the given fallback.
    template <class Self, class G>
    [[nodiscard]] constexpr E error_or(this Self&& self, G&& fallback)
    {
        if (!self._has_value)
            return static_cast<Self&&>(self)._error;
        return static_cast<E>(lw::forward<G>(fallback));
    }

    // modifiers
public:
    /// Replaces the content with a value constructed from args.
    /// The new value is built before the old content is destroyed, so a throwing T(...) leaves *this untouched.
    template <class... Args>
    constexpr T& emplace_value(Args&&... args)
    {
        T tmp(lw::forward<Args>(args)...);
        destroy_active();
        new (lw::placement_new, &_value) T(lw::move(tmp));
        _has_value = true;
        return _value;
    }

    /// Replaces the content with an error constructed from args.
    /// The new error is built before the old content is destroyed, so a throwing E(...) leaves *this untouched.
    template <class... Args>
    constexpr E& emplace_error(Args&&... args)
    {
        E tmp(lw::forward<Args>(args)...);
        destroy_active();
        new (lw::placement_new, &_error) E(lw::move(tmp));
        _has_value = false;
        return _error;
    }

private:
    constexpr void destroy_active()
    {
        if (_has_value)
            _value.~T();
        else
            _error.~E();
    }

    union
    {
        T _value;
        E _error;
    };
    bool _has_value;
};

/// Specialization for operations that either succeed without a value or fail with E.
/// Default-constructed and {} results are successes.
template <class E>
struct lw::result<void, E>
{
    // construction
public:
    constexpr result() = default;

    template <class G>
        requires std::is_constructible_v<E, G &&>
    constexpr result(as_error_t<G>&& err) : _has_value(false) // NOLINT
    {
        new (lw::placement_new, &_error.value) E(lw::move(err.value));
    }
    template <class G>
        requires std::is_constructible_v<E, G const&>
    constexpr result(as_error_t<G> const& err) : _has_value(false) // NOLINT
    {
        new (lw::placement_new, &_error.value) E(err.value);
    }

    template <class G>
        requires(!std::is_same_v<G, E> && std::is_constructible_v<E, G &&>)
    constexpr result(result<void, G>&& rhs) : _has_value(rhs.has_value())
    {
        if (!_has_value)
            new (lw::placement_new, &_error.value) E(lw::move(rhs).error());
    }

    constexpr result(result const& rhs)
        requires std::is_copy_constructible_v<E>
      : _has_value(rhs._has_value)
    {
        if (!_has_value)
            new (lw::placement_new, &_error.value) E(rhs._error.value);
    }
    constexpr result(result&& rhs) noexcept : _has_value(rhs._has_value)
    {
        if (!_has_value)
            new (lw::placement_new, &_error.value) E(lw::move(rhs._error.value));
    }
    constexpr result& operator=(result const& rhs)
        requires std::is_copy_constructible_v<E>
    {
        if (this != &rhs)
        {
            reset();
            _has_value = rhs._has_value;
            if (!_has_value)
                new (lw::placement_new, &_error.value) E(rhs._error.value);
        }
        return *this;
    }
    constexpr result& operator=(result&& rhs) noexcept
    {
        if (this != &rhs)
        {
            reset();
            _has_value = rhs._has_value;
            if (!_has_value)
                new (lw::placement_new, &_error.value) E(lw::move(rhs._error.value));
        }
        return *this;
    }
    constexpr ~result() { reset(); }

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    /// Returns the held error, preserving the value category of the result.
    /// Precondition: has_error().
    template <class Self>
    [[nodiscard]] constexpr auto&& error(this Self&& self)
    {
        LW_ASSERT(!self._has_value, "attempted to access error of a successful result");
        return static_cast<Self&&>(self)._error.value;
    }

private:
    constexpr void reset()
    {
        if (!_has_value)
            _error.value.~E();
        _has_value = true;
    }

    lw::storage_for<E> _error;
    bool _has_value = true;
};
