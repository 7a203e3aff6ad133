#pragma once

#include <lean-wire/assert.hh>
#include <lean-wire/fwd.hh>
#include <lean-wire/utility.hh>

#include <type_traits>

/// Copy-on-write wrapper: either borrows a `T const&` or owns a T.
///
/// Borrowing is free; the first call to to_mut() on a borrowed cow copies the value into owned storage.
/// A borrowed cow must not outlive the referenced value.
/// Decoding always produces an owned cow, there is nothing to borrow from.
template <class T>
struct lw::cow
{
    // factories
public:
    [[nodiscard]] static cow borrowed(T const& value)
    {
        cow c;
        c._borrowed = &value;
        return c;
    }

    template <class... Args>
    [[nodiscard]] static cow owned(Args&&... args)
    {
        cow c;
        new (lw::placement_new, &c._owned.value) T(lw::forward<Args>(args)...);
        c._is_owned = true;
        return c;
    }

    // access
public:
    [[nodiscard]] bool is_owned() const { return _is_owned; }
    [[nodiscard]] bool is_borrowed() const { return !_is_owned && _borrowed != nullptr; }

    [[nodiscard]] T const& get() const
    {
        if (_is_owned)
            return _owned.value;
        LW_ASSERT(_borrowed != nullptr, "accessing an empty cow");
        return *_borrowed;
    }
    [[nodiscard]] T const& operator*() const { return get(); }
    [[nodiscard]] T const* operator->() const { return &get(); }

    /// Mutable access, copying a borrowed value into owned storage first.
    [[nodiscard]] T& to_mut()
    {
        if (!_is_owned)
        {
            LW_ASSERT(_borrowed != nullptr, "accessing an empty cow");
            new (lw::placement_new, &_owned.value) T(*_borrowed);
            _is_owned = true;
            _borrowed = nullptr;
        }
        return _owned.value;
    }

    [[nodiscard]] friend bool operator==(cow const& a, cow const& b) { return a.get() == b.get(); }

    // lifecycle
public:
    cow(cow const& rhs) : _borrowed(rhs._borrowed), _is_owned(rhs._is_owned)
    {
        if (_is_owned)
            new (lw::placement_new, &_owned.value) T(rhs._owned.value);
    }
    cow(cow&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>) : _borrowed(rhs._borrowed), _is_owned(rhs._is_owned)
    {
        if (_is_owned)
            new (lw::placement_new, &_owned.value) T(lw::move(rhs._owned.value));
    }
    cow& operator=(cow const& rhs)
    {
        if (this != &rhs)
        {
            cow tmp(rhs);
            *this = lw::move(tmp);
        }
        return *this;
    }
    cow& operator=(cow&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        if (this != &rhs)
        {
            reset();
            _borrowed = rhs._borrowed;
            if (rhs._is_owned)
            {
                new (lw::placement_new, &_owned.value) T(lw::move(rhs._owned.value));
                _is_owned = true;
            }
        }
        return *this;
    }
    ~cow() { reset(); }

private:
    cow() = default;

    void reset()
    {
        if (_is_owned)
        {
            _owned.value.~T();
            _is_owned = false;
        }
        _borrowed = nullptr;
    }

    lw::storage_for<T> _owned;
    T const* _borrowed = nullptr;
    bool _is_owned = false;
};
