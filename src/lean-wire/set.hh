#pragma once

#include <lean-wire/vector.hh>

#include <algorithm>

/// Sorted set of unique values stored contiguously in ascending order (a "flat set").
///
/// Iteration is always ascending, independent of insertion order.
/// Inserting a value that compares equivalent to an existing one keeps the existing element.
/// Ordering uses operator<; two values a, b are equivalent iff !(a < b) && !(b < a).
///
/// Lookup is O(log n); insertion is O(n) in general and amortized O(1) when values arrive in ascending order,
/// which is the order a set is encoded in.
template <class T>
struct lw::set
{
    // factories
public:
    /// Empty set whose storage comes from `resource`.
    [[nodiscard]] static set create_with_resource(lw::memory_resource const* resource)
    {
        set s;
        s._values = lw::vector<T>::create_with_capacity(0, resource);
        return s;
    }

    /// Empty set with room for `capacity` values, reporting allocation failure.
    [[nodiscard]] static lw::result<set, lw::out_of_memory> try_create_with_capacity(isize capacity,
                                                                                   lw::memory_resource const* resource = nullptr)
    {
        auto values = lw::vector<T>::try_create_with_capacity(capacity, resource);
        if (values.has_error())
            return lw::error(values.error());
        set s;
        s._values = lw::move(values.value());
        return s;
    }

    /// Set over `values` in any order, reusing their storage. O(n log n).
    /// Of equivalent values the one that comes first in `values` is kept,
    /// the same result as inserting them one by one.
    [[nodiscard]] static set create_from_unsorted(lw::vector<T> values)
    {
        std::stable_sort(values.begin(), values.end(), [](T const& a, T const& b) { return a < b; });

        isize kept = 0;
        for (isize i = 0; i < values.size(); ++i)
        {
            // sorted, so "not less than the last kept" means equivalent
            if (kept > 0 && !(values[kept - 1] < values[i]))
                continue;
            if (kept != i)
                values[kept] = lw::move(values[i]);
            ++kept;
        }
        while (values.size() > kept)
            values.remove_back();

        set s;
        s._values = lw::move(values);
        return s;
    }

    set() = default;

    set(std::initializer_list<T> values)
    {
        for (auto const& v : values)
            insert(v);
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _values.size(); }
    [[nodiscard]] bool empty() const { return _values.empty(); }
    [[nodiscard]] lw::memory_resource const* resource() const { return _values.resource(); }

    [[nodiscard]] T const* begin() const { return _values.begin(); }
    [[nodiscard]] T const* end() const { return _values.end(); }

    /// Smallest and largest value. Precondition: !empty().
    [[nodiscard]] T const& front() const { return _values.front(); }
    [[nodiscard]] T const& back() const { return _values.back(); }

    [[nodiscard]] bool contains(T const& value) const
    {
        auto const idx = lower_bound(value);
        return idx < _values.size() && !(value < _values[idx]);
    }

    // modification
public:
    /// Inserts value unless an equivalent one is present.
    /// Returns true iff the value was inserted.
    template <class U = T>
    bool insert(U&& value)
    {
        // ascending input appends without a search
        if (_values.empty() || _values.back() < value)
        {
            _values.emplace_back(lw::forward<U>(value));
            return true;
        }

        auto const idx = lower_bound(value);
        if (idx < _values.size() && !(value < _values[idx]))
            return false;

        _values.emplace_at(idx, lw::forward<U>(value));
        return true;
    }

    /// Removes the value equivalent to `value`. Returns true iff something was removed.
    bool remove(T const& value)
    {
        auto const idx = lower_bound(value);
        if (idx == _values.size() || value < _values[idx])
            return false;
        _values.remove_at(idx);
        return true;
    }

    void clear() { _values.clear(); }

    /// Room for `count` more values without reallocation, or out_of_memory{reserve}.
    [[nodiscard]] lw::result<void, lw::out_of_memory> try_reserve(isize count) { return _values.try_reserve_back(count); }

    [[nodiscard]] friend bool operator==(set const& a, set const& b) { return a._values == b._values; }

private:
    /// first index whose value is not less than `value`
    [[nodiscard]] isize lower_bound(T const& value) const
    {
        isize lo = 0;
        isize hi = _values.size();
        while (lo < hi)
        {
            auto const mid = lo + (hi - lo) / 2;
            if (_values[mid] < value)
                lo = mid + 1;
            else
                hi = mid;
        }
        return lo;
    }

    lw::vector<T> _values;
};
