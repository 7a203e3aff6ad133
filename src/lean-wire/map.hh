#pragma once

#include <lean-wire/pair.hh>
#include <lean-wire/vector.hh>

#include <algorithm>

/// Sorted associative container stored as contiguous pair<K, V> entries in ascending key order (a "flat map").
///
/// Iteration is always in ascending key order, independent of insertion order.
/// insert_or_assign on an existing key replaces the value and keeps the original key object.
/// Keys are ordered by operator<.
template <class K, class V>
struct lw::map
{
    using entry_t = lw::pair<K, V>;

    // factories
public:
    [[nodiscard]] static map create_with_resource(lw::memory_resource const* resource)
    {
        map m;
        m._entries = lw::vector<entry_t>::create_with_capacity(0, resource);
        return m;
    }

    /// Empty map with room for `capacity` entries, reporting allocation failure.
    [[nodiscard]] static lw::result<map, lw::out_of_memory> try_create_with_capacity(isize capacity,
                                                                                   lw::memory_resource const* resource = nullptr)
    {
        auto entries = lw::vector<entry_t>::try_create_with_capacity(capacity, resource);
        if (entries.has_error())
            return lw::error(entries.error());
        map m;
        m._entries = lw::move(entries.value());
        return m;
    }

    /// Map over `entries` in any order, reusing their storage. O(n log n).
    /// For a key that appears more than once, the first key object is kept and gets the last value,
    /// the same result as calling insert_or_assign for each entry in turn.
    [[nodiscard]] static map create_from_unsorted(lw::vector<entry_t> entries)
    {
        std::stable_sort(entries.begin(), entries.end(), [](entry_t const& a, entry_t const& b) { return a.first < b.first; });

        isize kept = 0;
        for (isize i = 0; i < entries.size(); ++i)
        {
            if (kept > 0 && !(entries[kept - 1].first < entries[i].first))
            {
                entries[kept - 1].second = lw::move(entries[i].second);
                continue;
            }
            if (kept != i)
                entries[kept] = lw::move(entries[i]);
            ++kept;
        }
        while (entries.size() > kept)
            entries.remove_back();

        map m;
        m._entries = lw::move(entries);
        return m;
    }

    map() = default;

    map(std::initializer_list<entry_t> entries)
    {
        for (auto const& e : entries)
            insert_or_assign(e.first, e.second);
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _entries.size(); }
    [[nodiscard]] bool empty() const { return _entries.empty(); }
    [[nodiscard]] lw::memory_resource const* resource() const { return _entries.resource(); }

    [[nodiscard]] entry_t const* begin() const { return _entries.begin(); }
    [[nodiscard]] entry_t const* end() const { return _entries.end(); }

    [[nodiscard]] bool contains_key(K const& key) const { return find_index(key) >= 0; }

    /// Pointer to the value stored for key, nullptr if absent.
    /// Invalidated by any insertion or removal.
    [[nodiscard]] V const* get(K const& key) const
    {
        auto const idx = find_index(key);
        return idx >= 0 ? &_entries[idx].second : nullptr;
    }
    [[nodiscard]] V* get(K const& key)
    {
        auto const idx = find_index(key);
        return idx >= 0 ? &_entries[idx].second : nullptr;
    }

    // modification
public:
    /// Inserts (key, value), or replaces the value if key is already present.
    /// Returns a reference to the stored value.
    template <class KeyT = K, class ValueT = V>
    V& insert_or_assign(KeyT&& key, ValueT&& value)
    {
        if (_entries.empty() || _entries.back().first < key)
            return _entries.emplace_back(entry_t{K(lw::forward<KeyT>(key)), V(lw::forward<ValueT>(value))}).second;

        auto const idx = lower_bound(key);
        if (idx < _entries.size() && !(key < _entries[idx].first))
        {
            _entries[idx].second = lw::forward<ValueT>(value);
            return _entries[idx].second;
        }

        return _entries.emplace_at(idx, entry_t{K(lw::forward<KeyT>(key)), V(lw::forward<ValueT>(value))}).second;
    }

    /// Removes the entry for key. Returns true iff something was removed.
    bool remove_key(K const& key)
    {
        auto const idx = find_index(key);
        if (idx < 0)
            return false;
        _entries.remove_at(idx);
        return true;
    }

    void clear() { _entries.clear(); }

    [[nodiscard]] lw::result<void, lw::out_of_memory> try_reserve(isize count) { return _entries.try_reserve_back(count); }

    [[nodiscard]] friend bool operator==(map const& a, map const& b) { return a._entries == b._entries; }

private:
    [[nodiscard]] isize lower_bound(K const& key) const
    {
        isize lo = 0;
        isize hi = _entries.size();
        while (lo < hi)
        {
            auto const mid = lo + (hi - lo) / 2;
            if (_entries[mid].first < key)
                lo = mid + 1;
            else
                hi = mid;
        }
        return lo;
    }

    /// index of the entry with an equivalent key, -1 if absent
    [[nodiscard]] isize find_index(K const& key) const
    {
        auto const idx = lower_bound(key);
        return idx < _entries.size() && !(key < _entries[idx].first) ? idx : -1;
    }

    lw::vector<entry_t> _entries;
};
