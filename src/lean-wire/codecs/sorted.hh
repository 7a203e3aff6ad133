#pragma once

#include <lean-wire/codec.hh>
#include <lean-wire/codecs/primitives.hh>
#include <lean-wire/codecs/sequence.hh>
#include <lean-wire/map.hh>
#include <lean-wire/set.hh>

// Codecs for the sorted containers lw::set<T> and lw::map<K, V>.
//
// Wire format: that of lw::vector<T> / lw::vector<pair<K, V>>, in ascending key order.
//
// Decode stages every element in a guarded vector exactly like the sequence codec,
// then sorts once, so the cost is O(n log n) whatever order the input is in.
// Duplicate keys in the input resolve as if the elements were inserted in wire order:
//   set keeps the first occurrence, map keeps the last value.

template <class T>
struct lw::codec<lw::set<T>>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::set<T> const& value)
    {
        return impl::encode_sequence(enc, value.begin(), value.end());
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::set<T>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto values = lw::decode<lw::vector<T>>(dec);
        if (values.has_error())
            return lw::error(values.error());
        return lw::set<T>::create_from_unsorted(lw::move(values.value()));
    }
};

template <class K, class V>
struct lw::codec<lw::map<K, V>>
{
    using entry_t = typename lw::map<K, V>::entry_t;

    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::map<K, V> const& value)
    {
        return impl::encode_sequence(enc, value.begin(), value.end());
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::map<K, V>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto entries = lw::decode<lw::vector<entry_t>>(dec);
        if (entries.has_error())
            return lw::error(entries.error());
        return lw::map<K, V>::create_from_unsorted(lw::move(entries.value()));
    }
};
