#pragma once

#include <lean-wire/codec.hh>
#include <lean-wire/codecs/sequence.hh>
#include <lean-wire/resource_allocator.hh>
#include <lean-wire/varint.hh>

#include <new>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>

// Codecs for std::unordered_set and std::unordered_map.
//
// The standard containers report allocation failure by throwing std::bad_alloc.
// Decoding turns that into out_of_memory: oom_source::reserve for the bucket reservation,
// oom_source::alloc for an element node.
// Encoding follows the container's iteration order, which is unspecified.
// Duplicate keys: the set keeps the first element, the map keeps the last value.
//
// Memory: a container whose allocator is constructible from `lw::memory_resource const*`
// (lw::resource_allocator) allocates from the decoder's resource.
// Any other allocator, std::allocator included, cannot be told about the resource,
// so those containers use their own allocator and bypass it.

namespace lw::impl
{
template <class Container, class R>
[[nodiscard]] Container create_hash_container(lw::decoder<R>& dec)
{
    using alloc_t = typename Container::allocator_type;
    if constexpr (std::is_constructible_v<alloc_t, lw::memory_resource const*>)
        return Container(0, typename Container::hasher(), typename Container::key_equal(), alloc_t(dec.resource()));
    else
        return Container();
}
} // namespace lw::impl

template <class T, class Hash, class KeyEq, class Alloc>
struct lw::codec<std::unordered_set<T, Hash, KeyEq, Alloc>>
{
    using container_t = std::unordered_set<T, Hash, KeyEq, Alloc>;

    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, container_t const& value)
    {
        LW_TRY(lw::encode_len(enc, isize(value.size())));
        for (auto const& e : value)
            LW_TRY(lw::encode(enc, e));
        return {};
    }

    template <class R>
    [[nodiscard]] static lw::result<container_t, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto len = impl::decode_claimed_len<T>(dec);
        if (len.has_error())
            return lw::error(len.error());

        auto set = impl::create_hash_container<container_t>(dec);
        try
        {
            set.reserve(size_t(len.value()));
        }
        catch (std::bad_alloc const&)
        {
            return lw::error(lw::out_of_memory{.source = oom_source::reserve, .requested_bytes = len.value() * isize(sizeof(T))});
        }

        for (isize i = 0; i < len.value(); ++i)
        {
            dec.unclaim_bytes_read(isize(sizeof(T)));

            auto element = lw::decode<T>(dec);
            if (element.has_error())
                return lw::error(element.error());

            try
            {
                set.insert(lw::move(element.value()));
            }
            catch (std::bad_alloc const&)
            {
                return lw::error(lw::out_of_memory{.source = oom_source::alloc, .requested_bytes = isize(sizeof(T))});
            }
        }
        return set;
    }
};

template <class K, class V, class Hash, class KeyEq, class Alloc>
struct lw::codec<std::unordered_map<K, V, Hash, KeyEq, Alloc>>
{
    using container_t = std::unordered_map<K, V, Hash, KeyEq, Alloc>;
    using entry_t = typename container_t::value_type;

    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, container_t const& value)
    {
        LW_TRY(lw::encode_len(enc, isize(value.size())));
        for (auto const& [key, val] : value)
        {
            LW_TRY(lw::encode(enc, key));
            LW_TRY(lw::encode(enc, val));
        }
        return {};
    }

    template <class R>
    [[nodiscard]] static lw::result<container_t, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto len = impl::decode_claimed_len<entry_t>(dec);
        if (len.has_error())
            return lw::error(len.error());

        auto map = impl::create_hash_container<container_t>(dec);
        try
        {
            map.reserve(size_t(len.value()));
        }
        catch (std::bad_alloc const&)
        {
            return lw::error(lw::out_of_memory{.source = oom_source::reserve, .requested_bytes = len.value() * isize(sizeof(entry_t))});
        }

        for (isize i = 0; i < len.value(); ++i)
        {
            dec.unclaim_bytes_read(isize(sizeof(entry_t)));

            auto key = lw::decode<K>(dec);
            if (key.has_error())
                return lw::error(key.error());
            auto val = lw::decode<V>(dec);
            if (val.has_error())
                return lw::error(val.error());

            try
            {
                map.insert_or_assign(lw::move(key.value()), lw::move(val.value()));
            }
            catch (std::bad_alloc const&)
            {
                return lw::error(lw::out_of_memory{.source = oom_source::alloc, .requested_bytes = isize(sizeof(entry_t))});
            }
        }
        return map;
    }
};
