#pragma once

#include <lean-wire/array.hh>
#include <lean-wire/codec.hh>
#include <lean-wire/devector.hh>
#include <lean-wire/partial_init_guard.hh>
#include <lean-wire/varint.hh>
#include <lean-wire/vector.hh>

// Codecs for the contiguous sequences: lw::vector<T>, lw::array<T> (boxed slice) and lw::devector<T>.
//
// Wire format (all three identical): [len] [element 0] ... [element len-1]
//
// Decode protocol:
//   1. read len
//   2. claim len * sizeof(T), a forged len fails here without any allocation
//   3. reserve storage for len elements, allocation failure is out_of_memory
//   4. for each element: release sizeof(T), decode it, construct it in the next slot
//   5. commit the filled storage as the container
// Any element failure returns immediately; only the elements built so far are destroyed.

namespace lw::impl
{
/// Encodes len followed by every element of [begin, end).
template <class W, class T>
[[nodiscard]] lw::result<void, lw::encode_error> encode_sequence(lw::encoder<W>& enc, T const* begin, T const* end)
{
    LW_TRY(lw::encode_len(enc, end - begin));
    for (auto it = begin; it != end; ++it)
        LW_TRY(lw::encode(enc, *it));
    return {};
}

/// Reads the length and claims len * sizeof(T) for it.
template <class T, class R>
[[nodiscard]] lw::result<isize, lw::decode_error> decode_claimed_len(lw::decoder<R>& dec)
{
    auto len = lw::decode_len(dec);
    if (len.has_error())
        return lw::error(len.error());
    LW_TRY(dec.template claim_container_read<T>(len.value()));
    return len.value();
}

/// Decodes `count` elements into `storage`, whose live window is empty and which has room for `count` objects.
/// On success, storage's live window holds all `count` elements.
/// On failure, storage's live window is still empty and every element constructed along the way is destroyed.
template <class T, class R>
[[nodiscard]] lw::result<void, lw::decode_error> decode_elements_into(lw::decoder<R>& dec, lw::allocation<T>& storage, isize count)
{
    lw::partial_init_guard<T> guard(storage);
    for (isize i = 0; i < count; ++i)
    {
        dec.unclaim_bytes_read(isize(sizeof(T)));

        auto element = lw::decode<T>(dec);
        if (element.has_error())
            return lw::error(element.error());

        guard.emplace(lw::move(element.value()));
    }
    guard.disarm();
    return {};
}
} // namespace lw::impl

template <class T>
struct lw::codec<lw::vector<T>>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::vector<T> const& value)
    {
        return impl::encode_sequence(enc, value.begin(), value.end());
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::vector<T>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto len = impl::decode_claimed_len<T>(dec);
        if (len.has_error())
            return lw::error(len.error());

        auto reserved = lw::vector<T>::try_create_with_capacity(len.value(), dec.resource());
        if (reserved.has_error())
            return lw::error(reserved.error());

        auto storage = reserved.value().extract_allocation();
        LW_TRY(impl::decode_elements_into(dec, storage, len.value()));
        return lw::vector<T>::create_from_allocation(lw::move(storage));
    }
};

/// boxed slice: same wire format, exactly-sized single allocation (oom_source::alloc)
template <class T>
struct lw::codec<lw::array<T>>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::array<T> const& value)
    {
        return impl::encode_sequence(enc, value.begin(), value.end());
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::array<T>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto len = impl::decode_claimed_len<T>(dec);
        if (len.has_error())
            return lw::error(len.error());

        auto storage = lw::allocation<T>::try_create_empty(len.value(), alignof(T), dec.resource(), oom_source::alloc);
        if (storage.has_error())
            return lw::error(storage.error());

        LW_TRY(impl::decode_elements_into(dec, storage.value(), len.value()));
        return lw::array<T>::create_from_allocation(lw::move(storage.value()));
    }
};

/// double-ended queue: front to back on the wire, appended at the tail on decode
template <class T>
struct lw::codec<lw::devector<T>>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::devector<T> const& value)
    {
        return impl::encode_sequence(enc, value.begin(), value.end());
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::devector<T>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto len = impl::decode_claimed_len<T>(dec);
        if (len.has_error())
            return lw::error(len.error());

        auto queue = lw::devector<T>::try_create_with_capacity(len.value(), dec.resource());
        if (queue.has_error())
            return lw::error(queue.error());

        // the devector owns what was appended so far, so an early return cleans up by itself
        auto& q = queue.value();
        for (isize i = 0; i < len.value(); ++i)
        {
            dec.unclaim_bytes_read(isize(sizeof(T)));

            auto element = lw::decode<T>(dec);
            if (element.has_error())
                return lw::error(element.error());

            q.push_back(lw::move(element.value()));
        }
        return lw::move(q);
    }
};
