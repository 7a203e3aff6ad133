#pragma once

#include <lean-wire/codec.hh>
#include <lean-wire/codecs/sequence.hh>
#include <lean-wire/priority_queue.hh>

/// lw::priority_queue<T, LessT>
/// Encode writes the internal heap order (not sorted), decode pushes each element.
/// A round trip keeps the multiset of elements and top(), not necessarily the iteration order.
template <class T, class LessT>
struct lw::codec<lw::priority_queue<T, LessT>>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::priority_queue<T, LessT> const& value)
    {
        return impl::encode_sequence(enc, value.begin(), value.end());
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::priority_queue<T, LessT>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto len = impl::decode_claimed_len<T>(dec);
        if (len.has_error())
            return lw::error(len.error());

        auto queue = lw::priority_queue<T, LessT>::try_create_with_capacity(len.value(), dec.resource());
        if (queue.has_error())
            return lw::error(queue.error());

        for (isize i = 0; i < len.value(); ++i)
        {
            dec.unclaim_bytes_read(isize(sizeof(T)));

            auto element = lw::decode<T>(dec);
            if (element.has_error())
                return lw::error(element.error());

            queue.value().push(lw::move(element.value()));
        }
        return lw::move(queue.value());
    }
};
