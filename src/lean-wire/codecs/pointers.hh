#pragma once

#include <lean-wire/arc.hh>
#include <lean-wire/box.hh>
#include <lean-wire/codec.hh>
#include <lean-wire/cow.hh>
#include <lean-wire/rc.hh>

// Codecs for the owning wrappers: box<T>, rc<T>, arc<T> and cow<T>.
//
// All four are transparent on the wire: the encoding is exactly that of the pointee.
// Decoding builds the inner value first, then moves it into a fresh allocation from the decoder's resource,
// so a failing resource reports out_of_memory with oom_source::alloc.
// Every decoded rc / arc has use_count() == 1: nothing is shared between decoded values.
// A decoded cow is always owned.

namespace lw::impl
{
template <class Ptr, class T, class R>
[[nodiscard]] lw::result<Ptr, lw::decode_error> decode_into_heap(lw::decoder<R>& dec)
{
    auto inner = lw::decode<T>(dec);
    if (inner.has_error())
        return lw::error(inner.error());

    auto ptr = Ptr::try_create_in(dec.resource(), lw::move(inner.value()));
    if (ptr.has_error())
        return lw::error(ptr.error());
    return lw::move(ptr.value());
}
} // namespace lw::impl

template <class T>
struct lw::codec<lw::box<T>>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::box<T> const& value)
    {
        return lw::encode(enc, value.get());
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::box<T>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        return impl::decode_into_heap<lw::box<T>, T>(dec);
    }
};

template <class T>
struct lw::codec<lw::rc<T>>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::rc<T> const& value)
    {
        return lw::encode(enc, value.get());
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::rc<T>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        return impl::decode_into_heap<lw::rc<T>, T>(dec);
    }
};

template <class T>
struct lw::codec<lw::arc<T>>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::arc<T> const& value)
    {
        return lw::encode(enc, value.get());
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::arc<T>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        return impl::decode_into_heap<lw::arc<T>, T>(dec);
    }
};

template <class T>
struct lw::codec<lw::cow<T>>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::cow<T> const& value)
    {
        return lw::encode(enc, value.get());
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::cow<T>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto inner = lw::decode<T>(dec);
        if (inner.has_error())
            return lw::error(inner.error());
        return lw::cow<T>::owned(lw::move(inner.value()));
    }
};
