#pragma once

#include <lean-wire/decoder.hh>
#include <lean-wire/encoder.hh>
#include <lean-wire/utility.hh>

// =========================================================================================================
// lw::codec<T> - the customization point
// =========================================================================================================
//
// Every encodable type has a codec specialization with two static members:
//
//   template <class W>
//   static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, T const& value);
//
//   template <class R>
//   static lw::result<T, lw::decode_error> decode(lw::decoder<R>& dec);
//
// The library ships codecs for primitives (codecs/primitives.hh), its own containers and pointer wrappers
// (codecs/*.hh) and the standard hash containers (codecs/std_hash.hh).
// User types specialize lw::codec<MyType> and compose the free functions below.
//
// Rules for decode implementations:
//   - never assert on input, report a decode_error instead
//   - claim before allocating (see lw::decoder)
//   - allocate through the decoder's resource with the try_* functions only
//

template <class T>
struct lw::codec
{
    static_assert(lw::always_false_t<T>, "no lw::codec specialization for this type (missing include of lean-wire/codecs/...?)");
};

namespace lw
{
/// Encodes value with its codec.
template <class T, class W>
[[nodiscard]] lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, T const& value)
{
    return lw::codec<T>::encode(enc, value);
}

/// Decodes a T with its codec.
/// Usage:
///   auto v = lw::decode<lw::vector<u32>>(dec);
template <class T, class R>
[[nodiscard]] lw::result<T, lw::decode_error> decode(lw::decoder<R>& dec)
{
    return lw::codec<T>::template decode<R>(dec);
}
} // namespace lw
