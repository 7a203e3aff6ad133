#pragma once

#include <lean-wire/codec.hh>
#include <lean-wire/pair.hh>
#include <lean-wire/varint.hh>

#include <bit>

// Codecs for bool, fixed-size integers, floats and lw::pair.
// Every decode claims sizeof(T) against the budget before reading, exactly like a container
// claims for its elements, so the limit bounds the in-memory size of the whole decoded value.

namespace lw::impl
{
/// u8 / i8: one raw byte, regardless of the integer encoding
template <class T>
struct single_byte_codec
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, T value)
    {
        auto const b = lw::byte(u8(value));
        return enc.write_bytes(lw::span<lw::byte const>(&b, 1));
    }

    template <class R>
    [[nodiscard]] static lw::result<T, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        LW_TRY(dec.claim_bytes_read(1));
        auto b = impl::read_byte(dec);
        if (b.has_error())
            return lw::error(b.error());
        return T(b.value());
    }
};

template <class U>
struct unsigned_codec
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, U value)
    {
        return lw::encode_uint(enc, value);
    }

    template <class R>
    [[nodiscard]] static lw::result<U, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        LW_TRY(dec.claim_bytes_read(isize(sizeof(U))));
        return lw::decode_uint<U>(dec);
    }
};

template <class I>
struct signed_codec
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, I value)
    {
        return lw::encode_int(enc, value);
    }

    template <class R>
    [[nodiscard]] static lw::result<I, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        LW_TRY(dec.claim_bytes_read(isize(sizeof(I))));
        return lw::decode_int<I>(dec);
    }
};

/// floats are their bit pattern, always fixed width, in the configured byte order
template <class F, class Bits>
struct float_codec
{
    static_assert(sizeof(F) == sizeof(Bits));

    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, F value)
    {
        return impl::write_fixed(enc, std::bit_cast<Bits>(value));
    }

    template <class R>
    [[nodiscard]] static lw::result<F, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        LW_TRY(dec.claim_bytes_read(isize(sizeof(F))));
        auto bits = impl::read_fixed<Bits>(dec);
        if (bits.has_error())
            return lw::error(bits.error());
        return std::bit_cast<F>(bits.value());
    }
};
} // namespace lw::impl

template <>
struct lw::codec<bool>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, bool value)
    {
        auto const b = lw::byte(value ? 1 : 0);
        return enc.write_bytes(lw::span<lw::byte const>(&b, 1));
    }

    template <class R>
    [[nodiscard]] static lw::result<bool, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        LW_TRY(dec.claim_bytes_read(1));
        auto b = impl::read_byte(dec);
        if (b.has_error())
            return lw::error(b.error());

        switch (b.value())
        {
        case 0:
            return false;
        case 1:
            return true;
        default:
            return lw::error(lw::decode_error::invalid_bool_value(b.value()));
        }
    }
};

template <>
struct lw::codec<lw::u8> : lw::impl::single_byte_codec<lw::u8>
{
};
template <>
struct lw::codec<lw::i8> : lw::impl::single_byte_codec<lw::i8>
{
};
template <>
struct lw::codec<lw::u16> : lw::impl::unsigned_codec<lw::u16>
{
};
template <>
struct lw::codec<lw::u32> : lw::impl::unsigned_codec<lw::u32>
{
};
template <>
struct lw::codec<lw::u64> : lw::impl::unsigned_codec<lw::u64>
{
};
template <>
struct lw::codec<lw::i16> : lw::impl::signed_codec<lw::i16>
{
};
template <>
struct lw::codec<lw::i32> : lw::impl::signed_codec<lw::i32>
{
};
template <>
struct lw::codec<lw::i64> : lw::impl::signed_codec<lw::i64>
{
};
template <>
struct lw::codec<lw::f32> : lw::impl::float_codec<lw::f32, lw::u32>
{
};
template <>
struct lw::codec<lw::f64> : lw::impl::float_codec<lw::f64, lw::u64>
{
};

/// first, then second; no framing
template <class A, class B>
struct lw::codec<lw::pair<A, B>>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::pair<A, B> const& value)
    {
        LW_TRY(lw::encode(enc, value.first));
        return lw::encode(enc, value.second);
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::pair<A, B>, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto first = lw::decode<A>(dec);
        if (first.has_error())
            return lw::error(first.error());
        auto second = lw::decode<B>(dec);
        if (second.has_error())
            return lw::error(second.error());
        return lw::pair<A, B>{lw::move(first.value()), lw::move(second.value())};
    }
};
