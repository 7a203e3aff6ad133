#pragma once

#include <lean-wire/decoder.hh>
#include <lean-wire/encoder.hh>

#include <limits>
#include <type_traits>

// Integer and length wire encoding.
//
// Fixed:    sizeof(T) bytes in the configured byte order.
// Variable: v < 251          -> 1 byte  (v)
//           v <= 0xFFFF      -> 3 bytes (251, u16)
//           v <= 0xFFFF'FFFF -> 5 bytes (252, u32)
//           otherwise        -> 9 bytes (253, u64)
//           254 announces a u128 and 255 is reserved; both are rejected on decode.
//           Signed values are zigzag-mapped first (0, -1, 1, -2, ... -> 0, 1, 2, 3, ...).
//
// Single-byte integers never go through here: u8 / i8 / bool are always one raw byte.
// These functions do not touch the decode budget; the primitive codecs claim sizeof(T) before calling them.

namespace lw
{
namespace impl
{
inline constexpr u8 varint_u16_tag = 251;
inline constexpr u8 varint_u32_tag = 252;
inline constexpr u8 varint_u64_tag = 253;
inline constexpr u8 varint_u128_tag = 254;

template <class U>
constexpr integer_type integer_type_of()
{
    if constexpr (sizeof(U) == 1)
        return integer_type::u8;
    else if constexpr (sizeof(U) == 2)
        return integer_type::u16;
    else if constexpr (sizeof(U) == 4)
        return integer_type::u32;
    else
        return integer_type::u64;
}

template <class W, class U>
[[nodiscard]] lw::result<void, lw::encode_error> write_fixed(lw::encoder<W>& enc, U value)
{
    static_assert(std::is_unsigned_v<U>, "write_fixed takes unsigned integers");
    lw::byte buf[sizeof(U)];
    for (isize i = 0; i < isize(sizeof(U)); ++i)
    {
        auto const b = lw::byte(u8(value >> (8 * i)));
        if (enc.config().is_big_endian())
            buf[sizeof(U) - 1 - i] = b;
        else
            buf[i] = b;
    }
    return enc.write_bytes(lw::span<lw::byte const>(buf));
}

template <class U, class R>
[[nodiscard]] lw::result<U, lw::decode_error> read_fixed(lw::decoder<R>& dec)
{
    static_assert(std::is_unsigned_v<U>, "read_fixed produces unsigned integers");
    lw::byte buf[sizeof(U)];
    LW_TRY(dec.read_bytes(lw::span<lw::byte>(buf)));

    U value = 0;
    for (isize i = 0; i < isize(sizeof(U)); ++i)
    {
        auto const b = dec.config().is_big_endian() ? buf[sizeof(U) - 1 - i] : buf[i];
        value |= U(U(b) << (8 * i));
    }
    return value;
}

template <class R>
[[nodiscard]] lw::result<u8, lw::decode_error> read_byte(lw::decoder<R>& dec)
{
    lw::byte b;
    LW_TRY(dec.read_bytes(lw::span<lw::byte>(&b, 1)));
    return u8(b);
}

template <class I>
[[nodiscard]] constexpr std::make_unsigned_t<I> zigzag_encode(I value)
{
    using U = std::make_unsigned_t<I>;
    return U(U(value) << 1) ^ U(value >> (sizeof(I) * 8 - 1));
}

template <class U>
[[nodiscard]] constexpr std::make_signed_t<U> zigzag_decode(U value)
{
    using I = std::make_signed_t<U>;
    return I(value >> 1) ^ -I(value & 1);
}
} // namespace impl

/// Writes an unsigned integer of at least two bytes with the configured encoding.
template <class W, class U>
[[nodiscard]] lw::result<void, lw::encode_error> encode_uint(lw::encoder<W>& enc, U value)
{
    static_assert(std::is_unsigned_v<U> && sizeof(U) >= 2, "encode_uint is for u16, u32 and u64");

    if (!enc.config().is_variable_int_encoding())
        return impl::write_fixed(enc, value);

    if (value < 251)
        return impl::write_fixed(enc, u8(value));

    if (u64(value) <= std::numeric_limits<u16>::max())
    {
        LW_TRY(impl::write_fixed(enc, impl::varint_u16_tag));
        return impl::write_fixed(enc, u16(value));
    }
    if (u64(value) <= std::numeric_limits<u32>::max())
    {
        LW_TRY(impl::write_fixed(enc, impl::varint_u32_tag));
        return impl::write_fixed(enc, u32(value));
    }
    LW_TRY(impl::write_fixed(enc, impl::varint_u64_tag));
    return impl::write_fixed(enc, u64(value));
}

/// Writes a signed integer of at least two bytes (zigzag for variable encoding).
template <class W, class I>
[[nodiscard]] lw::result<void, lw::encode_error> encode_int(lw::encoder<W>& enc, I value)
{
    static_assert(std::is_signed_v<I> && sizeof(I) >= 2, "encode_int is for i16, i32 and i64");

    if (!enc.config().is_variable_int_encoding())
        return impl::write_fixed(enc, std::make_unsigned_t<I>(value));
    return lw::encode_uint(enc, impl::zigzag_encode(value));
}

/// Reads an unsigned integer of at least two bytes.
/// A variable-length tag announcing more bytes than U holds is invalid_integer_type.
template <class U, class R>
[[nodiscard]] lw::result<U, lw::decode_error> decode_uint(lw::decoder<R>& dec)
{
    static_assert(std::is_unsigned_v<U> && sizeof(U) >= 2, "decode_uint is for u16, u32 and u64");

    if (!dec.config().is_variable_int_encoding())
        return impl::read_fixed<U>(dec);

    auto tag = impl::read_byte(dec);
    if (tag.has_error())
        return lw::error(tag.error());

    auto const expected = impl::integer_type_of<U>();
    switch (tag.value())
    {
    case impl::varint_u16_tag:
        return impl::read_fixed<u16>(dec);

    case impl::varint_u32_tag:
        if constexpr (sizeof(U) < 4)
            return lw::error(lw::decode_error::invalid_integer_type(expected, integer_type::u32));
        else
            return impl::read_fixed<u32>(dec);

    case impl::varint_u64_tag:
        if constexpr (sizeof(U) < 8)
            return lw::error(lw::decode_error::invalid_integer_type(expected, integer_type::u64));
        else
            return impl::read_fixed<u64>(dec);

    case impl::varint_u128_tag:
        return lw::error(lw::decode_error::invalid_integer_type(expected, integer_type::u128));

    case 255:
        return lw::error(lw::decode_error::invalid_integer_type(expected, integer_type::reserved));

    default:
        return U(tag.value());
    }
}

/// Reads a signed integer of at least two bytes.
template <class I, class R>
[[nodiscard]] lw::result<I, lw::decode_error> decode_int(lw::decoder<R>& dec)
{
    static_assert(std::is_signed_v<I> && sizeof(I) >= 2, "decode_int is for i16, i32 and i64");
    using U = std::make_unsigned_t<I>;

    auto raw = lw::decode_uint<U>(dec);
    if (raw.has_error())
        return lw::error(raw.error());

    if (!dec.config().is_variable_int_encoding())
        return I(raw.value());
    return impl::zigzag_decode(raw.value());
}

/// Writes a container length (as u64).
template <class W>
[[nodiscard]] lw::result<void, lw::encode_error> encode_len(lw::encoder<W>& enc, isize len)
{
    LW_ASSERT(len >= 0, "lengths are non-negative");
    return lw::encode_uint(enc, u64(len));
}

/// Reads a container length.
/// Claims sizeof(u64) like any other u64 decode; a value beyond isize is outside_isize_range.
template <class R>
[[nodiscard]] lw::result<isize, lw::decode_error> decode_len(lw::decoder<R>& dec)
{
    LW_TRY(dec.claim_bytes_read(isize(sizeof(u64))));

    auto len = lw::decode_uint<u64>(dec);
    if (len.has_error())
        return lw::error(len.error());

    if (len.value() > u64(std::numeric_limits<isize>::max()))
        return lw::error(lw::decode_error::outside_isize_range(len.value()));
    return isize(len.value());
}
} // namespace lw
