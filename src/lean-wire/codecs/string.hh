#pragma once

#include <lean-wire/codec.hh>
#include <lean-wire/string.hh>
#include <lean-wire/utf8.hh>
#include <lean-wire/varint.hh>

/// lw::string: [len] followed by len raw UTF-8 bytes.
/// Decode claims the len bytes up front, reads them in one go and validates the whole buffer.
/// Malformed input fails with invalid_utf8 reporting the length of the valid prefix.
template <>
struct lw::codec<lw::string>
{
    template <class W>
    [[nodiscard]] static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, lw::string const& value)
    {
        LW_TRY(lw::encode_len(enc, value.size()));
        return enc.write_bytes(lw::span<lw::byte const>((lw::byte const*)value.data(), value.size()));
    }

    template <class R>
    [[nodiscard]] static lw::result<lw::string, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto len = lw::decode_len(dec);
        if (len.has_error())
            return lw::error(len.error());
        auto const n = len.value();
        LW_TRY(dec.template claim_container_read<u8>(n));

        auto reserved = lw::vector<char>::try_create_with_capacity(n, dec.resource());
        if (reserved.has_error())
            return lw::error(reserved.error());

        auto storage = reserved.value().extract_allocation();
        LW_TRY(dec.read_bytes(lw::span<lw::byte>((lw::byte*)storage.obj_start, n)));

        auto const valid = lw::utf8_valid_up_to(lw::span<char const>(storage.obj_start, n));
        if (valid != n)
            return lw::error(lw::decode_error::invalid_utf8(valid));

        // char is trivial, the read bytes are the live objects
        storage.obj_end = storage.obj_start + n;
        return lw::string::create_from_bytes(lw::vector<char>::create_from_allocation(lw::move(storage)));
    }
};
