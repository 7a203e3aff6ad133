#include "utf8.hh"

namespace
{
/// number of bytes of the sequence started by `lead`, 0 for bytes that cannot start a sequence
lw::isize sequence_length(lw::u8 lead)
{
    if (lead < 0x80)
        return 1;
    if (lead >= 0xC2 && lead <= 0xDF)
        return 2;
    if (lead >= 0xE0 && lead <= 0xEF)
        return 3;
    if (lead >= 0xF0 && lead <= 0xF4)
        return 4;
    return 0; // continuation bytes, overlong 2-byte leads C0/C1, and F5..FF
}

bool is_continuation(lw::u8 b) { return (b & 0xC0) == 0x80; }

/// The second byte has a narrower range for some leads (Unicode Table 3-7).
bool second_byte_in_range(lw::u8 lead, lw::u8 second)
{
    switch (lead)
    {
    case 0xE0:
        return second >= 0xA0 && second <= 0xBF; // no overlong 3-byte forms
    case 0xED:
        return second >= 0x80 && second <= 0x9F; // no surrogates
    case 0xF0:
        return second >= 0x90 && second <= 0xBF; // no overlong 4-byte forms
    case 0xF4:
        return second >= 0x80 && second <= 0x8F; // nothing above U+10FFFF
    default:
        return is_continuation(second);
    }
}
} // namespace

lw::isize lw::utf8_valid_up_to(lw::span<char const> bytes)
{
    auto const n = bytes.size();
    isize pos = 0;

    while (pos < n)
    {
        auto const lead = u8(bytes[pos]);

        // ASCII fast path
        if (lead < 0x80)
        {
            ++pos;
            continue;
        }

        auto const len = sequence_length(lead);
        if (len == 0 || pos + len > n)
            return pos;

        if (!second_byte_in_range(lead, u8(bytes[pos + 1])))
            return pos;
        for (isize i = 2; i < len; ++i)
            if (!is_continuation(u8(bytes[pos + i])))
                return pos;

        pos += len;
    }

    return pos;
}
