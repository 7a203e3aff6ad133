#pragma once

#include <lean-wire/assert.hh>
#include <lean-wire/fwd.hh>

namespace lw
{
/// Byte order of multi-byte integers and floats on the wire
enum class endian : u8
{
    little,
    big,
};

/// How integers wider than one byte (and all lengths) are written
enum class int_encoding : u8
{
    /// values < 251 in one byte, larger values as a tag byte plus a fixed-width integer
    variable,
    /// always sizeof(T) bytes
    fixed,
};
} // namespace lw

/// Wire configuration, passed by value into every top-level encode / decode call.
/// Modifiers return a modified copy, so configs compose left to right:
///
///   auto cfg = lw::config::standard().with_big_endian().with_limit(1 << 20);
///
/// The limit bounds how many bytes a single decode may provisionally claim (see lw::decode_budget).
/// It does not apply to encoding.
struct lw::config
{
    endian byte_order = endian::little;
    int_encoding integers = int_encoding::variable;

    /// decode limit in bytes, -1 for "no limit"
    isize limit = -1;

    // presets
public:
    /// little endian, variable-length integers, no limit
    [[nodiscard]] static constexpr config standard() { return config{}; }

    /// little endian, fixed-width integers, no limit
    [[nodiscard]] static constexpr config legacy() { return config{}.with_fixed_int_encoding(); }

    // modifiers
public:
    [[nodiscard]] constexpr config with_little_endian() const { return with_byte_order(endian::little); }
    [[nodiscard]] constexpr config with_big_endian() const { return with_byte_order(endian::big); }

    [[nodiscard]] constexpr config with_variable_int_encoding() const
    {
        auto c = *this;
        c.integers = int_encoding::variable;
        return c;
    }
    [[nodiscard]] constexpr config with_fixed_int_encoding() const
    {
        auto c = *this;
        c.integers = int_encoding::fixed;
        return c;
    }

    /// Precondition: max_bytes >= 0
    [[nodiscard]] constexpr config with_limit(isize max_bytes) const
    {
        LW_ASSERT(max_bytes >= 0, "decode limit must be non-negative");
        auto c = *this;
        c.limit = max_bytes;
        return c;
    }
    [[nodiscard]] constexpr config with_no_limit() const
    {
        auto c = *this;
        c.limit = -1;
        return c;
    }

    // queries
public:
    [[nodiscard]] constexpr bool has_limit() const { return limit >= 0; }
    [[nodiscard]] constexpr bool is_big_endian() const { return byte_order == endian::big; }
    [[nodiscard]] constexpr bool is_variable_int_encoding() const { return integers == int_encoding::variable; }

private:
    [[nodiscard]] constexpr config with_byte_order(endian e) const
    {
        auto c = *this;
        c.byte_order = e;
        return c;
    }
};
