#pragma once

#include <lean-wire/fwd.hh>
#include <lean-wire/source_location.hh>

// =========================================================================================================
// Error taxonomy
// =========================================================================================================
//
// lw::out_of_memory   - a fallible allocation returned nothing (never a process abort)
// lw::decode_error    - anything that makes a decode fail
// lw::encode_error    - anything that makes an encode fail
//
// All errors are small, trivially copyable values so that result<T, E> of trivial T stays trivial.
// Every error records the source location where it was raised.
// lw::to_string(err) renders a human-readable multi-line description.
//

namespace lw
{
/// Where an allocation failure happened
enum class oom_source : u8
{
    /// reserving or growing a collection buffer (containers, output writer)
    reserve,
    /// allocating a single heap object (box, rc, arc, boxed slice)
    alloc,
};

/// Integer widths announced by a variable-length integer tag
enum class integer_type : u8
{
    u8,
    u16,
    u32,
    u64,
    u128,
    reserved,
};

enum class decode_error_kind : u8
{
    other,
    unexpected_end,
    limit_exceeded,
    out_of_memory,
    invalid_utf8,
    invalid_bool_value,
    invalid_integer_type,
    outside_isize_range,
};

enum class encode_error_kind : u8
{
    other,
    unexpected_end,
    out_of_memory,
};

[[nodiscard]] char const* to_string(oom_source source);
[[nodiscard]] char const* to_string(integer_type type);
[[nodiscard]] char const* to_string(decode_error_kind kind);
[[nodiscard]] char const* to_string(encode_error_kind kind);

[[nodiscard]] lw::string to_string(out_of_memory const& err);
[[nodiscard]] lw::string to_string(decode_error const& err);
[[nodiscard]] lw::string to_string(encode_error const& err);
} // namespace lw

/// A fallible allocation could not be satisfied.
/// requested_bytes is the size that was asked for; -1 if the size itself overflowed isize.
struct lw::out_of_memory
{
    oom_source source = oom_source::reserve;
    isize requested_bytes = 0;
};

/// Reason a decode failed.
/// Only the fields belonging to `kind` are meaningful.
struct lw::decode_error
{
    decode_error_kind kind = decode_error_kind::other;

    /// unexpected_end: how many more bytes the reader would have needed
    isize additional = 0;

    /// invalid_utf8: length of the longest valid UTF-8 prefix
    isize valid_up_to = 0;

    /// invalid_bool_value: the offending byte
    /// outside_isize_range: the decoded length
    u64 found = 0;

    /// invalid_integer_type: the width the caller asked for and the width the tag announced
    integer_type expected_type = integer_type::u8;
    integer_type found_type = integer_type::u8;

    /// out_of_memory: the failed allocation
    lw::out_of_memory oom;

    /// other: static description
    char const* message = "unknown error";

    lw::source_location site;

    // factories
public:
    [[nodiscard]] static decode_error unexpected_end(isize additional, lw::source_location site = lw::source_location::current())
    {
        decode_error e;
        e.kind = decode_error_kind::unexpected_end;
        e.additional = additional;
        e.site = site;
        return e;
    }

    /// The decode budget cannot cover a claim.
    [[nodiscard]] static decode_error limit_exceeded(lw::source_location site = lw::source_location::current())
    {
        decode_error e;
        e.kind = decode_error_kind::limit_exceeded;
        e.site = site;
        return e;
    }

    [[nodiscard]] static decode_error invalid_utf8(isize valid_up_to, lw::source_location site = lw::source_location::current())
    {
        decode_error e;
        e.kind = decode_error_kind::invalid_utf8;
        e.valid_up_to = valid_up_to;
        e.site = site;
        return e;
    }

    [[nodiscard]] static decode_error invalid_bool_value(u8 value, lw::source_location site = lw::source_location::current())
    {
        decode_error e;
        e.kind = decode_error_kind::invalid_bool_value;
        e.found = value;
        e.site = site;
        return e;
    }

    [[nodiscard]] static decode_error invalid_integer_type(integer_type expected,
                                                           integer_type found,
                                                           lw::source_location site = lw::source_location::current())
    {
        decode_error e;
        e.kind = decode_error_kind::invalid_integer_type;
        e.expected_type = expected;
        e.found_type = found;
        e.site = site;
        return e;
    }

    [[nodiscard]] static decode_error outside_isize_range(u64 value, lw::source_location site = lw::source_location::current())
    {
        decode_error e;
        e.kind = decode_error_kind::outside_isize_range;
        e.found = value;
        e.site = site;
        return e;
    }

    [[nodiscard]] static decode_error other(char const* message, lw::source_location site = lw::source_location::current())
    {
        decode_error e;
        e.kind = decode_error_kind::other;
        e.message = message;
        e.site = site;
        return e;
    }

    // construction
public:
    decode_error() = default;

    /// Allocation failures convert implicitly so `return lw::error(oom)` works in decode paths.
    decode_error(lw::out_of_memory err, lw::source_location s = lw::source_location::current()) // NOLINT
      : kind(decode_error_kind::out_of_memory), oom(err), site(s)
    {
    }
};

/// Reason an encode failed.
struct lw::encode_error
{
    encode_error_kind kind = encode_error_kind::other;

    /// unexpected_end: how many bytes did not fit into the output
    isize additional = 0;

    /// out_of_memory: the failed allocation
    lw::out_of_memory oom;

    /// other: static description
    char const* message = "unknown error";

    lw::source_location site;

    // factories
public:
    [[nodiscard]] static encode_error unexpected_end(isize additional, lw::source_location site = lw::source_location::current())
    {
        encode_error e;
        e.kind = encode_error_kind::unexpected_end;
        e.additional = additional;
        e.site = site;
        return e;
    }

    [[nodiscard]] static encode_error other(char const* message, lw::source_location site = lw::source_location::current())
    {
        encode_error e;
        e.kind = encode_error_kind::other;
        e.message = message;
        e.site = site;
        return e;
    }

    // construction
public:
    encode_error() = default;

    encode_error(lw::out_of_memory err, lw::source_location s = lw::source_location::current()) // NOLINT
      : kind(encode_error_kind::out_of_memory), oom(err), site(s)
    {
    }
};
