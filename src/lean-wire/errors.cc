#include "errors.hh"

#include <lean-wire/string.hh>

#include <format>

namespace
{
void append_site(lw::string& out, lw::source_location const& site)
{
    out += std::format("  at {}:{} - {}\n", site.file_name(), site.line(), site.function_name());
}
} // namespace

char const* lw::to_string(oom_source source)
{
    switch (source)
    {
    case oom_source::reserve:
        return "reserve";
    case oom_source::alloc:
        return "alloc";
    }
    return "<invalid oom_source>";
}

char const* lw::to_string(integer_type type)
{
    switch (type)
    {
    case integer_type::u8:
        return "u8";
    case integer_type::u16:
        return "u16";
    case integer_type::u32:
        return "u32";
    case integer_type::u64:
        return "u64";
    case integer_type::u128:
        return "u128";
    case integer_type::reserved:
        return "reserved";
    }
    return "<invalid integer_type>";
}

char const* lw::to_string(decode_error_kind kind)
{
    switch (kind)
    {
    case decode_error_kind::other:
        return "other";
    case decode_error_kind::unexpected_end:
        return "unexpected_end";
    case decode_error_kind::limit_exceeded:
        return "limit_exceeded";
    case decode_error_kind::out_of_memory:
        return "out_of_memory";
    case decode_error_kind::invalid_utf8:
        return "invalid_utf8";
    case decode_error_kind::invalid_bool_value:
        return "invalid_bool_value";
    case decode_error_kind::invalid_integer_type:
        return "invalid_integer_type";
    case decode_error_kind::outside_isize_range:
        return "outside_isize_range";
    }
    return "<invalid decode_error_kind>";
}

char const* lw::to_string(encode_error_kind kind)
{
    switch (kind)
    {
    case encode_error_kind::other:
        return "other";
    case encode_error_kind::unexpected_end:
        return "unexpected_end";
    case encode_error_kind::out_of_memory:
        return "out_of_memory";
    }
    return "<invalid encode_error_kind>";
}

lw::string lw::to_string(out_of_memory const& err)
{
    if (err.requested_bytes < 0)
        return lw::string::create_copy_of(std::format("out of memory ({}): requested size overflows", to_string(err.source)));
    return lw::string::create_copy_of(
        std::format("out of memory ({}): failed to allocate {} bytes", to_string(err.source), err.requested_bytes));
}

lw::string lw::to_string(decode_error const& err)
{
    lw::string result;
    result += "error: ";

    switch (err.kind)
    {
    case decode_error_kind::unexpected_end:
        result += std::format("unexpected end of input, {} more bytes needed", err.additional);
        break;
    case decode_error_kind::limit_exceeded:
        result += "decode limit exceeded";
        break;
    case decode_error_kind::out_of_memory:
        result += lw::to_string(err.oom);
        break;
    case decode_error_kind::invalid_utf8:
        result += std::format("invalid utf-8, valid up to byte {}", err.valid_up_to);
        break;
    case decode_error_kind::invalid_bool_value:
        result += std::format("invalid bool value {:#04x}", err.found);
        break;
    case decode_error_kind::invalid_integer_type:
        result += std::format("invalid integer type, expected {} but found {}", to_string(err.expected_type),
                              to_string(err.found_type));
        break;
    case decode_error_kind::outside_isize_range:
        result += std::format("length {} does not fit isize", err.found);
        break;
    case decode_error_kind::other:
        result += err.message;
        break;
    }

    result += "\n";
    append_site(result, err.site);
    return result;
}

lw::string lw::to_string(encode_error const& err)
{
    lw::string result;
    result += "error: ";

    switch (err.kind)
    {
    case encode_error_kind::unexpected_end:
        result += std::format("output too small, {} more bytes needed", err.additional);
        break;
    case encode_error_kind::out_of_memory:
        result += lw::to_string(err.oom);
        break;
    case encode_error_kind::other:
        result += err.message;
        break;
    }

    result += "\n";
    append_site(result, err.site);
    return result;
}
