#pragma once

#include <lean-wire/errors.hh>
#include <lean-wire/result.hh>
#include <lean-wire/span.hh>
#include <lean-wire/utility.hh>

/// Reads bytes front to back from a borrowed span.
/// A read either fills the whole output or fails with unexpected_end and consumes nothing.
struct lw::slice_reader
{
    explicit slice_reader(lw::span<lw::byte const> input) : _input(input) {}

    /// Copies out.size() bytes into out and advances.
    [[nodiscard]] lw::result<void, lw::decode_error> read(lw::span<lw::byte> out)
    {
        if (out.size() > remaining())
            return lw::error(lw::decode_error::unexpected_end(out.size() - remaining()));

        lw::memcpy(out.data(), _input.data() + _pos, out.size());
        _pos += out.size();
        return {};
    }

    [[nodiscard]] isize bytes_read() const { return _pos; }
    [[nodiscard]] isize remaining() const { return _input.size() - _pos; }

private:
    lw::span<lw::byte const> _input;
    isize _pos = 0;
};
