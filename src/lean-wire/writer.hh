#pragma once

#include <lean-wire/errors.hh>
#include <lean-wire/result.hh>
#include <lean-wire/span.hh>
#include <lean-wire/vector.hh>

// Byte sinks for lw::encoder.
//
// Every writer has the same single entry point:
//   lw::result<void, lw::encode_error> write(lw::span<lw::byte const> bytes);
// A write either appends all bytes or fails without writing anything.

/// Growable heap output. Growth goes through memory_resource::try_allocate_bytes,
/// so running out of memory is an encode_error{out_of_memory} and never an abort.
struct lw::vector_writer
{
    vector_writer() = default;
    explicit vector_writer(lw::memory_resource const* resource) : _bytes(lw::vector<lw::byte>::create_with_capacity(0, resource)) {}

    [[nodiscard]] lw::result<void, lw::encode_error> write(lw::span<lw::byte const> bytes);

    [[nodiscard]] isize size() const { return _bytes.size(); }
    [[nodiscard]] lw::span<lw::byte const> bytes() const { return lw::span<lw::byte const>(_bytes.data(), _bytes.size()); }

    /// Moves the written bytes out, leaving the writer empty.
    [[nodiscard]] lw::vector<lw::byte> take() { return lw::move(_bytes); }

private:
    lw::vector<lw::byte> _bytes;
};

/// Writes into a caller-provided span. Running out of room is encode_error{unexpected_end}.
struct lw::slice_writer
{
    explicit slice_writer(lw::span<lw::byte> output) : _output(output) {}

    [[nodiscard]] lw::result<void, lw::encode_error> write(lw::span<lw::byte const> bytes);

    [[nodiscard]] isize bytes_written() const { return _pos; }

private:
    lw::span<lw::byte> _output;
    isize _pos = 0;
};

/// Counts bytes without storing them, to size an output buffer up front.
struct lw::size_writer
{
    [[nodiscard]] lw::result<void, lw::encode_error> write(lw::span<lw::byte const> bytes)
    {
        _count += bytes.size();
        return {};
    }

    [[nodiscard]] isize bytes_written() const { return _count; }

private:
    isize _count = 0;
};
