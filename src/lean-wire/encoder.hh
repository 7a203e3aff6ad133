#pragma once

#include <lean-wire/config.hh>
#include <lean-wire/errors.hh>
#include <lean-wire/result.hh>
#include <lean-wire/span.hh>

/// Encode session: a writer plus the wire configuration.
/// Codecs only ever call write_bytes; the writer decides where the bytes go
/// (lw::vector_writer, lw::slice_writer, lw::size_writer, or any type with the same write() member).
template <class WriterT>
struct lw::encoder
{
    encoder(WriterT writer, lw::config cfg) : _writer(lw::move(writer)), _config(cfg) {}

    [[nodiscard]] lw::result<void, lw::encode_error> write_bytes(lw::span<lw::byte const> bytes)
    {
        return _writer.write(bytes);
    }

    [[nodiscard]] lw::config const& config() const { return _config; }

    [[nodiscard]] WriterT& writer() { return _writer; }
    [[nodiscard]] WriterT const& writer() const { return _writer; }

    /// Ends the session and hands out the writer (e.g. to take a vector_writer's bytes).
    [[nodiscard]] WriterT into_writer() && { return lw::move(_writer); }

private:
    WriterT _writer;
    lw::config _config;
};
