#pragma once

#include <lean-wire/allocation.hh>
#include <lean-wire/config.hh>
#include <lean-wire/decode_budget.hh>
#include <lean-wire/errors.hh>
#include <lean-wire/result.hh>
#include <lean-wire/span.hh>

/// Decode session: a reader, the wire configuration, the memory resource every decoded
/// container allocates from, and the decode budget seeded from config.limit.
///
/// Container codecs follow one protocol against the budget:
///
///   auto len = lw::decode_len(dec);                    // claims sizeof(u64)
///   LW_TRY(dec.claim_container_read<T>(len));          // pessimistic gate, O(1), no allocation
///   ... fallible reserve ...
///   for (isize i = 0; i < len; ++i)
///   {
///       dec.unclaim_bytes_read(sizeof(T));             // hand this element's slice back
///       auto v = lw::decode<T>(dec);                   // the element claims what it really needs
///       ...
///   }
template <class ReaderT>
struct lw::decoder
{
    decoder(ReaderT reader, lw::config cfg, lw::memory_resource const* resource = nullptr)
      : _reader(lw::move(reader)), _config(cfg), _resource(resource), _budget(cfg.limit)
    {
    }

    // reading
public:
    /// Fills `out` completely or fails with unexpected_end.
    [[nodiscard]] lw::result<void, lw::decode_error> read_bytes(lw::span<lw::byte> out) { return _reader.read(out); }

    // budget
public:
    /// Claims n bytes against the decode limit.
    [[nodiscard]] lw::result<void, lw::decode_error> claim_bytes_read(isize n) { return _budget.claim_bytes(n); }

    /// Claims count * sizeof(T) bytes; overflow is limit_exceeded even without a limit.
    template <class T>
    [[nodiscard]] lw::result<void, lw::decode_error> claim_container_read(isize count)
    {
        return _budget.template claim_container<T>(count);
    }

    /// Releases n previously claimed bytes.
    void unclaim_bytes_read(isize n) { _budget.release(n); }

    [[nodiscard]] lw::decode_budget const& budget() const { return _budget; }

    // session state
public:
    [[nodiscard]] lw::config const& config() const { return _config; }
    [[nodiscard]] lw::memory_resource const* resource() const { return _resource; }

    [[nodiscard]] ReaderT& reader() { return _reader; }
    [[nodiscard]] ReaderT const& reader() const { return _reader; }

private:
    ReaderT _reader;
    lw::config _config;
    lw::memory_resource const* _resource = nullptr;
    lw::decode_budget _budget;
};
