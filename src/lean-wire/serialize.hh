#pragma once

#include <lean-wire/assert.hh>
#include <lean-wire/codec.hh>
#include <lean-wire/codecs/primitives.hh>
#include <lean-wire/reader.hh>
#include <lean-wire/writer.hh>

// =========================================================================================================
// One-call entry points
// =========================================================================================================
//
//   encode_to_vector(value, cfg)             - encode into a fresh byte vector
//   encode_into_slice(value, out, cfg)       - encode into a caller buffer, returns bytes written
//   encoded_size(value, cfg)                 - exact number of bytes encode would produce
//   decode_from_slice<T>(bytes, cfg)         - decode one T from the front of bytes
//
// Usage:
//   auto bytes = lw::encode_to_vector(v, lw::config::standard());
//   if (bytes.has_error())
//       ...
//   auto back = lw::decode_from_slice<lw::vector<u32>>(lw::span<lw::byte const>(bytes.value()));
//
// Codecs for containers live in lean-wire/codecs/*.hh and have to be included by the caller.
// Assertion failures inside these calls name the entry point they happened in.
// decode_from_slice stops after one value: trailing input is not an error, bytes_read tells where it ended.

/// A decoded value and the number of input bytes it consumed.
template <class T>
struct lw::decoded
{
    T value;
    isize bytes_read = 0;
};

namespace lw
{
template <class T>
[[nodiscard]] lw::result<lw::vector<lw::byte>, lw::encode_error> encode_to_vector(T const& value,
                                                                                 lw::config cfg = lw::config::standard(),
                                                                                 lw::memory_resource const* resource = nullptr)
{
    impl::scoped_assertion_context const ctx("lw::encode_to_vector");
    lw::encoder<lw::vector_writer> enc(lw::vector_writer(resource), cfg);
    LW_TRY(lw::encode(enc, value));
    return lw::move(enc).into_writer().take();
}

/// On unexpected_end the content of `output` is unspecified.
template <class T>
[[nodiscard]] lw::result<isize, lw::encode_error> encode_into_slice(T const& value, lw::span<lw::byte> output, lw::config cfg = lw::config::standard())
{
    impl::scoped_assertion_context const ctx("lw::encode_into_slice");
    lw::encoder<lw::slice_writer> enc(lw::slice_writer(output), cfg);
    LW_TRY(lw::encode(enc, value));
    return enc.writer().bytes_written();
}

template <class T>
[[nodiscard]] lw::result<isize, lw::encode_error> encoded_size(T const& value, lw::config cfg = lw::config::standard())
{
    impl::scoped_assertion_context const ctx("lw::encoded_size");
    lw::encoder<lw::size_writer> enc(lw::size_writer{}, cfg);
    LW_TRY(lw::encode(enc, value));
    return enc.writer().bytes_written();
}

/// Everything the decoded value allocates comes from `resource` (nullptr: default resource).
template <class T>
[[nodiscard]] lw::result<lw::decoded<T>, lw::decode_error> decode_from_slice(lw::span<lw::byte const> input,
                                                                              lw::config cfg = lw::config::standard(),
                                                                              lw::memory_resource const* resource = nullptr)
{
    impl::scoped_assertion_context const ctx("lw::decode_from_slice");
    lw::decoder<lw::slice_reader> dec(lw::slice_reader(input), cfg, resource);
    auto value = lw::decode<T>(dec);
    if (value.has_error())
        return lw::error(value.error());
    return lw::decoded<T>{lw::move(value.value()), dec.reader().bytes_read()};
}
} // namespace lw
