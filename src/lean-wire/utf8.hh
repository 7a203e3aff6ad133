#pragma once

#include <lean-wire/fwd.hh>
#include <lean-wire/span.hh>

namespace lw
{
/// Length of the longest prefix of `bytes` that is well-formed UTF-8.
/// Returns bytes.size() iff the whole input is valid.
///
/// Well-formed means the Unicode definition: no overlong encodings, no surrogates (U+D800..U+DFFF),
/// nothing above U+10FFFF, and no truncated sequence at the end.
/// A sequence that breaks off in the middle is not part of the valid prefix.
[[nodiscard]] isize utf8_valid_up_to(lw::span<char const> bytes);

[[nodiscard]] inline bool is_valid_utf8(lw::span<char const> bytes) { return utf8_valid_up_to(bytes) == bytes.size(); }
} // namespace lw
