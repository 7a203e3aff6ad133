#pragma once

#include <lean-wire/fwd.hh>
#include <lean-wire/vector.hh>

#include <string_view>

namespace lw
{
/// Non-owning view of UTF-8 bytes
using string_view = std::string_view;
} // namespace lw

/// Owning UTF-8 byte string, always heap-backed through lw::allocation<char>.
/// size() counts bytes, not codepoints; embedded '\0' bytes are allowed.
/// data() returns contiguous bytes but is NOT null-terminated.
///
/// The string itself never validates its contents.
/// Validation happens at the decode boundary (see codecs/string.hh), so every lw::string
/// that came out of a decoder holds well-formed UTF-8.
///
/// Memory resource choice is sticky across all operations.
/// Mutating operations may invalidate pointers and references, as with std::string.
struct lw::string
{
    // factories
public:
    /// Creates a string by copying the bytes of a string_view.
    [[nodiscard]] static string create_copy_of(string_view source, lw::memory_resource const* resource = nullptr)
    {
        string result;
        result._bytes = lw::vector<char>::create_copy_of(lw::span<char const>(source.data(), isize(source.size())), resource);
        return result;
    }

    /// Adopts an already filled byte buffer without copying.
    /// Complexity: O(1).
    [[nodiscard]] static string create_from_bytes(lw::vector<char> bytes)
    {
        string result;
        result._bytes = lw::move(bytes);
        return result;
    }

    // construction
public:
    string() = default;

    /// From a string literal or any other null-terminated C string.
    string(char const* cstr) : string(create_copy_of(string_view(cstr))) {} // NOLINT

    string(nullptr_t) = delete;

    // queries
public:
    [[nodiscard]] isize size() const { return _bytes.size(); }
    [[nodiscard]] bool empty() const { return _bytes.empty(); }

    [[nodiscard]] char const* data() const { return _bytes.data(); }
    [[nodiscard]] char* data() { return _bytes.data(); }

    [[nodiscard]] char const* begin() const { return _bytes.begin(); }
    [[nodiscard]] char const* end() const { return _bytes.end(); }

    /// Precondition: 0 <= i < size().
    [[nodiscard]] char const& operator[](isize i) const { return _bytes[i]; }
    [[nodiscard]] char& operator[](isize i) { return _bytes[i]; }

    [[nodiscard]] lw::memory_resource const* resource() const { return _bytes.resource(); }

    /// The raw bytes, as written on the wire.
    [[nodiscard]] lw::span<char const> bytes() const { return lw::span<char const>(_bytes.data(), _bytes.size()); }

    [[nodiscard]] operator string_view() const // NOLINT
    {
        return string_view(_bytes.data(), size_t(_bytes.size()));
    }

    // modification
public:
    void push_back(char c) { _bytes.push_back(c); }

    /// Appends the bytes of sv. Grows geometrically.
    void append(string_view sv);

    string& operator+=(string_view sv)
    {
        append(sv);
        return *this;
    }
    string& operator+=(char c)
    {
        push_back(c);
        return *this;
    }

    void clear() { _bytes.clear(); }

    // comparison
public:
    [[nodiscard]] bool operator==(string_view rhs) const { return string_view(*this) == rhs; }
    [[nodiscard]] bool operator==(string const& rhs) const { return string_view(*this) == string_view(rhs); }
    [[nodiscard]] bool operator==(char const* rhs) const { return string_view(*this) == string_view(rhs); }
    [[nodiscard]] auto operator<=>(string const& rhs) const { return string_view(*this) <=> string_view(rhs); }

private:
    lw::vector<char> _bytes;
};
