#include "writer.hh"

lw::result<void, lw::encode_error> lw::vector_writer::write(lw::span<lw::byte const> bytes)
{
    auto const count = bytes.size();
    if (count == 0)
        return {};

    if (!_bytes.has_capacity_back_for(count)) [[unlikely]]
    {
        // grow geometrically, falling back to the exact request if the doubled size is not available
        auto const grown = lw::max(_bytes.capacity(), count);
        if (_bytes.try_reserve_back(grown).has_error())
        {
            auto exact = _bytes.try_reserve_back(count);
            if (exact.has_error())
                return lw::error(lw::encode_error(exact.error()));
        }
    }

    for (auto b : bytes)
        _bytes.push_back_stable(b);
    return {};
}

lw::result<void, lw::encode_error> lw::slice_writer::write(lw::span<lw::byte const> bytes)
{
    auto const remaining = _output.size() - _pos;
    if (bytes.size() > remaining)
        return lw::error(lw::encode_error::unexpected_end(bytes.size() - remaining));

    lw::memcpy(_output.data() + _pos, bytes.data(), bytes.size());
    _pos += bytes.size();
    return {};
}
