#include "string.hh"

void lw::string::append(string_view sv)
{
    auto const count = isize(sv.size());
    if (count == 0)
        return;

    if (!_bytes.has_capacity_back_for(count))
    {
        // same geometric policy as emplace_back growth, but in one step for the whole append
        auto const min_capacity = _bytes.size() + count;
        auto grown = lw::vector<char>::create_with_capacity(lw::max(_bytes.capacity() * 2, min_capacity), _bytes.resource());
        for (auto c : _bytes)
            grown.push_back_stable(c);
        _bytes = lw::move(grown);
    }

    for (auto c : sv)
        _bytes.push_back_stable(c);
}
