#pragma once

#include <lean-wire/fwd.hh>
#include <lean-wire/utility.hh>

#include <compare>
#include <utility>

/// Two values of potentially different types, encoded as first then second.
/// Aggregate, so `lw::pair<K, V>{k, v}` and structured bindings just work.
/// lw::map<K, V> stores its entries as pair<K, V>, ordered by first.
template <class T, class U>
struct lw::pair
{
    using first_t = T;
    using second_t = U;

    T first;
    U second;

    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;
    [[nodiscard]] friend constexpr auto operator<=>(pair const&, pair const&) = default;

    template <std::size_t I, class P>
    [[nodiscard]] friend constexpr decltype(auto) get(P&& p) noexcept
        requires(std::is_same_v<std::remove_cvref_t<P>, pair> && I < 2)
    {
        if constexpr (I == 0)
            return lw::forward<P>(p).first;
        else
            return lw::forward<P>(p).second;
    }
};

template <class T, class U>
struct std::tuple_size<lw::pair<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class T, class U>
struct std::tuple_element<I, lw::pair<T, U>>
{
    static_assert(I < 2, "lw::pair only has two elements");
    using type = std::conditional_t<I == 0, T, U>;
};
