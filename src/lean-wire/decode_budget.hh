#pragma once

#include <lean-wire/assertf.hh>
#include <lean-wire/errors.hh>
#include <lean-wire/result.hh>
#include <lean-wire/utility.hh>

/// Pessimistic byte accounting for one decode session.
///
/// Before a container reserves memory for `n` elements, it claims `n * sizeof(T)` bytes here.
/// A forged length prefix ("2^32 elements of u64") is rejected in O(1), before anything is allocated.
///
/// Right before each element is decoded, the container releases that element's slice again.
/// The element decode then claims what it really needs (sizeof itself, plus its own nested containers),
/// so the outer claim is only a gate, never counted twice.
///
/// Without a limit, claims are free, except that a claim whose size computation overflows still fails.
///
/// Invariant: claimed() <= limit() whenever a limit is set.
struct lw::decode_budget
{
    /// limit < 0 means "no limit"
    explicit constexpr decode_budget(isize limit = -1) : _limit(limit) {}

    [[nodiscard]] constexpr bool has_limit() const { return _limit >= 0; }
    [[nodiscard]] constexpr isize limit() const { return _limit; }
    [[nodiscard]] constexpr isize claimed() const { return _claimed; }

    /// Claims n bytes. Fails with limit_exceeded if the total would pass the limit.
    /// On failure nothing is claimed.
    [[nodiscard]] lw::result<void, lw::decode_error> claim_bytes(isize n)
    {
        LW_ASSERT(n >= 0, "cannot claim a negative byte count");
        if (!has_limit())
            return {};

        isize total = 0;
        if (!lw::checked_add(_claimed, n, total) || total > _limit)
            return lw::error(lw::decode_error::limit_exceeded());

        _claimed = total;
        return {};
    }

    /// Claims count * sizeof(T) bytes, the in-memory worst case for a container of `count` T.
    /// An overflowing product fails even without a limit.
    template <class T>
    [[nodiscard]] lw::result<void, lw::decode_error> claim_container(isize count)
    {
        LW_ASSERT(count >= 0, "cannot claim a negative element count");
        isize bytes = 0;
        if (!lw::checked_mul(count, isize(sizeof(T)), bytes))
            return lw::error(lw::decode_error::limit_exceeded());
        return claim_bytes(bytes);
    }

    /// Gives back n previously claimed bytes.
    /// Releasing more than is claimed is a programmer error.
    void release(isize n)
    {
        LW_ASSERT(n >= 0, "cannot release a negative byte count");
        if (!has_limit())
            return;
        LW_ASSERTF(n <= _claimed, "releasing {} bytes but only {} are claimed", n, _claimed);
        _claimed -= n;
    }

private:
    isize _limit = -1;
    isize _claimed = 0;
};
