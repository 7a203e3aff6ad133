#include <lean-wire/config.hh>
#include <lean-wire/decode_budget.hh>

#include <nexus/test.hh>

#include <limits>

static_assert(lw::config::standard().is_variable_int_encoding());
static_assert(!lw::config::standard().has_limit());
static_assert(!lw::config::legacy().is_variable_int_encoding());

TEST("config - presets and modifiers")
{
    SECTION("standard")
    {
        auto const cfg = lw::config::standard();
        CHECK(cfg.byte_order == lw::endian::little);
        CHECK(cfg.integers == lw::int_encoding::variable);
        CHECK(cfg.limit == -1);
    }

    SECTION("legacy")
    {
        auto const cfg = lw::config::legacy();
        CHECK(cfg.byte_order == lw::endian::little);
        CHECK(cfg.integers == lw::int_encoding::fixed);
        CHECK(!cfg.has_limit());
    }

    SECTION("modifiers compose and leave the source untouched")
    {
        auto const base = lw::config::standard();
        auto const cfg = base.with_big_endian().with_fixed_int_encoding().with_limit(1024);

        CHECK(cfg.is_big_endian());
        CHECK(!cfg.is_variable_int_encoding());
        CHECK(cfg.has_limit());
        CHECK(cfg.limit == 1024);

        CHECK(!base.is_big_endian());
        CHECK(base.is_variable_int_encoding());
        CHECK(!base.has_limit());

        auto const back = cfg.with_little_endian().with_variable_int_encoding().with_no_limit();
        CHECK(!back.is_big_endian());
        CHECK(back.is_variable_int_encoding());
        CHECK(!back.has_limit());
    }

    SECTION("zero is a real limit")
    {
        auto const cfg = lw::config::standard().with_limit(0);
        CHECK(cfg.has_limit());
        CHECK(cfg.limit == 0);
    }
}

TEST("decode_budget - without limit")
{
    lw::decode_budget budget;
    CHECK(!budget.has_limit());

    CHECK(budget.claim_bytes(1'000'000'000).has_value());
    CHECK(budget.claim_bytes(std::numeric_limits<lw::isize>::max()).has_value());
    CHECK(budget.claimed() == 0);

    budget.release(12345);
    CHECK(budget.claimed() == 0);

    SECTION("overflowing container claim still fails")
    {
        auto const r = budget.claim_container<lw::u64>(std::numeric_limits<lw::isize>::max() / 2);
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::limit_exceeded);
    }
}

TEST("decode_budget - with limit")
{
    lw::decode_budget budget(100);
    CHECK(budget.has_limit());
    CHECK(budget.limit() == 100);

    SECTION("claims accumulate up to the limit")
    {
        CHECK(budget.claim_bytes(60).has_value());
        CHECK(budget.claim_bytes(40).has_value());
        CHECK(budget.claimed() == 100);

        auto const r = budget.claim_bytes(1);
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::limit_exceeded);
        CHECK(budget.claimed() == 100);
    }

    SECTION("a failed claim takes nothing")
    {
        CHECK(budget.claim_bytes(30).has_value());
        CHECK(budget.claim_bytes(71).has_error());
        CHECK(budget.claimed() == 30);
        CHECK(budget.claim_bytes(70).has_value());
    }

    SECTION("release gives bytes back")
    {
        CHECK(budget.claim_bytes(100).has_value());
        budget.release(30);
        CHECK(budget.claimed() == 70);
        CHECK(budget.claim_bytes(30).has_value());
        CHECK(budget.claim_bytes(1).has_error());
    }

    SECTION("container claims are count * sizeof(T)")
    {
        CHECK(budget.claim_container<lw::u32>(25).has_value());
        CHECK(budget.claimed() == 100);

        budget.release(100);
        CHECK(budget.claim_container<lw::u64>(13).has_error());
        CHECK(budget.claimed() == 0);
    }

    SECTION("huge claims do not overflow the counter")
    {
        CHECK(budget.claim_bytes(50).has_value());
        CHECK(budget.claim_bytes(std::numeric_limits<lw::isize>::max()).has_error());
        CHECK(budget.claimed() == 50);
    }

    SECTION("an empty container claims nothing")
    {
        CHECK(budget.claim_container<lw::u64>(0).has_value());
        CHECK(budget.claimed() == 0);
    }
}
