#include <lean-wire/codecs/heap.hh>
#include <lean-wire/codecs/pointers.hh>
#include <lean-wire/codecs/sequence.hh>
#include <lean-wire/codecs/sorted.hh>
#include <lean-wire/codecs/string.hh>
#include <lean-wire/serialize.hh>

#include <nexus/test.hh>

#include <initializer_list>
#include <limits>

#include "test-resource.hh"

namespace
{
lw::vector<lw::byte> bytes_of(std::initializer_list<int> values)
{
    lw::vector<lw::byte> result;
    for (auto v : values)
        result.push_back(lw::byte(v));
    return result;
}

template <class T>
lw::vector<lw::byte> encoded(T const& value, lw::config cfg = lw::config::standard())
{
    auto r = lw::encode_to_vector(value, cfg);
    CHECK(r.has_value());
    return lw::move(r.value());
}

template <class T>
lw::result<T, lw::decode_error> decode_bytes(lw::vector<lw::byte> const& bytes,
                                        lw::config cfg = lw::config::standard(),
                                        lw::memory_resource const* resource = nullptr)
{
    auto r = lw::decode_from_slice<T>(lw::span<lw::byte const>(bytes), cfg, resource);
    if (r.has_error())
        return lw::error(r.error());
    return lw::move(r.value().value);
}

template <class T>
T round_trip(T const& value, lw::config cfg = lw::config::standard())
{
    auto const bytes = encoded(value, cfg);
    auto r = lw::decode_from_slice<T>(lw::span<lw::byte const>(bytes), cfg);
    CHECK(r.has_value());
    CHECK(r.value().bytes_read == bytes.size());
    return lw::move(r.value().value);
}

// element type with a user codec that counts its live instances
struct tracked_flag
{
    bool flag = false;
    static inline int ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        ctor_count = 0;
        dtor_count = 0;
    }

    explicit tracked_flag(bool f) : flag(f) { ++ctor_count; }
    tracked_flag(tracked_flag const& rhs) : flag(rhs.flag) { ++ctor_count; }
    tracked_flag(tracked_flag&& rhs) noexcept : flag(rhs.flag) { ++ctor_count; }
    tracked_flag& operator=(tracked_flag const&) = default;
    ~tracked_flag() { ++dtor_count; }
};

// ordered element type for the sorted containers, counting its live instances like tracked_flag
struct tracked_key
{
    lw::u16 key = 0;
    static inline int ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        ctor_count = 0;
        dtor_count = 0;
    }

    explicit tracked_key(lw::u16 k) : key(k) { ++ctor_count; }
    tracked_key(tracked_key const& rhs) : key(rhs.key) { ++ctor_count; }
    tracked_key(tracked_key&& rhs) noexcept : key(rhs.key) { ++ctor_count; }
    tracked_key& operator=(tracked_key const&) = default;
    ~tracked_key() { ++dtor_count; }

    bool operator<(tracked_key const& rhs) const { return key < rhs.key; }
};

// a user struct, encoded as its fields in order
struct point
{
    lw::i32 x = 0;
    lw::i32 y = 0;
    lw::string label;

    bool operator==(point const&) const = default;
};
} // namespace

template <>
struct lw::codec<tracked_flag>
{
    template <class W>
    static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, tracked_flag const& value)
    {
        return lw::encode(enc, value.flag);
    }

    template <class R>
    static lw::result<tracked_flag, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto f = lw::decode<bool>(dec);
        if (f.has_error())
            return lw::error(f.error());
        return tracked_flag(f.value());
    }
};

template <>
struct lw::codec<tracked_key>
{
    template <class W>
    static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, tracked_key const& value)
    {
        return lw::encode(enc, value.key);
    }

    template <class R>
    static lw::result<tracked_key, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto k = lw::decode<lw::u16>(dec);
        if (k.has_error())
            return lw::error(k.error());
        return tracked_key(k.value());
    }
};

template <>
struct lw::codec<point>
{
    template <class W>
    static lw::result<void, lw::encode_error> encode(lw::encoder<W>& enc, point const& value)
    {
        LW_TRY(lw::encode(enc, value.x));
        LW_TRY(lw::encode(enc, value.y));
        return lw::encode(enc, value.label);
    }

    template <class R>
    static lw::result<point, lw::decode_error> decode(lw::decoder<R>& dec)
    {
        auto x = lw::decode<lw::i32>(dec);
        if (x.has_error())
            return lw::error(x.error());
        auto y = lw::decode<lw::i32>(dec);
        if (y.has_error())
            return lw::error(y.error());
        auto label = lw::decode<lw::string>(dec);
        if (label.has_error())
            return lw::error(label.error());
        return point{x.value(), y.value(), lw::move(label.value())};
    }
};

TEST("codec - primitive wire bytes")
{
    CHECK(encoded(true) == bytes_of({1}));
    CHECK(encoded(false) == bytes_of({0}));
    CHECK(encoded(lw::u8(200)) == bytes_of({200}));
    CHECK(encoded(lw::i8(-1)) == bytes_of({0xFF}));
    CHECK(encoded(lw::u32(7)) == bytes_of({7}));
    CHECK(encoded(lw::i64(-3)) == bytes_of({5}));
    CHECK(encoded(lw::f32(1.0f)) == bytes_of({0x00, 0x00, 0x80, 0x3F}));
    CHECK(encoded(lw::f64(-2.0)) == bytes_of({0, 0, 0, 0, 0, 0, 0, 0xC0}));

    SECTION("single bytes ignore the integer encoding")
    {
        CHECK(encoded(lw::u8(200), lw::config::legacy()) == bytes_of({200}));
        CHECK(encoded(true, lw::config::legacy().with_big_endian()) == bytes_of({1}));
    }

    SECTION("legacy and big endian")
    {
        CHECK(encoded(lw::u32(7), lw::config::legacy()) == bytes_of({7, 0, 0, 0}));
        CHECK(encoded(lw::i16(-2), lw::config::legacy().with_big_endian()) == bytes_of({0xFF, 0xFE}));
        CHECK(encoded(lw::f32(1.0f), lw::config::standard().with_big_endian()) == bytes_of({0x3F, 0x80, 0x00, 0x00}));
    }
}

TEST("codec - primitive round trips")
{
    CHECK(round_trip(lw::u16(0xFFFF)) == 0xFFFF);
    CHECK(round_trip(std::numeric_limits<lw::i64>::min()) == std::numeric_limits<lw::i64>::min());
    CHECK(round_trip(std::numeric_limits<lw::u64>::max(), lw::config::legacy().with_big_endian()) == std::numeric_limits<lw::u64>::max());
    CHECK(round_trip(lw::i8(-128)) == -128);
    CHECK(round_trip(lw::f64(3.25)) == 3.25);
    auto const p = lw::pair<lw::u8, bool>{3, true};
    CHECK(round_trip(p) == p);
}

TEST("codec - invalid bool")
{
    auto const r = decode_bytes<bool>(bytes_of({2}));
    REQUIRE(r.has_error());
    CHECK(r.error().kind == lw::decode_error_kind::invalid_bool_value);
    CHECK(r.error().found == 2u);
}

TEST("codec - vector")
{
    CHECK(encoded(lw::vector<lw::u32>{1, 2, 3}) == bytes_of({3, 1, 2, 3}));
    CHECK(encoded(lw::vector<lw::u32>{1}, lw::config::legacy()) == bytes_of({1, 0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 0}));
    CHECK(encoded(lw::vector<lw::u8>{}) == bytes_of({0}));

    auto const v = decode_bytes<lw::vector<lw::u32>>(bytes_of({3, 1, 2, 3}));
    REQUIRE(v.has_value());
    CHECK(v.value() == (lw::vector<lw::u32>{1, 2, 3}));

    SECTION("nested")
    {
        lw::vector<lw::vector<lw::u16>> nested;
        nested.push_back(lw::vector<lw::u16>{1, 2});
        nested.push_back(lw::vector<lw::u16>{});
        nested.push_back(lw::vector<lw::u16>{300});
        CHECK(round_trip(nested) == nested);
    }

    SECTION("truncated")
    {
        auto const r = decode_bytes<lw::vector<lw::u32>>(bytes_of({3, 1, 2}));
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::unexpected_end);
    }
}

TEST("codec - array and devector")
{
    auto const a = lw::array<lw::i32>::create_copy_of(lw::span<lw::i32 const>({-1, 0, 1}));
    CHECK(encoded(a) == bytes_of({3, 1, 0, 2}));
    CHECK(round_trip(a) == a);

    lw::devector<lw::u8> d;
    d.push_back(2);
    d.push_front(1);
    CHECK(encoded(d) == bytes_of({2, 1, 2}));

    auto const back = round_trip(d);
    REQUIRE(back.size() == 2);
    CHECK(back.front() == 1);
    CHECK(back.back() == 2);
}

TEST("codec - string")
{
    CHECK(encoded(lw::string("abc")) == bytes_of({3, 0x61, 0x62, 0x63}));
    CHECK(round_trip(lw::string("gr\xC3\xBC\xC3\x9F")) == "gr\xC3\xBC\xC3\x9F");
    CHECK(round_trip(lw::string()) == "");

    SECTION("invalid utf-8")
    {
        auto const r = decode_bytes<lw::string>(bytes_of({2, 0xFF, 0xFE}));
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::invalid_utf8);
        CHECK(r.error().valid_up_to == 0);

        auto const s = decode_bytes<lw::string>(bytes_of({4, 0x61, 0x62, 0xED, 0xA0}));
        REQUIRE(s.has_error());
        CHECK(s.error().valid_up_to == 2);
    }

    SECTION("truncated")
    {
        auto const r = decode_bytes<lw::string>(bytes_of({5, 0x61}));
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::unexpected_end);
        CHECK(r.error().additional == 4);
    }
}

TEST("codec - set and map")
{
    SECTION("set decodes sorted")
    {
        auto const s = decode_bytes<lw::set<lw::u32>>(bytes_of({3, 3, 1, 2}));
        REQUIRE(s.has_value());
        REQUIRE(s.value().size() == 3);
        CHECK(s.value().front() == 1);
        CHECK(s.value().back() == 3);
        CHECK(encoded(s.value()) == bytes_of({3, 1, 2, 3}));
    }

    SECTION("set drops duplicates")
    {
        auto const s = decode_bytes<lw::set<lw::u32>>(bytes_of({4, 1, 2, 1, 2}));
        REQUIRE(s.has_value());
        CHECK(s.value().size() == 2);
    }

    SECTION("map keeps the last value of a duplicate key")
    {
        auto const m = decode_bytes<lw::map<lw::u8, lw::u8>>(bytes_of({3, 5, 1, 2, 2, 5, 3}));
        REQUIRE(m.has_value());
        REQUIRE(m.value().size() == 2);
        CHECK(*m.value().get(5) == 3);
        CHECK(*m.value().get(2) == 2);
        CHECK(encoded(m.value()) == bytes_of({2, 2, 2, 5, 3}));
    }

    SECTION("descending input")
    {
        // wire order 999, 998, ..., 0, then every even key again
        lw::vector<lw::u16> keys;
        for (auto k = 999; k >= 0; --k)
            keys.push_back(lw::u16(k));
        for (auto k = 0; k < 1000; k += 2)
            keys.push_back(lw::u16(k));

        auto const s = decode_bytes<lw::set<lw::u16>>(encoded(keys));
        REQUIRE(s.has_value());
        REQUIRE(s.value().size() == 1000);
        lw::u16 expected = 0;
        for (auto k : s.value())
            CHECK(k == expected++);
    }

    SECTION("map resolves repeated keys in wire order")
    {
        lw::vector<lw::pair<lw::u8, lw::u8>> entries;
        for (auto i = 0; i < 3; ++i)
            entries.push_back(lw::pair<lw::u8, lw::u8>{lw::u8(9 - i), lw::u8(i)});
        entries.push_back(lw::pair<lw::u8, lw::u8>{lw::u8(8), lw::u8(77)});

        auto const m = decode_bytes<lw::map<lw::u8, lw::u8>>(encoded(entries));
        REQUIRE(m.has_value());
        REQUIRE(m.value().size() == 3);
        CHECK(m.value().begin()->first == 7);
        CHECK(*m.value().get(8) == 77);
        CHECK(*m.value().get(9) == 0);
    }

    SECTION("descending map with repeated keys keeps the last value")
    {
        lw::vector<lw::pair<lw::u16, lw::u32>> entries;
        for (auto k = 499; k >= 0; --k)
            entries.push_back(lw::pair<lw::u16, lw::u32>{lw::u16(k), lw::u32(k)});
        for (auto k = 499; k >= 0; --k)
            entries.push_back(lw::pair<lw::u16, lw::u32>{lw::u16(k), lw::u32(k + 1000)});

        auto const m = decode_bytes<lw::map<lw::u16, lw::u32>>(encoded(entries));
        REQUIRE(m.has_value());
        REQUIRE(m.value().size() == 500);
        lw::u16 expected = 0;
        for (auto const& [key, value] : m.value())
        {
            CHECK(key == expected);
            CHECK(value == lw::u32(expected) + 1000);
            ++expected;
        }
    }

    SECTION("map round trip")
    {
        lw::map<lw::string, lw::vector<lw::i32>> m;
        m.insert_or_assign(lw::string("b"), lw::vector<lw::i32>{-1, 1});
        m.insert_or_assign(lw::string("a"), lw::vector<lw::i32>{});
        CHECK(round_trip(m) == m);
    }
}

TEST("codec - priority_queue")
{
    lw::priority_queue<lw::u32> q;
    for (auto v : {4u, 8u, 1u, 6u})
        q.push(v);

    auto back = round_trip(q);
    CHECK(back.size() == 4);
    CHECK(back.top() == 8u);
    CHECK(back.pop() == 8u);
    CHECK(back.pop() == 6u);
    CHECK(back.pop() == 4u);
    CHECK(back.pop() == 1u);
}

TEST("codec - pointer wrappers are transparent")
{
    auto const b = lw::box<lw::u32>::create(300u);
    CHECK(encoded(b) == encoded(lw::u32(300)));
    CHECK(*round_trip(b) == 300u);

    auto const r = lw::rc<lw::string>::create("x");
    CHECK(encoded(r) == encoded(lw::string("x")));
    CHECK(*round_trip(r) == "x");

    auto const a = lw::arc<lw::i16>::create(lw::i16(-5));
    CHECK(*round_trip(a) == -5);

    lw::string const source = "borrowed";
    auto const c = lw::cow<lw::string>::borrowed(source);
    CHECK(encoded(c) == encoded(source));
    auto const decoded_cow = round_trip(c);
    CHECK(decoded_cow.is_owned());
    CHECK(*decoded_cow == "borrowed");
}

TEST("codec - decoded rc values never alias")
{
    lw::vector<lw::rc<lw::u32>> shared;
    auto const one = lw::rc<lw::u32>::create(1u);
    shared.push_back(one);
    shared.push_back(one);
    CHECK(shared[0].ptr_eq(shared[1]));

    auto const back = round_trip(shared);
    REQUIRE(back.size() == 2);
    CHECK(back[0].use_count() == 1);
    CHECK(back[1].use_count() == 1);
    CHECK(!back[0].ptr_eq(back[1]));
    CHECK(*back[0] == 1u);

    lw::vector<lw::arc<lw::u32>> atomics;
    auto const two = lw::arc<lw::u32>::create(2u);
    atomics.push_back(two);
    atomics.push_back(two);
    auto const arcs = round_trip(atomics);
    CHECK(arcs[0].use_count() == 1);
    CHECK(!arcs[0].ptr_eq(arcs[1]));
}

TEST("codec - user struct")
{
    auto const p = point{-3, 4, lw::string("origin")};
    CHECK(encoded(p) == bytes_of({5, 8, 6, 'o', 'r', 'i', 'g', 'i', 'n'}));
    CHECK(round_trip(p) == p);
}

TEST("codec - decode limit")
{
    auto const bytes = bytes_of({3, 1, 2, 3});

    SECTION("exact budget succeeds")
    {
        // 8 for the length, 3 * 4 for the elements
        auto const r = decode_bytes<lw::vector<lw::u32>>(bytes, lw::config::standard().with_limit(20));
        REQUIRE(r.has_value());
        CHECK(r.value().size() == 3);
    }

    SECTION("one byte less fails")
    {
        auto const r = decode_bytes<lw::vector<lw::u32>>(bytes, lw::config::standard().with_limit(19));
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::limit_exceeded);
    }

    SECTION("forged length is rejected before allocating")
    {
        test_resource res;
        // length 2^32, followed by nothing
        auto const forged = bytes_of({253, 0, 0, 0, 0, 1, 0, 0, 0});
        auto const r = decode_bytes<lw::vector<lw::u64>>(forged, lw::config::standard().with_limit(1 << 20), res.get());
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::limit_exceeded);
        CHECK(res.total_allocations == 0);
        CHECK(res.largest_request == 0);
    }

    SECTION("forged string length")
    {
        test_resource res;
        auto const forged = bytes_of({253, 0, 0, 0, 0, 0, 1, 0, 0, 'a'});
        auto const r = decode_bytes<lw::string>(forged, lw::config::standard().with_limit(4096), res.get());
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::limit_exceeded);
        CHECK(res.total_allocations == 0);
    }

    SECTION("element count times size overflowing isize")
    {
        auto const forged = bytes_of({253, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x0F});
        auto const r = decode_bytes<lw::vector<lw::u64>>(forged);
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::limit_exceeded);
    }

    SECTION("nested containers share one budget")
    {
        lw::vector<lw::vector<lw::u8>> nested;
        for (auto i = 0; i < 4; ++i)
            nested.push_back(lw::vector<lw::u8>{1, 2, 3, 4});
        auto const nested_bytes = encoded(nested);

        CHECK(decode_bytes<decltype(nested)>(nested_bytes, lw::config::standard().with_limit(1 << 16)).has_value());
        CHECK(decode_bytes<decltype(nested)>(nested_bytes, lw::config::standard().with_limit(40)).has_error());
    }
}

TEST("codec - allocation failure is reported, not fatal")
{
    test_resource res;
    res.fail_allocations = true;

    SECTION("containers report reserve")
    {
        auto const v = decode_bytes<lw::vector<lw::u32>>(bytes_of({3, 1, 2, 3}), lw::config::standard(), res.get());
        REQUIRE(v.has_error());
        CHECK(v.error().kind == lw::decode_error_kind::out_of_memory);
        CHECK(v.error().oom.source == lw::oom_source::reserve);

        auto const s = decode_bytes<lw::string>(bytes_of({1, 'a'}), lw::config::standard(), res.get());
        REQUIRE(s.has_error());
        CHECK(s.error().oom.source == lw::oom_source::reserve);

        auto const m = decode_bytes<lw::map<lw::u8, lw::u8>>(bytes_of({1, 1, 1}), lw::config::standard(), res.get());
        REQUIRE(m.has_error());
        CHECK(m.error().oom.source == lw::oom_source::reserve);

        auto const sorted = decode_bytes<lw::set<lw::u32>>(bytes_of({2, 1, 2}), lw::config::standard(), res.get());
        REQUIRE(sorted.has_error());
        CHECK(sorted.error().kind == lw::decode_error_kind::out_of_memory);
        CHECK(sorted.error().oom.source == lw::oom_source::reserve);

        auto const q = decode_bytes<lw::priority_queue<lw::u32>>(bytes_of({2, 1, 2}), lw::config::standard(), res.get());
        REQUIRE(q.has_error());
        CHECK(q.error().kind == lw::decode_error_kind::out_of_memory);
        CHECK(q.error().oom.source == lw::oom_source::reserve);

        auto const d = decode_bytes<lw::devector<lw::u32>>(bytes_of({2, 1, 2}), lw::config::standard(), res.get());
        REQUIRE(d.has_error());
        CHECK(d.error().kind == lw::decode_error_kind::out_of_memory);
        CHECK(d.error().oom.source == lw::oom_source::reserve);
    }

    SECTION("single objects report alloc")
    {
        auto const b = decode_bytes<lw::box<lw::u32>>(bytes_of({7}), lw::config::standard(), res.get());
        REQUIRE(b.has_error());
        CHECK(b.error().kind == lw::decode_error_kind::out_of_memory);
        CHECK(b.error().oom.source == lw::oom_source::alloc);

        auto const r = decode_bytes<lw::rc<lw::u32>>(bytes_of({7}), lw::config::standard(), res.get());
        REQUIRE(r.has_error());
        CHECK(r.error().oom.source == lw::oom_source::alloc);

        auto const a = decode_bytes<lw::arc<lw::u32>>(bytes_of({7}), lw::config::standard(), res.get());
        REQUIRE(a.has_error());
        CHECK(a.error().oom.source == lw::oom_source::alloc);

        auto const slice = decode_bytes<lw::array<lw::u32>>(bytes_of({2, 1, 2}), lw::config::standard(), res.get());
        REQUIRE(slice.has_error());
        CHECK(slice.error().oom.source == lw::oom_source::alloc);
    }

    SECTION("forged length without a limit")
    {
        res.fail_allocations = true;
        auto const forged = bytes_of({253, 0, 0, 0, 0, 1, 0, 0, 0});
        auto const r = decode_bytes<lw::vector<lw::u64>>(forged, lw::config::standard(), res.get());
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::out_of_memory);
        CHECK(r.error().oom.requested_bytes >= (lw::isize(1) << 35));
    }

    CHECK(res.live_allocations == 0);
}

TEST("codec - partial decode cleans up")
{
    test_resource res;
    tracked_flag::reset_counters();

    // 1000 flags, the one at index 500 is not a valid bool
    lw::vector<lw::byte> bytes = bytes_of({251, 0xE8, 0x03});
    for (auto i = 0; i < 1000; ++i)
        bytes.push_back(lw::byte(i == 500 ? 2 : i % 2));

    SECTION("vector")
    {
        auto const r = decode_bytes<lw::vector<tracked_flag>>(bytes, lw::config::standard(), res.get());
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::invalid_bool_value);
        CHECK(tracked_flag::ctor_count == tracked_flag::dtor_count);
        CHECK(tracked_flag::ctor_count >= 500);
    }

    SECTION("boxed slice")
    {
        auto const r = decode_bytes<lw::array<tracked_flag>>(bytes, lw::config::standard(), res.get());
        REQUIRE(r.has_error());
        CHECK(tracked_flag::ctor_count == tracked_flag::dtor_count);
    }

    SECTION("devector")
    {
        auto const r = decode_bytes<lw::devector<tracked_flag>>(bytes, lw::config::standard(), res.get());
        REQUIRE(r.has_error());
        CHECK(tracked_flag::ctor_count == tracked_flag::dtor_count);
    }

    SECTION("map")
    {
        // 1000 entries {i % 200, flag}, the flag of entry 500 is invalid
        lw::vector<lw::byte> entries = bytes_of({251, 0xE8, 0x03});
        for (auto i = 0; i < 1000; ++i)
        {
            entries.push_back(lw::byte(i % 200));
            entries.push_back(lw::byte(i == 500 ? 2 : i % 2));
        }

        auto const r = decode_bytes<lw::map<lw::u8, tracked_flag>>(entries, lw::config::standard(), res.get());
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::invalid_bool_value);
        CHECK(tracked_flag::ctor_count == tracked_flag::dtor_count);
        CHECK(tracked_flag::ctor_count >= 500);
    }

    SECTION("valid input keeps everything alive")
    {
        bytes[3 + 500] = lw::byte(1);
        {
            auto const r = decode_bytes<lw::vector<tracked_flag>>(bytes, lw::config::standard(), res.get());
            REQUIRE(r.has_value());
            CHECK(r.value().size() == 1000);
            CHECK(r.value()[500].flag);
            CHECK(tracked_flag::ctor_count - tracked_flag::dtor_count == 1000);
        }
        CHECK(tracked_flag::ctor_count == tracked_flag::dtor_count);
    }

    CHECK(res.live_allocations == 0);
    CHECK(res.live_bytes == 0);
}

TEST("codec - partial decode of ordered containers cleans up")
{
    test_resource res;
    tracked_key::reset_counters();

    // 1000 keys in descending order, the one at index 500 announces a u128
    lw::vector<lw::byte> bytes = bytes_of({251, 0xE8, 0x03});
    for (auto i = 0; i < 1000; ++i)
        bytes.push_back(lw::byte(i == 500 ? 254 : 200 - i % 200));

    SECTION("set")
    {
        auto const r = decode_bytes<lw::set<tracked_key>>(bytes, lw::config::standard(), res.get());
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::invalid_integer_type);
        CHECK(tracked_key::ctor_count == tracked_key::dtor_count);
        CHECK(tracked_key::ctor_count >= 500);
    }

    SECTION("priority_queue")
    {
        auto const r = decode_bytes<lw::priority_queue<tracked_key>>(bytes, lw::config::standard(), res.get());
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::decode_error_kind::invalid_integer_type);
        CHECK(tracked_key::ctor_count == tracked_key::dtor_count);
        CHECK(tracked_key::ctor_count >= 500);
    }

    SECTION("valid input")
    {
        bytes[3 + 500] = lw::byte(7);
        {
            auto const s = decode_bytes<lw::set<tracked_key>>(bytes, lw::config::standard(), res.get());
            REQUIRE(s.has_value());
            CHECK(s.value().size() == 200);
            CHECK(s.value().front().key == 1);
            CHECK(s.value().back().key == 200);
            CHECK(tracked_key::ctor_count - tracked_key::dtor_count == 200);

            auto const q = decode_bytes<lw::priority_queue<tracked_key>>(bytes, lw::config::standard(), res.get());
            REQUIRE(q.has_value());
            CHECK(q.value().size() == 1000);
            CHECK(q.value().top().key == 200);
        }
        CHECK(tracked_key::ctor_count == tracked_key::dtor_count);
    }

    CHECK(res.live_allocations == 0);
    CHECK(res.live_bytes == 0);
}

TEST("codec - one-call entry points")
{
    auto const value = lw::vector<lw::u32>{1, 300, 70000};

    SECTION("encoded_size matches")
    {
        auto const size = lw::encoded_size(value);
        REQUIRE(size.has_value());
        CHECK(size.value() == encoded(value).size());
        CHECK(size.value() == 1 + 1 + 3 + 5);
    }

    SECTION("encode_into_slice")
    {
        lw::byte out[16] = {};
        auto const written = lw::encode_into_slice(value, lw::span<lw::byte>(out));
        REQUIRE(written.has_value());
        CHECK(written.value() == 10);
        CHECK(out[0] == lw::byte(3));
        CHECK(out[2] == lw::byte(251));
    }

    SECTION("encode_into_slice too small")
    {
        lw::byte out[4] = {};
        auto const written = lw::encode_into_slice(value, lw::span<lw::byte>(out));
        REQUIRE(written.has_error());
        CHECK(written.error().kind == lw::encode_error_kind::unexpected_end);
    }

    SECTION("trailing input is left alone")
    {
        auto bytes = encoded(value);
        bytes.push_back(lw::byte(0xAA));
        auto const r = lw::decode_from_slice<lw::vector<lw::u32>>(lw::span<lw::byte const>(bytes));
        REQUIRE(r.has_value());
        CHECK(r.value().bytes_read == 10);
        CHECK(r.value().value == value);
    }

    SECTION("decoded values use the given resource")
    {
        test_resource res;
        {
            auto const r = lw::decode_from_slice<lw::vector<lw::u32>>(lw::span<lw::byte const>(encoded(value)), lw::config::standard(), res.get());
            REQUIRE(r.has_value());
            CHECK(r.value().value.resource() == res.get());
            CHECK(res.live_allocations == 1);
        }
        CHECK(res.live_allocations == 0);
    }

    SECTION("encode_to_vector with a failing resource")
    {
        test_resource res;
        res.fail_allocations = true;
        auto const r = lw::encode_to_vector(value, lw::config::standard(), res.get());
        REQUIRE(r.has_error());
        CHECK(r.error().kind == lw::encode_error_kind::out_of_memory);
    }
}
