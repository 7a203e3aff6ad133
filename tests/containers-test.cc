#include <lean-wire/array.hh>
#include <lean-wire/devector.hh>
#include <lean-wire/map.hh>
#include <lean-wire/priority_queue.hh>
#include <lean-wire/set.hh>
#include <lean-wire/string.hh>
#include <lean-wire/vector.hh>

#include <nexus/test.hh>

#include "test-resource.hh"

namespace
{
struct greater
{
    bool operator()(int a, int b) const { return a > b; }
};
} // namespace

TEST("vector - growth and element access")
{
    lw::vector<int> v;
    CHECK(v.empty());

    for (auto i = 0; i < 100; ++i)
        v.push_back(i);

    CHECK(v.size() == 100);
    CHECK(v.front() == 0);
    CHECK(v.back() == 99);
    CHECK(v[42] == 42);
    CHECK(v.capacity() >= 100);

    v.emplace_at(0, -1);
    CHECK(v.front() == -1);
    CHECK(v[1] == 0);
    CHECK(v.size() == 101);

    v.remove_at(0);
    CHECK(v.front() == 0);
    CHECK(v.pop_back() == 99);
    CHECK(v.size() == 99);
}

TEST("vector - copy is deep")
{
    lw::vector<int> a = {1, 2, 3};
    auto b = a;
    b[0] = 10;
    CHECK(a[0] == 1);
    CHECK(b[0] == 10);
    CHECK(a != b);

    b[0] = 1;
    CHECK(a == b);
}

TEST("vector - try_create_with_capacity")
{
    test_resource res;

    SECTION("reserves exactly what was asked for")
    {
        auto v = lw::vector<lw::u64>::try_create_with_capacity(10, res.get());
        REQUIRE(v.has_value());
        CHECK(v.value().empty());
        CHECK(v.value().capacity() >= 10);
        CHECK(v.value().resource() == res.get());

        auto const allocations = res.total_allocations;
        for (auto i = 0; i < 10; ++i)
            v.value().push_back_stable(lw::u64(i));
        CHECK(res.total_allocations == allocations);
    }

    SECTION("zero capacity does not allocate")
    {
        auto v = lw::vector<lw::u64>::try_create_with_capacity(0, res.get());
        REQUIRE(v.has_value());
        CHECK(res.total_allocations == 0);
    }

    SECTION("allocation failure")
    {
        res.fail_allocations = true;
        auto v = lw::vector<lw::u64>::try_create_with_capacity(10, res.get());
        REQUIRE(v.has_error());
        CHECK(v.error().source == lw::oom_source::reserve);
        CHECK(v.error().requested_bytes >= 80);
    }

    SECTION("custom oom source")
    {
        res.fail_allocations = true;
        auto v = lw::vector<lw::u64>::try_create_with_capacity(10, res.get(), lw::oom_source::alloc);
        REQUIRE(v.has_error());
        CHECK(v.error().source == lw::oom_source::alloc);
    }

    SECTION("overflowing capacity")
    {
        auto v = lw::vector<lw::u64>::try_create_with_capacity(std::numeric_limits<lw::isize>::max() / 2, res.get());
        REQUIRE(v.has_error());
        CHECK(v.error().requested_bytes == -1);
        CHECK(res.total_allocations == 0);
    }

    CHECK(res.live_allocations == 0);
}

TEST("vector - try_reserve_back keeps elements on failure")
{
    test_resource res;
    auto v = lw::vector<int>::create_with_capacity(0, res.get());
    v.push_back(1);
    v.push_back(2);

    res.fail_allocations = true;
    auto const r = v.try_reserve_back(1000);
    REQUIRE(r.has_error());
    CHECK(v.size() == 2);
    CHECK(v[1] == 2);
}

TEST("array - fixed size")
{
    auto a = lw::array<int>::create_filled(4, 7);
    CHECK(a.size() == 4);
    CHECK(a[3] == 7);

    auto b = a;
    CHECK(a == b);
    b[0] = 1;
    CHECK(!(a == b));

    auto const c = lw::array<int>::create_copy_of(lw::span<int const>({1, 2, 3}));
    CHECK(c.size() == 3);
    CHECK(c.back() == 3);

    auto const d = lw::array<lw::u8>::create_defaulted(2);
    CHECK(d[0] == 0);
}

TEST("devector - both ends")
{
    lw::devector<int> d;
    d.push_back(2);
    d.push_back(3);
    d.push_front(1);
    d.push_front(0);

    REQUIRE(d.size() == 4);
    for (auto i = 0; i < 4; ++i)
        CHECK(d[i] == i);

    CHECK(d.pop_front() == 0);
    CHECK(d.pop_back() == 3);
    CHECK(d.front() == 1);
    CHECK(d.back() == 2);

    for (auto i = 0; i < 50; ++i)
        d.push_front(-i);
    CHECK(d.size() == 52);
    CHECK(d.front() == -49);
    CHECK(d.back() == 2);
}

TEST("string - basics")
{
    lw::string s = "hello";
    CHECK(s.size() == 5);
    CHECK(s == "hello");
    CHECK(s[1] == 'e');

    s += " world";
    s += '!';
    CHECK(s == "hello world!");
    CHECK(lw::string_view(s).substr(6, 5) == "world");

    auto const copy = s;
    CHECK(copy == s);
    CHECK(lw::string("abc") < lw::string("abd"));

    s.clear();
    CHECK(s.empty());

    SECTION("long appends")
    {
        lw::string t;
        for (auto i = 0; i < 1000; ++i)
            t += "ab";
        CHECK(t.size() == 2000);
        CHECK(t[1999] == 'b');
    }

    SECTION("custom resource")
    {
        test_resource res;
        {
            auto t = lw::string::create_copy_of("resource backed", res.get());
            CHECK(t.resource() == res.get());
            CHECK(res.live_allocations == 1);
        }
        CHECK(res.live_allocations == 0);
    }
}

TEST("set - sorted and unique")
{
    lw::set<int> s;
    CHECK(s.insert(3));
    CHECK(s.insert(1));
    CHECK(s.insert(2));
    CHECK(!s.insert(2));

    REQUIRE(s.size() == 3);
    auto expected = 1;
    for (auto v : s)
        CHECK(v == expected++);

    CHECK(s.contains(2));
    CHECK(!s.contains(5));
    CHECK(s.front() == 1);
    CHECK(s.back() == 3);

    CHECK(s.remove(2));
    CHECK(!s.remove(2));
    CHECK(s.size() == 2);

    CHECK(s == (lw::set<int>{3, 1}));
}

TEST("set - duplicate insert keeps the first element")
{
    struct keyed
    {
        int key;
        int tag;
        bool operator<(keyed const& rhs) const { return key < rhs.key; }
    };

    lw::set<keyed> s;
    s.insert(keyed{1, 100});
    s.insert(keyed{1, 200});
    REQUIRE(s.size() == 1);
    CHECK(s.front().tag == 100);
}

TEST("map - sorted by key")
{
    lw::map<int, lw::string> m;
    m.insert_or_assign(2, "two");
    m.insert_or_assign(1, "one");
    m.insert_or_assign(3, "three");

    REQUIRE(m.size() == 3);
    CHECK(m.begin()->first == 1);
    CHECK(m.begin()->second == "one");

    REQUIRE(m.get(3) != nullptr);
    CHECK(*m.get(3) == "three");
    CHECK(m.get(4) == nullptr);
    CHECK(m.contains_key(2));

    SECTION("duplicate keys replace the value")
    {
        m.insert_or_assign(2, "zwei");
        CHECK(m.size() == 3);
        CHECK(*m.get(2) == "zwei");
    }

    SECTION("removal")
    {
        CHECK(m.remove_key(1));
        CHECK(!m.remove_key(1));
        CHECK(m.size() == 2);
        CHECK(m.begin()->first == 2);
    }

    SECTION("try_create_with_capacity")
    {
        test_resource res;
        auto r = lw::map<int, int>::try_create_with_capacity(8, res.get());
        REQUIRE(r.has_value());
        CHECK(r.value().resource() == res.get());

        res.fail_allocations = true;
        auto f = lw::map<int, int>::try_create_with_capacity(8, res.get());
        REQUIRE(f.has_error());
        CHECK(f.error().source == lw::oom_source::reserve);
    }
}

TEST("priority_queue - max heap")
{
    lw::priority_queue<int> q;
    for (auto v : {5, 1, 9, 3, 7, 9})
        q.push(v);

    CHECK(q.size() == 6);
    CHECK(q.top() == 9);

    lw::vector<int> drained;
    while (!q.empty())
        drained.push_back(q.pop());

    CHECK(drained == (lw::vector<int>{9, 9, 7, 5, 3, 1}));

    SECTION("custom ordering")
    {
        lw::priority_queue<int, greater> min_queue;
        min_queue.push(4);
        min_queue.push(2);
        min_queue.push(8);
        CHECK(min_queue.top() == 2);
        min_queue.remove_top();
        CHECK(min_queue.top() == 4);
    }
}
