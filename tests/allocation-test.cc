#include <lean-wire/allocation.hh>
#include <lean-wire/span.hh>
#include <lean-wire/utility.hh>

#include <nexus/test.hh>

#include <vector>

#include "test-resource.hh"

namespace
{
// Instrumented type that tracks construction and destruction
struct Tracked
{
    int value = 0;
    static inline int default_ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;
    static inline std::vector<int>* destruction_order = nullptr;

    static void reset_counters()
    {
        default_ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
        destruction_order = nullptr;
    }

    Tracked() { ++default_ctor_count; }

    explicit Tracked(int v) : value(v) { ++default_ctor_count; }

    Tracked(Tracked const& rhs) : value(rhs.value) { ++copy_ctor_count; }

    Tracked(Tracked&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }

    Tracked& operator=(Tracked const& rhs)
    {
        value = rhs.value;
        return *this;
    }

    Tracked& operator=(Tracked&& rhs) noexcept
    {
        value = rhs.value;
        return *this;
    }

    ~Tracked()
    {
        ++dtor_count;
        if (destruction_order)
            destruction_order->push_back(value);
    }
};
} // namespace

TEST("allocation - default construction")
{
    lw::allocation<int> alloc;

    CHECK(alloc.obj_start == nullptr);
    CHECK(alloc.obj_end == nullptr);
    CHECK(alloc.alloc_start == nullptr);
    CHECK(alloc.alloc_end == nullptr);
    CHECK(alloc.alignment == 0);
    CHECK(alloc.custom_resource == nullptr);
    CHECK(!alloc.is_valid());
    CHECK(alloc.obj_span().size() == 0);
    CHECK(alloc.alloc_size_bytes() == 0);
}

TEST("allocation - create_empty")
{
    auto alloc = lw::allocation<int>::create_empty(10, alignof(int), nullptr);

    CHECK(alloc.is_valid());
    CHECK(alloc.alloc_size_bytes() >= 10 * lw::isize(sizeof(int)));
    CHECK(alloc.obj_start == (int*)alloc.alloc_start);
    CHECK(alloc.obj_end == alloc.obj_start); // no live objects
    CHECK(alloc.alignment == lw::isize(alignof(int)));

    SECTION("zero size does not allocate")
    {
        auto empty = lw::allocation<int>::create_empty(0, alignof(int), nullptr);
        CHECK(!empty.is_valid());
        CHECK(empty.alloc_start == nullptr);
        CHECK(empty.obj_start == nullptr);
    }
}

TEST("allocation - create_defaulted and create_filled")
{
    Tracked::reset_counters();

    {
        auto defaulted = lw::allocation<Tracked>::create_defaulted(5, nullptr);
        CHECK(defaulted.obj_span().size() == 5);
        CHECK(Tracked::default_ctor_count == 5);
        for (auto const& obj : defaulted.obj_span())
            CHECK(obj.value == 0);

        auto filled = lw::allocation<Tracked>::create_filled(3, Tracked(42), nullptr);
        CHECK(filled.obj_span().size() == 3);
        CHECK(Tracked::copy_ctor_count == 3);
        for (auto const& obj : filled.obj_span())
            CHECK(obj.value == 42);
    }

    // 5 defaulted, 3 filled, 1 fill value
    CHECK(Tracked::dtor_count == 5 + 3 + 1);
}

TEST("allocation - create_copy_of")
{
    Tracked::reset_counters();

    {
        Tracked source[3] = {Tracked(10), Tracked(20), Tracked(30)};
        Tracked::reset_counters();

        auto alloc = lw::allocation<Tracked>::create_copy_of(lw::span<Tracked const>(source, 3), nullptr);
        CHECK(alloc.obj_span().size() == 3);
        CHECK(Tracked::copy_ctor_count == 3);
        CHECK(alloc.obj_start[0].value == 10);
        CHECK(alloc.obj_start[2].value == 30);
    }

    CHECK(Tracked::dtor_count == 3 + 3);
}

TEST("allocation - move construction and assignment")
{
    auto a = lw::allocation<int>::create_filled(4, 7, nullptr);
    auto const start = a.obj_start;

    auto b = lw::move(a);
    CHECK(b.obj_start == start);
    CHECK(b.obj_span().size() == 4);
    CHECK(a.obj_start == nullptr);
    CHECK(!a.is_valid());

    auto c = lw::allocation<int>::create_filled(2, 1, nullptr);
    c = lw::move(b);
    CHECK(c.obj_start == start);
    CHECK(c.obj_span().size() == 4);
    CHECK(c.obj_start[3] == 7);
}

TEST("allocation - destruction order")
{
    Tracked::reset_counters();
    std::vector<int> order;

    {
        Tracked source[3] = {Tracked(1), Tracked(2), Tracked(3)};
        auto alloc = lw::allocation<Tracked>::create_copy_of(lw::span<Tracked const>(source, 3), nullptr);
        Tracked::destruction_order = &order;
    }

    // the allocation dies first, in reverse, then the source array (also in reverse)
    REQUIRE(order.size() == 6);
    CHECK(order[0] == 3);
    CHECK(order[1] == 2);
    CHECK(order[2] == 1);
    Tracked::destruction_order = nullptr;
}

TEST("allocation - custom resource")
{
    test_resource res;

    {
        auto alloc = lw::allocation<int>::create_filled(16, 3, res.get());
        CHECK(alloc.custom_resource == res.get());
        CHECK(&alloc.resource() == res.get());
        CHECK(res.live_allocations == 1);
        CHECK(res.live_bytes >= 16 * lw::isize(sizeof(int)));
    }

    CHECK(res.live_allocations == 0);
    CHECK(res.live_bytes == 0);

    SECTION("nullptr resolves to the default resource")
    {
        lw::allocation<int> alloc;
        CHECK(&alloc.resource() == lw::default_memory_resource);
    }
}

TEST("allocation - try_create_empty")
{
    test_resource res;

    SECTION("success")
    {
        auto alloc = lw::allocation<lw::u64>::try_create_empty(100, alignof(lw::u64), res.get());
        REQUIRE(alloc.has_value());
        CHECK(alloc.value().alloc_size_bytes() >= 800);
        CHECK(alloc.value().obj_span().size() == 0);
        CHECK(res.live_allocations == 1);
    }

    SECTION("resource failure reports the request")
    {
        res.fail_allocations = true;
        auto alloc = lw::allocation<lw::u64>::try_create_empty(100, alignof(lw::u64), res.get(), lw::oom_source::alloc);
        REQUIRE(alloc.has_error());
        CHECK(alloc.error().source == lw::oom_source::alloc);
        CHECK(alloc.error().requested_bytes == 800);
        CHECK(res.live_allocations == 0);
    }

    SECTION("overflowing size never reaches the resource")
    {
        auto alloc = lw::allocation<lw::u64>::try_create_empty(std::numeric_limits<lw::isize>::max() / 4, alignof(lw::u64), res.get());
        REQUIRE(alloc.has_error());
        CHECK(alloc.error().source == lw::oom_source::reserve);
        CHECK(alloc.error().requested_bytes == -1);
        CHECK(res.total_allocations == 0);
        CHECK(res.failed_requests == 0);
    }
}

TEST("allocation - try_resize_alloc")
{
    test_resource res;
    Tracked::reset_counters();

    {
        auto alloc = lw::allocation<Tracked>::create_empty(2, alignof(Tracked), res.get());
        lw::impl::fill_create_objects_to(alloc.obj_end, 2, Tracked(5));

        SECTION("grow moves the live objects")
        {
            auto r = alloc.try_resize_alloc(10 * sizeof(Tracked), 10 * sizeof(Tracked));
            REQUIRE(r.has_value());
            CHECK(alloc.alloc_size_bytes() >= 10 * lw::isize(sizeof(Tracked)));
            REQUIRE(alloc.obj_span().size() == 2);
            CHECK(alloc.obj_start[0].value == 5);
            CHECK(alloc.obj_start[1].value == 5);
            CHECK(res.live_allocations == 1);
        }

        SECTION("failure leaves the allocation untouched")
        {
            auto const start = alloc.obj_start;
            res.fail_allocations = true;
            auto r = alloc.try_resize_alloc(10 * sizeof(Tracked), 10 * sizeof(Tracked));
            REQUIRE(r.has_error());
            CHECK(r.error().source == lw::oom_source::reserve);
            CHECK(alloc.obj_start == start);
            CHECK(alloc.obj_span().size() == 2);
            CHECK(alloc.obj_start[1].value == 5);
        }
    }

    CHECK(res.live_allocations == 0);
}
