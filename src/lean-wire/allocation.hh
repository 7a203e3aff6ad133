#pragma once

#include <lean-wire/errors.hh>
#include <lean-wire/fwd.hh>
#include <lean-wire/impl/object_lifetime_util.hh>
#include <lean-wire/result.hh>
#include <lean-wire/span.hh>
#include <lean-wire/utility.hh>

#include <limits>

// lw::allocation<T> is the owning "storage + liveness" handle underlying all contiguous heap containers.
//
// It models two things explicitly:
// 1) which bytes are owned (the allocation from a lw::memory_resource),
// 2) which objects inside those bytes are currently alive (the live window).
//
// Containers such as lw::array<T>, lw::vector<T>, and lw::devector<T> differ mainly in *policy*
// (how obj_start / obj_end move and when growth happens). The sharp mechanics (allocation ownership,
// resizing, alignment, and object lifetime) are centralized here.
//
// Every allocation path comes in two flavors:
// - create_* / resize_alloc go through memory_resource::allocate_bytes and treat failure as fatal.
//   They are used for containers the program builds itself.
// - try_create_* / try_resize_alloc go through memory_resource::try_allocate_bytes and report failure as
//   lw::out_of_memory. Every allocation whose size is influenced by decoded input uses these.
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - [obj_start, obj_end) is the live object range (exclusive end), always within the allocation.
// - obj_start and obj_end are always aligned to alignof(T), even when empty.
// - custom_resource == nullptr implies use of lw::default_memory_resource.

namespace lw
{
/// Default memory resource used when allocation::custom_resource == nullptr.
/// A system allocator stored in the data segment, valid even during static initialization.
extern lw::memory_resource const* const default_memory_resource;
} // namespace lw

/// Polymorphic memory resource interface powering lw::allocation<T>.
/// Custom allocators (arenas, pools, counting or failure-injecting test resources) implement this interface.
/// This is a POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct lw::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size, which will be in [min_bytes, max_bytes].
    /// The allocated pointer is stored in `*out_ptr`.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// min_bytes > 0 always sets *out_ptr to non-null; failure is fatal.
    lw::function_ptr<isize(lw::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Attempt to allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size on success, or -1 on failure.
    /// The allocated pointer is stored in `*out_ptr` on success, or nullptr on failure.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// This is the entry point of the fallible allocation path: decoders never call allocate_bytes.
    lw::function_ptr<isize(lw::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> try_allocate_bytes
        = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    /// `bytes` is the size returned by the allocating call, not the requested size.
    lw::function_ptr<void(lw::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Attempt to resize an existing allocation in place without moving or freeing it.
    /// Returns the new size in [min_bytes, max_bytes] on success, -1 on failure.
    /// On failure, the allocation remains valid and unchanged at `p` with size `old_bytes`.
    /// Preconditions:
    ///   `p` was allocated from this resource with `old_bytes` and `alignment`.
    ///   `1 <= min_bytes <= max_bytes`.
    lw::function_ptr<isize(lw::byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata)>
        try_resize_bytes_in_place = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

/// Owning allocation handle for a contiguous byte block plus a typed "live window" inside it.
///
/// Invariants:
/// - [obj_start, obj_end) is the live object range; obj_end is exclusive.
/// - alloc_start <= obj_start <= obj_end <= alloc_end (even for empty ranges or empty allocations).
/// - obj_start and obj_end must be aligned to alignof(T) (even when the range is empty).
/// - resource == nullptr means the global default memory resource is used.
///
/// The destructor destroys exactly the live window and then returns the bytes.
/// lw::partial_init_guard<T> builds on this: it keeps the live window empty while filling the storage
/// and only commits the filled prefix once everything succeeded.
template <class T>
struct lw::allocation
{
    /// Pointer to the first live object.
    /// INVARIANT: Must always be aligned to alignof(T), even if the range is empty.
    T* obj_start = nullptr;

    /// Pointer one past the last live object (exclusive end).
    /// INVARIANT: Must always be aligned to alignof(T), even if the range is empty.
    T* obj_end = nullptr;

    /// Start of the owned byte allocation (base pointer returned by the memory resource).
    lw::byte* alloc_start = nullptr;

    /// End of the owned byte allocation (exclusive).
    lw::byte* alloc_end = nullptr;

    /// Alignment used when allocating [alloc_start, alloc_end), needed again for deallocation.
    isize alignment = 0;

    /// Memory resource that owns the allocation, or nullptr for the global default.
    /// Null means "use global fallback". This makes the all-zero state a valid empty allocation.
    lw::memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    /// Returns the effective resource to use for allocation operations.
    [[nodiscard]] lw::memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff this is a valid non-defaulted allocation
    /// Implies byte size > 0, i.e. alloc_start < alloc_end
    /// But obj_span might still be empty
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    /// Returns the span of live objects
    [[nodiscard]] lw::span<T> obj_span() const { return lw::span<T>(obj_start, obj_end); }

    /// Number of allocated bytes
    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }

    /// Attempt to resize the allocation in place to a size between min_bytes and max_bytes.
    /// Returns true if the resize succeeded, false otherwise.
    /// IMPORTANT: Cannot resize below the size needed by live objects (obj_end).
    [[nodiscard]] bool try_resize_alloc_inplace(isize min_bytes, isize max_bytes)
    {
        LW_ASSERT(min_bytes >= 0 && max_bytes >= min_bytes, "try_resize_alloc_inplace: invalid size range");

        isize const obj_end_bytes = (byte const*)obj_end - alloc_start;
        LW_ASSERT(min_bytes >= obj_end_bytes, "try_resize_alloc_inplace: cannot resize below live object range");

        if (alloc_start == nullptr || min_bytes == 0)
            return false;

        auto const old_bytes = alloc_end - alloc_start;
        auto const& res = resource();

        isize const new_bytes
            = res.try_resize_bytes_in_place(alloc_start, old_bytes, min_bytes, max_bytes, alignment, res.userdata);

        if (new_bytes == -1)
            return false;

        alloc_end = alloc_start + new_bytes;
        return true;
    }

    /// Resize the allocation to a size between min_bytes and max_bytes.
    /// Always tries to resize in-place first. If that fails, allocates a new buffer,
    /// moves the live objects over (keeping their byte offset), and replaces the current allocation.
    /// Allocation failure is fatal; see try_resize_alloc for the fallible version.
    void resize_alloc(isize min_bytes, isize max_bytes)
    {
        if (try_resize_alloc_inplace(min_bytes, max_bytes))
            return;

        auto const obj_offset = obj_start - (T*)alloc_start;
        auto new_alloc = allocation::create_empty_bytes(min_bytes, max_bytes, alignment_or_default(), custom_resource,
                                                        obj_offset);
        impl::move_create_objects_to(new_alloc.obj_end, obj_start, obj_end);
        *this = lw::move(new_alloc);
    }

    /// Fallible version of resize_alloc.
    /// On failure, the allocation and its live objects are untouched.
    [[nodiscard]] lw::result<void, lw::out_of_memory> try_resize_alloc(isize min_bytes,
                                                                       isize max_bytes,
                                                                       oom_source source = oom_source::reserve)
    {
        if (try_resize_alloc_inplace(min_bytes, max_bytes))
            return {};

        auto const obj_offset = obj_start - (T*)alloc_start;
        auto new_alloc = allocation::try_create_empty_bytes(min_bytes, max_bytes, alignment_or_default(),
                                                            custom_resource, obj_offset, source);
        if (new_alloc.has_error())
            return lw::error(new_alloc.error());

        auto& fresh = new_alloc.value();
        impl::move_create_objects_to(fresh.obj_end, obj_start, obj_end);
        *this = lw::move(fresh);
        return {};
    }

    // factories
public:
    /// Creates an empty allocation with reserved capacity but no live objects.
    ///
    /// Allocates between min_bytes and max_bytes with the specified alignment, but does not construct any objects.
    /// The result has obj_start == obj_end == alloc_start + obj_offset elements.
    /// min_bytes == 0 results in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_empty_bytes(isize min_bytes,
                                                       isize max_bytes, // NOLINT
                                                       isize alignment, // NOLINT
                                                       memory_resource const* resource,
                                                       isize obj_offset = 0)
    {
        LW_ASSERT(alignment >= isize(alignof(T)), "alignment must be at least alignof(T)");
        LW_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");
        LW_ASSERT(obj_offset * isize(sizeof(T)) <= min_bytes, "obj_offset would result in invalid allocation");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignment;

        auto const& res = resource ? *resource : *default_memory_resource;

        auto const actual_byte_size
            = res.allocate_bytes(&result.alloc_start, min_bytes, max_bytes, result.alignment, res.userdata);
        result.alloc_end = result.alloc_start + actual_byte_size;

        result.obj_start = (T*)result.alloc_start + obj_offset;
        result.obj_end = result.obj_start;

        return result;
    }

    /// Fallible version of create_empty_bytes.
    ///
    /// Goes through memory_resource::try_allocate_bytes; a -1 from the resource becomes
    /// out_of_memory{source, min_bytes}. No objects are constructed, so nothing needs cleanup on failure.
    [[nodiscard]] static lw::result<allocation, lw::out_of_memory> try_create_empty_bytes(isize min_bytes,
                                                                                        isize max_bytes, // NOLINT
                                                                                        isize alignment, // NOLINT
                                                                                        memory_resource const* resource,
                                                                                        isize obj_offset = 0,
                                                                                        oom_source source = oom_source::reserve)
    {
        LW_ASSERT(alignment >= isize(alignof(T)), "alignment must be at least alignof(T)");
        LW_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");
        LW_ASSERT(obj_offset * isize(sizeof(T)) <= min_bytes, "obj_offset would result in invalid allocation");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignment;

        auto const& res = resource ? *resource : *default_memory_resource;

        auto const actual_byte_size
            = res.try_allocate_bytes(&result.alloc_start, min_bytes, max_bytes, result.alignment, res.userdata);
        if (actual_byte_size < 0)
        {
            result.alloc_start = nullptr;
            return lw::error(lw::out_of_memory{.source = source, .requested_bytes = min_bytes});
        }
        result.alloc_end = result.alloc_start + actual_byte_size;

        result.obj_start = (T*)result.alloc_start + obj_offset;
        result.obj_end = result.obj_start;

        return result;
    }

    /// Creates an empty allocation with room for 'size' objects.
    /// size == 0 results in nullptr with no real allocation call.
    [[nodiscard]] static allocation create_empty(isize size, isize alignment, memory_resource const* resource) // NOLINT
    {
        auto const min_byte_size = size * isize(sizeof(T));
        return create_empty_bytes(min_byte_size, min_byte_size, alignment, resource);
    }

    /// Fallible version of create_empty.
    /// A size whose byte count overflows isize is reported as out_of_memory with requested_bytes == -1.
    [[nodiscard]] static lw::result<allocation, lw::out_of_memory> try_create_empty(isize size,
                                                                                  isize alignment, // NOLINT
                                                                                  memory_resource const* resource,
                                                                                  oom_source source = oom_source::reserve)
    {
        LW_ASSERT(size >= 0, "size must be non-negative");
        isize min_byte_size = 0;
        if (!lw::checked_mul(size, isize(sizeof(T)), min_byte_size))
            return lw::error(lw::out_of_memory{.source = source, .requested_bytes = -1});
        return try_create_empty_bytes(min_byte_size, min_byte_size, alignment, resource, 0, source);
    }

    /// Creates an allocation with a specified count of default-constructed objects.
    /// The result is a "tight" allocation: allocated bytes exactly match live object count.
    [[nodiscard]] static allocation create_defaulted(isize size, memory_resource const* resource)
    {
        auto result = allocation::create_empty(size, alignof(T), resource);
        impl::default_create_objects_to(result.obj_end, size);
        return result;
    }

    /// Creates an allocation with a specified count of objects, all copy-constructed from a single value.
    [[nodiscard]] static allocation create_filled(isize size, T const& value, memory_resource const* resource)
    {
        auto result = allocation::create_empty(size, alignof(T), resource);
        impl::fill_create_objects_to(result.obj_end, size, value);
        return result;
    }

    /// Creates a deep copy of a span of objects using the specified memory resource.
    [[nodiscard]] static allocation create_copy_of(span<T const> source, memory_resource const* resource)
    {
        auto result = allocation::create_empty(source.size(), alignof(T), resource);
        impl::copy_create_objects_to(result.obj_end, source.data(), source.data() + source.size());
        return result;
    }

    // lifecycle
public:
    allocation() = default;

    // no implicit copies for allocations
    // downstream containers need to handle this explicitly!
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(lw::exchange(rhs.obj_start, nullptr)),
        obj_end(lw::exchange(rhs.obj_end, nullptr)),
        alloc_start(lw::exchange(rhs.alloc_start, nullptr)),
        alloc_end(lw::exchange(rhs.alloc_end, nullptr)),
        alignment(lw::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    /// Move assignment operator with nested-rhs safety guarantee.
    ///
    /// Safe even when rhs is nested inside one of the objects being destroyed in 'this':
    /// 1. Move rhs into a local temporary (which clears rhs via move constructor)
    /// 2. Destroy objects in 'this' (safe even if this destroys rhs, since it's already cleared)
    /// 3. Transfer ownership from the temporary to 'this'
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto rhs_tmp = lw::move(rhs);

            impl::destroy_objects_in_reverse(obj_start, obj_end);
            if (alloc_start != nullptr)
            {
                auto const& res = resource();
                res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
            }

            obj_start = lw::exchange(rhs_tmp.obj_start, nullptr);
            obj_end = lw::exchange(rhs_tmp.obj_end, nullptr);
            alloc_start = lw::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = lw::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = lw::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource; // rhs resource stays
        }

        return *this;
    }

    ~allocation()
    {
        // end life and call dtor of live objects
        impl::destroy_objects_in_reverse(obj_start, obj_end);

        // return allocation
        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }

private:
    [[nodiscard]] isize alignment_or_default() const { return alignment > 0 ? alignment : isize(alignof(T)); }
};
