#include "allocation.hh"

#include <lean-wire/assertf.hh>
#include <lean-wire/macros.hh>
#include <lean-wire/utility.hh>

#include <cstdlib>

namespace
{
/// System memory resource functions.
/// The system allocator is stateless, so userdata is ignored throughout.

lw::byte* system_aligned_alloc(lw::isize bytes, lw::isize alignment)
{
#ifdef LW_OS_WINDOWS
    return static_cast<lw::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign instead of std::aligned_alloc to avoid the bytes % alignment == 0 requirement.
    // posix_memalign requires alignment >= sizeof(void*), so we clamp to that minimum.
    void* raw_ptr = nullptr;
    lw::isize const effective_alignment = alignment < lw::isize(sizeof(void*)) ? lw::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, effective_alignment, bytes);
    return result == 0 ? static_cast<lw::byte*>(raw_ptr) : nullptr;
#endif
}

lw::isize system_allocate_bytes(lw::byte** out_ptr, lw::isize min_bytes, lw::isize max_bytes, lw::isize alignment, void* userdata)
{
    LW_UNUSED(userdata);
    LW_UNUSED(max_bytes);

    LW_ASSERT(alignment > 0 && lw::is_power_of_two(alignment), "alignment must be a power of 2");
    LW_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    // min_bytes == 0 never allocates
    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    *out_ptr = system_aligned_alloc(min_bytes, alignment);
    LW_ASSERTF_ALWAYS(*out_ptr != nullptr, "allocation failed: requested {} bytes with alignment {}", min_bytes, alignment);
    return min_bytes;
}

lw::isize system_try_allocate_bytes(lw::byte** out_ptr, lw::isize min_bytes, lw::isize max_bytes, lw::isize alignment, void* userdata)
{
    LW_UNUSED(userdata);
    LW_UNUSED(max_bytes);

    LW_ASSERT(alignment > 0 && lw::is_power_of_two(alignment), "alignment must be a power of 2");
    LW_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    *out_ptr = system_aligned_alloc(min_bytes, alignment);
    return *out_ptr != nullptr ? min_bytes : -1;
}

void system_deallocate_bytes(lw::byte* p, lw::isize bytes, lw::isize alignment, void* userdata)
{
    LW_UNUSED(bytes);
    LW_UNUSED(alignment);
    LW_UNUSED(userdata);

    // _aligned_malloc requires _aligned_free, posix_memalign pairs with std::free
#ifdef LW_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

lw::isize system_try_resize_bytes_in_place(lw::byte* p,
                                           lw::isize old_bytes,
                                           lw::isize min_bytes,
                                           lw::isize max_bytes,
                                           lw::isize alignment,
                                           void* userdata)
{
    LW_UNUSED(userdata);

    LW_ASSERT(p != nullptr, "cannot resize null pointer");
    LW_ASSERT(alignment > 0 && lw::is_power_of_two(alignment), "alignment must be a power of 2");
    LW_ASSERT(old_bytes > 0, "old_bytes must be positive");
    LW_ASSERT(1 <= min_bytes && min_bytes <= max_bytes, "must have 1 <= min_bytes <= max_bytes");

    LW_UNUSED(p);
    LW_UNUSED(old_bytes);
    LW_UNUSED(min_bytes);
    LW_UNUSED(max_bytes);
    LW_UNUSED(alignment);

    // malloc-style allocators cannot grow in place.
    // Moving the block here (like realloc) would invalidate pointers into it, e.g. vec.push_back(vec[0]).
    return -1;
}

/// Lives in the data segment so it is usable during static initialization.
constinit lw::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .try_resize_bytes_in_place = system_try_resize_bytes_in_place,
    .userdata = nullptr,
};

} // namespace

constinit lw::memory_resource const* const lw::default_memory_resource = &system_memory_resource;
