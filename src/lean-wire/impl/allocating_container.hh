#pragma once

#include <lean-wire/allocation.hh>
#include <lean-wire/errors.hh>
#include <lean-wire/result.hh>

#include <new>


/// Mixin implementing the common "contiguous container over lw::allocation<T>" surface area.
///
/// CRTP-style helper: concrete containers privately inherit it as
/// `lw::allocating_container<T, Derived>`, then selectively re-expose members via `using`.
///
///     template<class T>
///     struct lw::array : private lw::allocating_container<T, array<T>> {
///         using base = lw::allocating_container<T, array<T>>;
///         using base::operator[];
///         using base::begin; using base::end;
///         // ... array-specific policies / ctors ...
///         friend base;
///     };
///
/// The mixin owns the sharp parts (indexing, growth, object lifetime, allocation-aware factories),
/// the concrete container owns the policy (which ends may grow, whether copies are allowed).
///
/// Capacity is directional (`capacity_front` / `capacity_back`): a vector only grows at the back,
/// a devector grows at both ends.
///
/// Member functions with the `_stable` suffix never reallocate and never move live objects.
/// They assert that the capacity is already there.
///
/// Growth comes in two flavors:
/// - emplace_back / emplace_front / push_*: allocation failure is fatal (memory_resource::allocate_bytes).
/// - try_reserve_back / try_create_with_capacity: allocation failure is reported as lw::out_of_memory.
///   Everything sized by decoded input goes through these.
///
/// === Exception & reference guarantees ===
///
/// Allocation failures leave the container unchanged.
/// Element construction failures leave size and live range unchanged.
/// Reallocation always uses move construction (no copy fallback).
/// The old allocation stays valid until the new element is constructed,
/// so `v.emplace_back(v[0])` is safe during growth.
/// Any reallocation invalidates pointers, references, and iterators.
template <class T, class ContainerT>
struct lw::allocating_container
{
    using container_t = ContainerT;

    /// Minimum alignment used for heap allocations of this container.
    /// At least one destructive-interference unit, so two containers never share a cache line.
    static constexpr isize alloc_alignment = lw::max(isize(alignof(T)), isize(std::hardware_destructive_interference_size));

    /// Maximum extra slack allowed when growing an allocation (one OS page).
    static constexpr isize alloc_max_slack = 4096;

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        auto const p_obj = _data.obj_start + i;
        LW_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");
        return *p_obj;
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        auto const p_obj = _data.obj_start + i;
        LW_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");
        return *p_obj;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        LW_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *_data.obj_start;
    }
    [[nodiscard]] constexpr T const& front() const
    {
        LW_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *_data.obj_start;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        LW_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *(_data.obj_end - 1);
    }
    [[nodiscard]] constexpr T const& back() const
    {
        LW_ASSERT(_data.obj_start < _data.obj_end, "container is empty");
        return *(_data.obj_end - 1);
    }

    /// May be nullptr for default-constructed containers.
    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data.obj_start; }
    [[nodiscard]] constexpr T* end() { return _data.obj_end; }
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr isize size_bytes() const { return size() * isize(sizeof(T)); }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_start == _data.obj_end; }

    /// The resource this container allocates from (nullptr means the global default).
    [[nodiscard]] constexpr lw::memory_resource const* resource() const { return _data.custom_resource; }

    /// How many elements fit in front of obj_start without reallocation.
    [[nodiscard]] constexpr isize capacity_front() const
    {
        // nullptr - nullptr == 0, so the empty state is well-defined
        auto const front_bytes = (lw::byte const*)_data.obj_start - _data.alloc_start;
        return front_bytes / isize(sizeof(T));
    }

    /// How many elements fit behind obj_end without reallocation.
    [[nodiscard]] constexpr isize capacity_back() const
    {
        auto const back_bytes = _data.alloc_end - (lw::byte const*)_data.obj_end;
        return back_bytes / isize(sizeof(T));
    }

    [[nodiscard]] constexpr bool has_capacity_front_for(isize count) const { return capacity_front() >= count; }
    [[nodiscard]] constexpr bool has_capacity_back_for(isize count) const { return capacity_back() >= count; }

    // resizing
public:
    /// Next allocation size when growing: doubling for amortized O(1), rounded to alloc_alignment.
    [[nodiscard]] static constexpr isize alloc_grow_size_for(isize curr_size, isize min_size)
    {
        return lw::align_up(lw::max(curr_size << 1, min_size), alloc_alignment);
    }

    /// Destroys all live objects, keeps the allocation and obj_start.
    constexpr void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    /// Makes room for at least `count` more elements at the back, reporting allocation failure.
    /// On success has_capacity_back_for(count) holds and no element was touched if no reallocation happened.
    /// On failure the container is unchanged.
    /// Unlike emplace_back growth, the request is exact (no doubling): the caller knows the final size.
    [[nodiscard]] lw::result<void, lw::out_of_memory> try_reserve_back(isize count)
    {
        LW_ASSERT(count >= 0, "try_reserve_back: count must be non-negative");
        if (has_capacity_back_for(count))
            return {};

        // bytes in front of obj_end stay where they are
        isize const used_bytes = (lw::byte const*)_data.obj_end - _data.alloc_start;
        isize extra_bytes = 0;
        isize min_bytes = 0;
        if (!lw::checked_mul(count, isize(sizeof(T)), extra_bytes) || !lw::checked_add(used_bytes, extra_bytes, min_bytes)
            || min_bytes > std::numeric_limits<isize>::max() - alloc_alignment)
            return lw::error(lw::out_of_memory{.source = oom_source::reserve, .requested_bytes = -1});

        min_bytes = lw::align_up(min_bytes, alloc_alignment);
        if (_data.alloc_start == nullptr)
            _data.alignment = alloc_alignment;
        return _data.try_resize_alloc(min_bytes, min_bytes, oom_source::reserve);
    }

    // appends
public:
    /// Constructs a new element at the back using existing capacity.
    /// Requires has_capacity_back_for(1). Never allocates, never invalidates.
    template <class... Args>
    constexpr T& emplace_back_stable(Args&&... args)
    {
        static_assert(
            requires { T(lw::forward<Args>(args)...); }, "emplace_back_stable: T is not constructible from "
                                                         "the provided argument types");
        LW_ASSERT(has_capacity_back_for(1), "not enough capacity for emplace_back_stable");
        auto const p = new (lw::placement_new, _data.obj_end) T(lw::forward<Args>(args)...);
        _data.obj_end++; // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }

    constexpr T& push_back_stable(T const& value) { return emplace_back_stable(value); }
    constexpr T& push_back_stable(T&& value) { return emplace_back_stable(lw::move(value)); }

    /// Constructs a new element at the front using existing capacity.
    /// Requires has_capacity_front_for(1). Never allocates, never invalidates.
    template <class... Args>
    constexpr T& emplace_front_stable(Args&&... args)
    {
        static_assert(
            requires { T(lw::forward<Args>(args)...); }, "emplace_front_stable: T is not constructible from "
                                                         "the provided argument types");
        LW_ASSERT(has_capacity_front_for(1), "not enough capacity for emplace_front_stable");
        auto const p = new (lw::placement_new, _data.obj_start - 1) T(lw::forward<Args>(args)...);
        _data.obj_start--; // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }

    /// Growth half of emplace_back, only called from the [[unlikely]] branch.
    /// Returns where the caller constructs the new element: &_data.obj_end after an in-place resize,
    /// or &new_allocation.obj_end after a fresh allocation. The new allocation's live window starts
    /// right behind where the old elements will go, so a throwing T(...) only cleans up the new block.
    ///
    ///   allocation<T> new_allocation;
    ///   auto p_obj_end = &_data.obj_end;
    ///   if (!has_capacity_back_for(1)) [[unlikely]]
    ///       p_obj_end = ensure_capacity_back_begin(new_allocation, 1);
    ///   new (lw::placement_new, *p_obj_end) T(...);
    ///   (*p_obj_end)++;
    ///   if (new_allocation.is_valid()) [[unlikely]]
    ///       ensure_capacity_back_finalize(new_allocation);
    LW_COLD_FUNC [[nodiscard]] constexpr T** ensure_capacity_back_begin(allocation<T>& new_allocation, isize count)
    {
        LW_ASSERT(!has_capacity_back_for(count), "only call this if we don't have enough capacity");

        auto const new_size_request_min
            = alloc_grow_size_for(_data.alloc_size_bytes(), _data.alloc_size_bytes() + isize(sizeof(T)) * count);
        auto const new_size_request_max = new_size_request_min + lw::min(new_size_request_min, alloc_max_slack);

        if (_data.try_resize_alloc_inplace(new_size_request_min, new_size_request_max))
            return &_data.obj_end;

        new_allocation = lw::allocation<T>::create_empty_bytes(new_size_request_min, new_size_request_max,
                                                               alloc_alignment, _data.custom_resource);
        new_allocation.obj_start = new_allocation.obj_start + capacity_front() + size();
        new_allocation.obj_end = new_allocation.obj_start;
        return &new_allocation.obj_end;
    }

    /// Moves the old elements in front of the newly constructed ones and adopts new_allocation.
    LW_COLD_FUNC constexpr void ensure_capacity_back_finalize(allocation<T>& new_allocation)
    {
        LW_ASSERT(new_allocation.is_valid(), "only call this when we have a temporary alloc");

        // reverse order: if a move throws, new_allocation still holds one contiguous live range
        impl::move_create_objects_to_reverse(new_allocation.obj_start, _data.obj_start, _data.obj_end);
        _data = lw::move(new_allocation);
    }

    /// Appends a new element, growing if necessary. Amortized O(1).
    template <class... Args>
    constexpr T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(lw::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                         "the provided argument types");

        allocation<T> new_allocation;
        auto p_obj_end = &_data.obj_end;

        if (!has_capacity_back_for(1)) [[unlikely]]
            p_obj_end = ensure_capacity_back_begin(new_allocation, 1);

        auto const p = new (lw::placement_new, *p_obj_end) T(lw::forward<Args>(args)...);
        (*p_obj_end)++; // _after_ so exceptions in T(...) leave state valid

        if (new_allocation.is_valid()) [[unlikely]]
            ensure_capacity_back_finalize(new_allocation);

        return *p;
    }

    constexpr T& push_back(T const& value) { return emplace_back(value); }
    constexpr T& push_back(T&& value) { return emplace_back(lw::move(value)); }

    /// Prepends a new element, growing if necessary. Amortized O(1).
    /// A fresh allocation re-centers the live range so both ends get headroom.
    template <class... Args>
    constexpr T& emplace_front(Args&&... args)
    {
        static_assert(
            requires { T(lw::forward<Args>(args)...); }, "emplace_front: T is not constructible from "
                                                         "the provided argument types");

        if (has_capacity_front_for(1)) [[likely]]
            return emplace_front_stable(lw::forward<Args>(args)...);

        auto const new_size_bytes
            = alloc_grow_size_for(_data.alloc_size_bytes(), _data.alloc_size_bytes() + isize(sizeof(T)));
        auto const new_slots = new_size_bytes / isize(sizeof(T));
        auto const front_slots = lw::max((new_slots - size()) / 2, isize(1));

        auto new_allocation = lw::allocation<T>::create_empty_bytes(new_size_bytes, new_size_bytes, alloc_alignment,
                                                                    _data.custom_resource, front_slots);

        // construct first: the old elements may be referenced by args
        auto const p = new (lw::placement_new, new_allocation.obj_start - 1) T(lw::forward<Args>(args)...);
        new_allocation.obj_start--;

        impl::move_create_objects_to(new_allocation.obj_end, _data.obj_start, _data.obj_end);
        _data = lw::move(new_allocation);
        return *p;
    }

    constexpr T& push_front(T const& value) { return emplace_front(value); }
    constexpr T& push_front(T&& value) { return emplace_front(lw::move(value)); }

    /// Constructs a new element at index idx, shifting [idx, size()) up by one. O(n).
    /// Precondition: 0 <= idx <= size().
    template <class... Args>
    constexpr T& emplace_at(isize idx, Args&&... args)
    {
        LW_ASSERT(0 <= idx && idx <= size(), "emplace_at: index out of bounds");
        emplace_back(lw::forward<Args>(args)...);
        auto const p_obj = _data.obj_start + idx;
        impl::rotate_last_to(p_obj, _data.obj_end - 1);
        return *p_obj;
    }

    // removals
public:
    /// Precondition: !empty().
    [[nodiscard("use remove_back() if you don't need the return value")]] constexpr T pop_back()
    {
        LW_ASSERT(_data.obj_start < _data.obj_end, "cannot pop from empty container");
        auto value = lw::move(*(_data.obj_end - 1));
        (_data.obj_end - 1)->~T();
        _data.obj_end--;
        return value;
    }

    /// Precondition: !empty().
    [[nodiscard("use remove_front() if you don't need the return value")]] constexpr T pop_front()
    {
        LW_ASSERT(_data.obj_start < _data.obj_end, "cannot pop from empty container");
        auto value = lw::move(*_data.obj_start);
        _data.obj_start->~T();
        _data.obj_start++;
        return value;
    }

    constexpr void remove_back()
    {
        LW_ASSERT(_data.obj_start < _data.obj_end, "cannot remove from empty container");
        _data.obj_end--;
        _data.obj_end->~T();
    }

    constexpr void remove_front()
    {
        LW_ASSERT(_data.obj_start < _data.obj_end, "cannot remove from empty container");
        _data.obj_start->~T();
        _data.obj_start++;
    }

    /// Removes the element at idx, preserving order. O(n).
    constexpr void remove_at(isize idx)
    {
        auto const p_obj = _data.obj_start + idx;
        LW_ASSERT(_data.obj_start <= p_obj && p_obj < _data.obj_end, "index out of bounds");

        impl::shift_objects_down_over(p_obj, _data.obj_end);

        // the last slot now holds a moved-from object
        _data.obj_end--;
        _data.obj_end->~T();
    }

    // ctors / allocation
public:
    /// Adopts the live objects of an allocation as the container contents.
    [[nodiscard]] static container_t create_from_allocation(lw::allocation<T> data)
    {
        container_t c;
        c._data = lw::move(data);
        return c;
    }

    /// "size" many value-initialized elements
    [[nodiscard]] static container_t create_defaulted(isize size, lw::memory_resource const* resource = nullptr)
    {
        auto const byte_size = lw::align_up(size * isize(sizeof(T)), alloc_alignment);
        auto result = lw::allocation<T>::create_empty_bytes(byte_size, byte_size, alloc_alignment, resource);
        impl::default_create_objects_to(result.obj_end, size);
        return container_t::create_from_allocation(lw::move(result));
    }

    /// "size" many copies of "value"
    [[nodiscard]] static container_t create_filled(isize size, T const& value, lw::memory_resource const* resource = nullptr)
    {
        auto const byte_size = lw::align_up(size * isize(sizeof(T)), alloc_alignment);
        auto result = lw::allocation<T>::create_empty_bytes(byte_size, byte_size, alloc_alignment, resource);
        impl::fill_create_objects_to(result.obj_end, size, value);
        return container_t::create_from_allocation(lw::move(result));
    }

    /// Deep copy of the span
    [[nodiscard]] static container_t create_copy_of(lw::span<T const> source, lw::memory_resource const* resource = nullptr)
    {
        auto const byte_size = lw::align_up(source.size() * isize(sizeof(T)), alloc_alignment);
        auto result = lw::allocation<T>::create_empty_bytes(byte_size, byte_size, alloc_alignment, resource);
        impl::copy_create_objects_to(result.obj_end, source.data(), source.data() + source.size());
        return container_t::create_from_allocation(lw::move(result));
    }

    /// Empty container with room for at least "capacity" elements at the back.
    [[nodiscard]] static container_t create_with_capacity(isize capacity, lw::memory_resource const* resource = nullptr)
    {
        auto const byte_size = lw::align_up(capacity * isize(sizeof(T)), alloc_alignment);
        return container_t::create_from_allocation(
            lw::allocation<T>::create_empty_bytes(byte_size, byte_size, alloc_alignment, resource));
    }

    /// Fallible create_with_capacity. The capacity may come from untrusted input.
    [[nodiscard]] static lw::result<container_t, lw::out_of_memory> try_create_with_capacity(
        isize capacity, lw::memory_resource const* resource = nullptr, oom_source source = oom_source::reserve)
    {
        container_t c;
        c._data.custom_resource = resource;
        auto res = c.try_reserve_back(capacity);
        if (res.has_error())
            return lw::error(lw::out_of_memory{.source = source, .requested_bytes = res.error().requested_bytes});
        return c;
    }

    allocating_container() = default;
    ~allocating_container() = default;

    allocating_container(allocating_container&&) = default;
    allocating_container& operator=(allocating_container&&) = default;

    // deep copy semantics
    // containers that use this mix-in can simply delete their copy ctor if they do not want it
    allocating_container(allocating_container const& rhs)
    {
        auto const byte_size = lw::align_up(rhs.size() * isize(sizeof(T)), alloc_alignment);
        _data = lw::allocation<T>::create_empty_bytes(byte_size, byte_size, alloc_alignment, rhs._data.custom_resource);
        lw::impl::copy_create_objects_to(_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
    }
    allocating_container& operator=(allocating_container const& rhs)
    {
        if (this != &rhs)
        {
            auto const byte_size = lw::align_up(rhs.size() * isize(sizeof(T)), alloc_alignment);
            auto new_data = lw::allocation<T>::create_empty_bytes(byte_size, byte_size, alloc_alignment,
                                                                  _data.custom_resource); // keep lhs resource
            lw::impl::copy_create_objects_to(new_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
            _data = lw::move(new_data);
        }
        return *this;
    }

    /// Hands out the underlying allocation, leaving the container empty (resource is kept).
    lw::allocation<T> extract_allocation() { return lw::move(_data); }

private:
    lw::allocation<T> _data;
};
