#pragma once

#include <lean-wire/impl/allocating_container.hh>

#include <initializer_list>


/// Dynamically allocated vector of T elements with value semantics.
/// Similar to std::vector: grows at the back, owns its memory through lw::allocation<T>.
/// try_reserve_back is the fallible growth entry point used on all decode paths.
template <class T>
struct lw::vector : private lw::allocating_container<T, vector<T>>
{
    using base = lw::allocating_container<T, vector<T>>;

    // element access
public:
    using base::operator[]; // access element by index
    using base::back;       // access last element
    using base::data;       // get pointer to underlying storage
    using base::front;      // access first element

    // iterators
public:
    using base::begin; // get pointer to first element
    using base::end;   // get pointer to one past last element

    // queries
public:
    using base::empty;           // check if vector is empty
    using base::resource;        // resource backing the storage
    using base::size;            // get number of elements
    using base::size_bytes;      // get total size in bytes

    // capacity queries
public:
    using base::capacity_back;         // get available capacity at back
    using base::has_capacity_back_for; // check if capacity exists for N elements at back

    /// Elements that can be stored without reallocation.
    [[nodiscard]] constexpr isize capacity() const { return size() + capacity_back(); }

    /// Fallible reserve: room for `count` more elements, or out_of_memory{reserve}.
    using base::try_reserve_back;

    // factories
public:
    using base::create_copy_of;           // create deep copy from span
    using base::create_defaulted;         // create with default-constructed elements
    using base::create_filled;            // create with copies of a value
    using base::create_from_allocation;   // create from existing allocation
    using base::create_with_capacity;     // create with reserved capacity
    using base::try_create_with_capacity; // create with reserved capacity, fallible

    // allocation management
public:
    using base::extract_allocation; // extract underlying allocation

    // modifiers
public:
    using base::clear; // destroy all elements, size becomes 0

    using base::emplace_at;          // construct element at index, shifting the tail
    using base::emplace_back;        // construct element at back (with allocation if needed)
    using base::emplace_back_stable; // construct element at back (requires capacity)
    using base::push_back;           // add element at back (with allocation if needed)
    using base::push_back_stable;    // add element at back (requires capacity)

    using base::pop_back;    // remove and return last element
    using base::remove_at;   // remove element at index (preserves order)
    using base::remove_back; // remove last element (fast path, no return value)

    /// Vector of the listed values, using the default resource.
    vector(std::initializer_list<T> values)
    {
        if (values.size() > 0)
            *this = vector::create_copy_of(lw::span<T const>(values.begin(), values.end()));
    }

    [[nodiscard]] friend bool operator==(vector const& a, vector const& b)
    {
        if (a.size() != b.size())
            return false;
        for (isize i = 0; i < a.size(); ++i)
            if (!(a[i] == b[i]))
                return false;
        return true;
    }

    // vector has deep-copy value semantics
    vector() = default;
    ~vector() = default;
    vector(vector&&) = default;
    vector& operator=(vector&&) = default;
    vector(vector const&) = default;
    vector& operator=(vector const&) = default;

    friend base;
};
