#pragma once

#include <lean-wire/impl/allocating_container.hh>


/// Double-ended vector: amortized O(1) push and pop at both ends, contiguous storage.
/// The live range floats inside the allocation; growing at the front re-centers it.
/// This is the double-ended queue shape of the codec (wire order == front to back).
template <class T>
struct lw::devector : private lw::allocating_container<T, devector<T>>
{
    using base = lw::allocating_container<T, devector<T>>;

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
    using base::empty;           // check if devector is empty
    using base::resource;        // resource backing the storage
    using base::size;            // get number of elements
    using base::size_bytes;      // get total size in bytes

    // capacity queries
public:
    using base::capacity_back;          // get available capacity at back
    using base::capacity_front;         // get available capacity at front
    using base::has_capacity_back_for;  // check if capacity exists for N elements at back
    using base::has_capacity_front_for; // check if capacity exists for N elements at front
    using base::try_reserve_back;       // fallible reserve at the back

    // factories
public:
    using base::create_copy_of;           // create deep copy from span
    using base::create_from_allocation;   // create from existing allocation
    using base::create_with_capacity;     // create with reserved capacity
    using base::try_create_with_capacity; // create with reserved capacity, fallible

    // modifiers
public:
    using base::clear; // destroy all elements, size becomes 0

    using base::emplace_back;  // construct element at back
    using base::emplace_front; // construct element at front
    using base::push_back;     // add element at back
    using base::push_front;    // add element at front

    using base::pop_back;     // remove and return last element
    using base::pop_front;    // remove and return first element
    using base::remove_back;  // remove last element
    using base::remove_front; // remove first element

    [[nodiscard]] friend bool operator==(devector const& a, devector const& b)
    {
        if (a.size() != b.size())
            return false;
        for (isize i = 0; i < a.size(); ++i)
            if (!(a[i] == b[i]))
                return false;
        return true;
    }

    devector() = default;
    ~devector() = default;
    devector(devector&&) = default;
    devector& operator=(devector&&) = default;
    devector(devector const&) = default;
    devector& operator=(devector const&) = default;

    friend base;
};
