#pragma once

#include <lean-wire/impl/allocating_container.hh>


/// Heap-allocated array of T with a size fixed at creation (no push/pop).
/// The decoded form of a "boxed slice": one allocation, exactly size() live objects.
/// Owns its memory through lw::allocation<T> and has deep-copy value semantics.
template <class T>
struct lw::array : private lw::allocating_container<T, array<T>>
{
    using base = lw::allocating_container<T, array<T>>;

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
    using base::empty;           // check if array is empty
    using base::resource;        // resource backing the storage
    using base::size;            // get number of elements
    using base::size_bytes;      // get total size in bytes

    // factories
public:
    using base::create_copy_of;         // create deep copy from span
    using base::create_defaulted;       // create with default-constructed elements
    using base::create_filled;          // create with copies of a value
    using base::create_from_allocation; // create from existing allocation

    // allocation management
public:
    using base::extract_allocation; // extract underlying allocation

    [[nodiscard]] friend bool operator==(array const& a, array const& b)
    {
        if (a.size() != b.size())
            return false;
        for (isize i = 0; i < a.size(); ++i)
            if (!(a[i] == b[i]))
                return false;
        return true;
    }

    // array has deep-copy value semantics
    array() = default;
    ~array() = default;
    array(array&&) = default;
    array& operator=(array&&) = default;
    array(array const&) = default;
    array& operator=(array const&) = default;

    friend base;
};
