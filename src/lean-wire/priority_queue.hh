#pragma once

#include <lean-wire/vector.hh>

/// Binary max-heap over a contiguous lw::vector<T>.
///
/// top() is the greatest element under LessT; pop() removes it.
/// Iteration (begin/end) walks the internal heap array, which is NOT sorted.
/// Two queues holding the same multiset may iterate differently, so equality is not provided.
template <class T, class LessT>
struct lw::priority_queue
{
    // factories
public:
    [[nodiscard]] static lw::result<priority_queue, lw::out_of_memory> try_create_with_capacity(
        isize capacity, lw::memory_resource const* resource = nullptr)
    {
        auto heap = lw::vector<T>::try_create_with_capacity(capacity, resource);
        if (heap.has_error())
            return lw::error(heap.error());
        priority_queue q;
        q._heap = lw::move(heap.value());
        return q;
    }

    priority_queue() = default;

    // queries
public:
    [[nodiscard]] isize size() const { return _heap.size(); }
    [[nodiscard]] bool empty() const { return _heap.empty(); }
    [[nodiscard]] lw::memory_resource const* resource() const { return _heap.resource(); }

    /// internal heap order
    [[nodiscard]] T const* begin() const { return _heap.begin(); }
    [[nodiscard]] T const* end() const { return _heap.end(); }

    /// Greatest element. Precondition: !empty().
    [[nodiscard]] T const& top() const { return _heap.front(); }

    // modification
public:
    /// O(log n)
    template <class U = T>
    void push(U&& value)
    {
        _heap.emplace_back(lw::forward<U>(value));
        sift_up(_heap.size() - 1);
    }

    /// Removes and returns the greatest element. Precondition: !empty(). O(log n)
    [[nodiscard("use remove_top() if you don't need the return value")]] T pop()
    {
        LW_ASSERT(!_heap.empty(), "cannot pop from empty priority_queue");
        lw::swap(_heap.front(), _heap.back());
        auto value = _heap.pop_back();
        sift_down(0);
        return value;
    }

    void remove_top()
    {
        LW_ASSERT(!_heap.empty(), "cannot remove from empty priority_queue");
        lw::swap(_heap.front(), _heap.back());
        _heap.remove_back();
        sift_down(0);
    }

    void clear() { _heap.clear(); }

    [[nodiscard]] lw::result<void, lw::out_of_memory> try_reserve(isize count) { return _heap.try_reserve_back(count); }

private:
    void sift_up(isize idx)
    {
        while (idx > 0)
        {
            auto const parent = (idx - 1) / 2;
            if (!_less(_heap[parent], _heap[idx]))
                return;
            lw::swap(_heap[parent], _heap[idx]);
            idx = parent;
        }
    }

    void sift_down(isize idx)
    {
        auto const n = _heap.size();
        while (true)
        {
            auto largest = idx;
            auto const left = 2 * idx + 1;
            auto const right = left + 1;
            if (left < n && _less(_heap[largest], _heap[left]))
                largest = left;
            if (right < n && _less(_heap[largest], _heap[right]))
                largest = right;
            if (largest == idx)
                return;
            lw::swap(_heap[idx], _heap[largest]);
            idx = largest;
        }
    }

    lw::vector<T> _heap;
    [[no_unique_address]] LessT _less;
};
