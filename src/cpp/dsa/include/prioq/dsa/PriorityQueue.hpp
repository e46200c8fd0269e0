/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <source_location>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace prioq::dsa
{

//-------------------------------------------------------------------------

/**
 * Array-backed binary heap ordered by a stored predicate.
 *
 * isOrdered(a, b) returns true if a may appear before b, e.g. `a <= b` for a min-heap.
 * No element is ever stored below an element it is strictly ordered before, so first()
 * is O(1) and push()/pop()/removeAt() are O(log n).
 *
 * Elements that compare equal under the predicate leave the queue in unspecified
 * relative order; insertion order is not preserved.
 */
template<typename T, typename Container = std::vector<T>>
class PriorityQueue
{
public:
    static_assert(std::same_as<T, typename Container::value_type>);

    using value_type = T;
    using ContainerType = Container;
    using IsOrderedOp = std::function<bool(const T&, const T&)>;

    PriorityQueue() requires std::totally_ordered<T>
        : PriorityQueue(IsOrderedOp{minComparator})
    {}

    PriorityQueue(std::initializer_list<T> items) requires std::totally_ordered<T>
        : PriorityQueue(IsOrderedOp{minComparator}, items)
    {}

    explicit PriorityQueue(IsOrderedOp isOrdered)
        : m_isOrdered{std::move(isOrdered)}
    {
        if (!m_isOrdered) {
            throw std::invalid_argument{fmt::format(
                "{}: ordering predicate must be callable",
                std::source_location::current().function_name())};
        }
    }

    PriorityQueue(IsOrderedOp isOrdered, std::initializer_list<T> items)
        : PriorityQueue(std::move(isOrdered))
    {
        for (const auto& item : items) {
            push(item);
        }
    }

    template<std::ranges::input_range R>
    requires std::constructible_from<T, std::ranges::range_reference_t<R>>
    PriorityQueue(IsOrderedOp isOrdered, R&& items)
        : PriorityQueue(std::move(isOrdered))
    {
        for (auto&& item : items) {
            emplace(std::forward<decltype(item)>(item));
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_heap.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_heap.empty(); }

    [[nodiscard]] std::optional<T> first() const
    {
        if (m_heap.empty()) return {};
        return m_heap.front();
    }

    void push(T item)
    {
        m_heap.push_back(std::move(item));
        siftUp(m_heap.size() - 1);
    }

    template<typename... Args>
    void emplace(Args&&... args)
    {
        m_heap.emplace_back(std::forward<Args>(args)...);
        siftUp(m_heap.size() - 1);
    }

    std::optional<T> pop()
    {
        if (m_heap.empty()) return {};

        std::optional<T> res{std::move(m_heap.front())};
        if (m_heap.size() > 1) {
            m_heap.front() = std::move(m_heap.back());
        }
        m_heap.pop_back();
        if (!m_heap.empty()) {
            siftDown(0);
        }
        return res;
    }

    /**
     * Removes the element stored at position `index` of underlying().
     *
     * The last element takes the vacated slot and is first sifted toward the leaves, then
     * toward the root; at most one of the two passes moves it.
     */
    std::optional<T> removeAt(std::size_t index)
    {
        if (index >= m_heap.size()) return {};

        const auto last = m_heap.size() - 1;
        if (index != last) {
            using std::swap;
            swap(m_heap[index], m_heap[last]);
        }

        std::optional<T> res{std::move(m_heap.back())};
        m_heap.pop_back();

        if (index != last) {
            siftDown(index);
            siftUp(index);
        }
        return res;
    }

    /**
     * Removes the element at `index` and pushes `value` in its place.
     *
     * If `index` is out of range nothing is removed and `value` is discarded.
     */
    std::optional<T> replaceAt(std::size_t index, T value)
    {
        auto res = removeAt(index);
        if (res) {
            push(std::move(value));
        }
        return res;
    }

    std::optional<T> replaceFirst(T value) { return replaceAt(0, std::move(value)); }

    void clear() noexcept { m_heap.clear(); }

    [[nodiscard]] bool contains(const T& value) const requires std::equality_comparable<T>
    {
        return std::ranges::find(m_heap, value) != std::ranges::end(m_heap);
    }

    // Pops every element in order, handing each to `visit`. Leaves the queue empty.
    template<std::invocable<T> F>
    void drain(F&& visit)
    {
        while (auto item = pop()) {
            std::invoke(visit, std::move(*item));
        }
    }

    [[nodiscard]] bool satisfiesHeapProperty() const
    {
        for (std::size_t pos = 1; pos < m_heap.size(); ++pos) {
            if (strictlyBefore(pos, parentOf(pos))) return false;
        }
        return true;
    }

    [[nodiscard]] const Container& underlying() const noexcept { return m_heap; }
    [[nodiscard]] const IsOrderedOp& isOrdered() const noexcept { return m_isOrdered; }

    [[nodiscard]] static bool minComparator(const T& lhs, const T& rhs)
        requires std::totally_ordered<T>
    {
        return lhs <= rhs;
    }

    [[nodiscard]] static bool maxComparator(const T& lhs, const T& rhs)
        requires std::totally_ordered<T>
    {
        return lhs >= rhs;
    }

    [[nodiscard]] static PriorityQueue minOrdering(std::initializer_list<T> items = {})
        requires std::totally_ordered<T>
    {
        return PriorityQueue(IsOrderedOp{minComparator}, items);
    }

    template<std::ranges::input_range R>
    [[nodiscard]] static PriorityQueue minOrdering(R&& items)
        requires std::totally_ordered<T>
    {
        return PriorityQueue(IsOrderedOp{minComparator}, std::forward<R>(items));
    }

    [[nodiscard]] static PriorityQueue maxOrdering(std::initializer_list<T> items = {})
        requires std::totally_ordered<T>
    {
        return PriorityQueue(IsOrderedOp{maxComparator}, items);
    }

    template<std::ranges::input_range R>
    [[nodiscard]] static PriorityQueue maxOrdering(R&& items)
        requires std::totally_ordered<T>
    {
        return PriorityQueue(IsOrderedOp{maxComparator}, std::forward<R>(items));
    }

private:
    [[nodiscard]] static constexpr std::size_t parentOf(std::size_t pos) noexcept
    {
        return (pos - 1) / 2;
    }

    [[nodiscard]] bool strictlyBefore(std::size_t lhs, std::size_t rhs) const
    {
        return m_isOrdered(m_heap[lhs], m_heap[rhs]) && !m_isOrdered(m_heap[rhs], m_heap[lhs]);
    }

    void siftUp(std::size_t pos)
    {
        using std::swap;
        while (pos > 0) {
            const auto parent = parentOf(pos);
            if (m_isOrdered(m_heap[parent], m_heap[pos])) break;
            swap(m_heap[parent], m_heap[pos]);
            pos = parent;
        }
    }

    void siftDown(std::size_t pos)
    {
        using std::swap;
        const auto count = m_heap.size();
        while (true) {
            const auto left = 2 * pos + 1;
            const auto right = left + 1;
            auto best = pos;
            if (left < count && !m_isOrdered(m_heap[best], m_heap[left])) {
                best = left;
            }
            if (right < count && !m_isOrdered(m_heap[best], m_heap[right])) {
                best = right;
            }
            if (best == pos) break;
            swap(m_heap[pos], m_heap[best]);
            pos = best;
        }
    }

    IsOrderedOp m_isOrdered;
    Container m_heap;
};

//-------------------------------------------------------------------------

}  // namespace prioq::dsa

//-------------------------------------------------------------------------
