#ifndef HOLE_LIST_HPP_INCLUDED
#define HOLE_LIST_HPP_INCLUDED

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <utility>
#include <vector>

/**
 * @brief Index-stable element storage with reusable holes.
 *
 * Removing an element leaves a hole instead of shifting the elements behind
 * it, so indices handed out by insert() stay valid for the lifetime of the
 * element. Holes are reused LIFO by later inserts, which is what lets undo
 * actions recreate an element at the index it had before removal.
 */
template<typename T>
class HoleList
{
public:
    using size_type = std::int32_t;

    /// @return The number of live elements.
    [[nodiscard]] size_type size() const noexcept
    {
        return m_size;
    }

    /// @return The slot count (live elements plus holes), i.e. the index range.
    [[nodiscard]] size_type capacity() const noexcept
    {
        return static_cast<size_type>(m_elements.size());
    }

    [[nodiscard]] T& operator[](int32_t index) noexcept
    {
        assert(index >= 0 && index < capacity());
        return m_elements[index];
    }

    [[nodiscard]] const T& operator[](int32_t index) const noexcept
    {
        assert(index >= 0 && index < capacity());
        return m_elements[index];
    }

    /// @return The slot the element was stored in.
    int32_t insert(T element)
    {
        int32_t index;
        if (m_freeIndices.empty())
        {
            index = capacity();
            m_elements.push_back(std::move(element));
        }
        else
        {
            index = m_freeIndices.back();
            m_freeIndices.pop_back();
            m_elements[index] = std::move(element);
        }

        ++m_size;
        m_dirty = true;
        return index;
    }

    /// Marks the slot as a hole. The element itself is left in place.
    void remove(int32_t index)
    {
        assert(index >= 0 && index < capacity());
        assert(std::find(m_freeIndices.begin(), m_freeIndices.end(), index) == m_freeIndices.end() &&
               "HoleList::remove called twice for the same slot");

        --m_size;
        m_freeIndices.push_back(index);
        m_dirty = true;
    }

    void clear() noexcept
    {
        m_elements.clear();
        m_freeIndices.clear();
        m_cachedValidIndices.clear();
        m_dirty = true;
        m_size  = 0;
    }

    /// @return All live indices in ascending order.
    [[nodiscard]] const std::vector<int32_t>& valid_indices() const
    {
        if (!m_dirty)
            return m_cachedValidIndices;

        std::vector<bool> occupied(m_elements.size(), true);
        for (int32_t idx : m_freeIndices)
            occupied[idx] = false;

        m_cachedValidIndices.clear();
        m_cachedValidIndices.reserve(m_size);
        for (int32_t i = 0; i < capacity(); ++i)
        {
            if (occupied[i])
                m_cachedValidIndices.push_back(i);
        }

        m_dirty = false;
        return m_cachedValidIndices;
    }

private:
    std::vector<T>               m_elements;
    std::vector<int32_t>         m_freeIndices;
    mutable std::vector<int32_t> m_cachedValidIndices;
    mutable bool                 m_dirty = true;
    size_type                    m_size  = 0;
};

#endif // HOLE_LIST_HPP_INCLUDED
