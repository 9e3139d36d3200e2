#pragma once

#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <span>

namespace un
{
    using sizeType = int32_t;

    /**
     * @brief Small-buffer-optimized list used for polygon corners and adjacency.
     *
     * Elements live in an inline array of N slots. Growing past N moves the
     * contents to a heap buffer; shrinking to N or less (clear/pop_back) moves
     * them back inline.
     *
     * @tparam T element type (trivially copyable in practice: indices, pairs)
     * @tparam N inline capacity
     */
    template<class T, sizeType N>
    class small_list
    {
    public:
        typedef T           value_type;
        typedef T&          reference;
        typedef const T&    const_reference;
        typedef T*          pointer;
        typedef const T*    const_pointer;
        typedef sizeType    size_type;
        typedef T*          iterator;
        typedef const T*    const_iterator;

        small_list() : m_fixed{}, m_ptr(m_fixed), m_size(0), m_capacity(N)
        {
        }

        small_list(const small_list& other) : m_fixed{}, m_ptr(m_fixed), m_size(0), m_capacity(N)
        {
            assign(other.begin(), other.end());
        }

        small_list(std::initializer_list<T> init) : m_fixed{}, m_ptr(m_fixed), m_size(0), m_capacity(N)
        {
            assign(init.begin(), init.end());
        }

        ~small_list()
        {
            if (dynamic())
                delete[] m_ptr;
        }

        small_list& operator=(const small_list& other)
        {
            if (this != &other)
                assign(other.begin(), other.end());
            return *this;
        }

        /// @brief Read-only view over the elements.
        constexpr operator std::span<const T>() const noexcept
        {
            return std::span<const T>(m_ptr, static_cast<std::size_t>(m_size));
        }

        /// @brief Replaces the contents with [first, last).
        template<class InputIt>
        void assign(InputIt first, InputIt last)
        {
            clear();
            for (; first != last; ++first)
                push_back(*first);
        }

        void push_back(const_reference val)
        {
            if (m_size == m_capacity)
                grow(m_capacity > 0 ? m_capacity * 2 : 1);

            m_ptr[m_size++] = val;
        }

        void pop_back()
        {
            assert(m_size > 0 && "pop_back on empty small_list");
            --m_size;

            if (dynamic() && m_size <= N)
                shrink_inline();
        }

        /// @brief Removes the element at pos, keeping the order of the rest.
        void erase(const_iterator pos)
        {
            assert(!empty() && "Can't remove elements from an empty container!");
            const size_type index = static_cast<size_type>(pos - m_ptr);
            assert(index >= 0 && index < m_size);

            for (size_type i = index + 1; i < m_size; ++i)
                m_ptr[i - 1] = m_ptr[i];

            pop_back();
        }

        void clear()
        {
            if (dynamic())
            {
                delete[] m_ptr;
                m_ptr      = m_fixed;
                m_capacity = N;
            }
            m_size = 0;
        }

        void reserve(size_type new_cap)
        {
            if (new_cap > m_capacity)
                grow(new_cap);
        }

        /// @return The index of the first element equal to val, or -1.
        [[nodiscard]] int find_index(const_reference val) const
        {
            for (size_type i = 0; i < m_size; ++i)
            {
                if (m_ptr[i] == val)
                    return static_cast<int>(i);
            }
            return -1;
        }

        [[nodiscard]] bool contains(const_reference val) const
        {
            return find_index(val) != -1;
        }

        /// Appends val unless it is already present.
        /// @return True if val was appended.
        bool insert_unique(const_reference val)
        {
            if (contains(val))
                return false;

            push_back(val);
            return true;
        }

        /// Removes the first element equal to val.
        /// @return True if an element was removed.
        bool erase_element(const_reference val)
        {
            const int index = find_index(val);
            if (index < 0)
                return false;

            erase(m_ptr + index);
            return true;
        }

        [[nodiscard]] bool empty() const
        {
            return m_size == 0;
        }

        [[nodiscard]] size_type size() const
        {
            return m_size;
        }

        [[nodiscard]] size_type capacity() const
        {
            return m_capacity;
        }

        reference front()
        {
            assert(!empty());
            return m_ptr[0];
        }

        const_reference front() const
        {
            assert(!empty());
            return m_ptr[0];
        }

        reference back()
        {
            assert(!empty());
            return m_ptr[m_size - 1];
        }

        const_reference back() const
        {
            assert(!empty());
            return m_ptr[m_size - 1];
        }

        reference operator[](size_type n)
        {
            assert(n >= 0 && n < m_size);
            return m_ptr[n];
        }

        const_reference operator[](size_type n) const
        {
            assert(n >= 0 && n < m_size);
            return m_ptr[n];
        }

        iterator begin()
        {
            return m_ptr;
        }

        iterator end()
        {
            return m_ptr + m_size;
        }

        const_iterator begin() const
        {
            return m_ptr;
        }

        const_iterator end() const
        {
            return m_ptr + m_size;
        }

    private:
        bool dynamic() const noexcept
        {
            return m_ptr != m_fixed;
        }

        void grow(size_type new_cap)
        {
            pointer new_buf = new T[static_cast<std::size_t>(new_cap)];
            for (size_type i = 0; i < m_size; ++i)
                new_buf[i] = m_ptr[i];

            if (dynamic())
                delete[] m_ptr;

            m_ptr      = new_buf;
            m_capacity = new_cap;
        }

        void shrink_inline()
        {
            for (size_type i = 0; i < m_size; ++i)
                m_fixed[i] = m_ptr[i];

            delete[] m_ptr;
            m_ptr      = m_fixed;
            m_capacity = N;
        }

        value_type m_fixed[(N > 0 ? N : 1)];
        pointer    m_ptr;
        size_type  m_size;
        size_type  m_capacity;
    };

    template<class T, sizeType N>
    bool operator==(const small_list<T, N>& lhs, const small_list<T, N>& rhs)
    {
        if (lhs.size() != rhs.size())
            return false;

        for (sizeType i = 0; i < lhs.size(); ++i)
        {
            if (lhs[i] != rhs[i])
                return false;
        }
        return true;
    }

    template<class T, sizeType N>
    bool operator!=(const small_list<T, N>& lhs, const small_list<T, N>& rhs)
    {
        return !(lhs == rhs);
    }

} // namespace un

template<class T, un::sizeType N>
using SmallList = un::small_list<T, N>;
