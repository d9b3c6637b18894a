// array_list.hpp
// Growable array with an explicit capacity policy and fail-fast cursors.
// -----------------------------------------------------------
// * A default-constructed list allocates nothing; the first add reserves
//   DEFAULT_LIST_CAPACITY slots.
// * Growth is old + old/2, at least the requested minimum, capped at
//   MAX_ARRAY_SIZE.
// * add / insert / remove / clear / reserve are structural changes and bump
//   mod_count(); set() is not.

#ifndef MAPCORE_ARRAY_LIST_HPP
#define MAPCORE_ARRAY_LIST_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "errors.hpp"

namespace mapcore
{

    template <typename T>
    class ArrayList
    {
    public:
        using value_type = T;
        using size_type = std::size_t;
        using const_iterator = typename std::vector<T>::const_iterator;

        class Cursor;

        ArrayList() : lazy_default(true) {}

        /* Throws InvalidArgument for a negative capacity. */
        explicit ArrayList(std::int64_t initial_capacity)
        {
            if (initial_capacity < 0)
                throw InvalidArgument("Illegal Capacity: " + std::to_string(initial_capacity));
            cap = static_cast<size_type>(initial_capacity);
            elements.reserve(cap);
        }

        size_type size() const noexcept { return elements.size(); }
        bool empty() const noexcept { return elements.empty(); }

        /* Slots available before the next growth. */
        size_type capacity() const noexcept { return cap; }

        std::size_t mod_count() const noexcept { return modifications; }

        /*───────────────────────────────────────────────────────────────────────────
          reserve(min_capacity)
          ─────────────────────
          Makes room for at least `min_capacity` elements.  On a list that
          has not allocated yet, requests up to DEFAULT_LIST_CAPACITY are
          left to the first add.  Throws InvalidArgument when the request
          cannot be represented.
         ──────────────────────────────────────────────────────────────────────────*/
        void reserve(size_type min_capacity)
        {
            const size_type min_expand = lazy_default ? DEFAULT_LIST_CAPACITY : 0;
            if (min_capacity > min_expand)
                ensure_explicit(min_capacity);
        }

        const T &get(size_type i) const
        {
            range_check(i);
            return elements[i];
        }

        /* Replaces element i and returns the previous one. */
        T set(size_type i, T v)
        {
            range_check(i);
            return std::exchange(elements[i], std::move(v));
        }

        void add(T v)
        {
            ensure_internal(elements.size() + 1);
            elements.push_back(std::move(v));
        }

        /* Inserts before position i; i == size() appends. */
        void insert(size_type i, T v)
        {
            if (i > elements.size())
                throw IndexOutOfRange(out_of_bounds(i));
            ensure_internal(elements.size() + 1);
            elements.insert(elements.begin() + static_cast<std::ptrdiff_t>(i), std::move(v));
        }

        /* Removes element i, shifting the tail left; returns it. */
        T remove_at(size_type i)
        {
            range_check(i);
            ++modifications;
            T old = std::move(elements[i]);
            elements.erase(elements.begin() + static_cast<std::ptrdiff_t>(i));
            return old;
        }

        /* Removes the first element equal to `v`; false if there is none. */
        bool remove(const T &v)
        {
            auto it = std::find(elements.begin(), elements.end(), v);
            if (it == elements.end())
                return false;
            ++modifications;
            elements.erase(it);
            return true;
        }

        std::optional<size_type> index_of(const T &v) const
        {
            auto it = std::find(elements.begin(), elements.end(), v);
            if (it == elements.end())
                return std::nullopt;
            return static_cast<size_type>(it - elements.begin());
        }

        bool contains(const T &v) const { return index_of(v).has_value(); }

        /* Empties the list; capacity is kept. */
        void clear() noexcept
        {
            ++modifications;
            elements.clear();
        }

        /* Cursor positioned before element `index` (0 ≤ index ≤ size()). */
        Cursor cursor(size_type index = 0)
        {
            if (index > elements.size())
                throw IndexOutOfRange(out_of_bounds(index));
            return Cursor(this, index);
        }

        const_iterator begin() const noexcept { return elements.begin(); }
        const_iterator end() const noexcept { return elements.end(); }

        /*===========================================================================
         *  Cursor
         *===========================================================================
         *  Bidirectional list cursor sitting *between* elements.  next() and
         *  previous() step over one element and remember it; remove() and
         *  set() act on that remembered element and throw IllegalState when
         *  there is none.  Any structural change made through another path
         *  makes the next call throw ConcurrentModification.
         *===========================================================================*/
        class Cursor
        {
        public:
            bool has_next() const noexcept { return pos != list->size(); }
            bool has_previous() const noexcept { return pos != 0; }

            size_type next_index() const noexcept { return pos; }
            std::ptrdiff_t previous_index() const noexcept { return static_cast<std::ptrdiff_t>(pos) - 1; }

            const T &next()
            {
                check();
                if (pos >= list->size())
                    throw NoSuchElement("cursor has no next element");
                last = pos++;
                return list->elements[last];
            }

            const T &previous()
            {
                check();
                if (pos == 0)
                    throw NoSuchElement("cursor has no previous element");
                last = --pos;
                return list->elements[last];
            }

            void remove()
            {
                if (last == npos)
                    throw IllegalState("remove() without next() or previous()");
                check();
                list->remove_at(last);
                pos = last;
                last = npos;
                expected = list->modifications;
            }

            void set(T v)
            {
                if (last == npos)
                    throw IllegalState("set() without next() or previous()");
                check();
                list->set(last, std::move(v));
            }

            /* Inserts before the cursor; a following next() is unaffected. */
            void add(T v)
            {
                check();
                list->insert(pos, std::move(v));
                ++pos;
                last = npos;
                expected = list->modifications;
            }

        private:
            friend class ArrayList;

            static constexpr size_type npos = std::numeric_limits<size_type>::max();

            Cursor(ArrayList *l, size_type index)
                : list(l), pos(index), expected(l->modifications) {}

            void check() const
            {
                if (list->modifications != expected)
                    throw ConcurrentModification("ArrayList modified outside the cursor");
            }

            ArrayList *list;
            size_type pos;
            size_type last{npos};
            std::size_t expected;
        };

    private:
        std::vector<T> elements;
        size_type cap{0};
        bool lazy_default{false}; // nothing allocated yet, first growth goes to the default
        std::size_t modifications{0};

        void range_check(size_type i) const
        {
            if (i >= elements.size())
                throw IndexOutOfRange(out_of_bounds(i));
        }

        std::string out_of_bounds(size_type i) const
        {
            return "Index: " + std::to_string(i) + ", Size: " + std::to_string(elements.size());
        }

        void ensure_internal(size_type min_capacity)
        {
            if (lazy_default)
                min_capacity = std::max(DEFAULT_LIST_CAPACITY, min_capacity);
            ensure_explicit(min_capacity);
        }

        void ensure_explicit(size_type min_capacity)
        {
            ++modifications;
            if (min_capacity > cap)
                grow(min_capacity);
        }

        void grow(size_type min_capacity)
        {
            size_type new_cap = cap + (cap >> 1);
            if (new_cap < min_capacity)
                new_cap = min_capacity;
            if (new_cap > MAX_ARRAY_SIZE)
                new_cap = huge_capacity(min_capacity);
            elements.reserve(new_cap);
            cap = new_cap;
            lazy_default = false;
        }

        static size_type huge_capacity(size_type min_capacity)
        {
            constexpr auto limit = static_cast<size_type>(std::numeric_limits<std::int32_t>::max());
            if (min_capacity > limit)
                throw InvalidArgument("Requested capacity too large: " + std::to_string(min_capacity));
            return min_capacity > MAX_ARRAY_SIZE ? limit : MAX_ARRAY_SIZE;
        }
    };

} // namespace mapcore

#endif // MAPCORE_ARRAY_LIST_HPP
