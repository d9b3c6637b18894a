// linked_list.hpp
// Doubly linked list with positional access and fail-fast cursors.
// -----------------------------------------------------------
// * Positional lookups walk from whichever end is nearer: O(n/2).
// * add / add_first / insert / remove / clear are structural changes and
//   bump mod_count(); set() is not.

#ifndef MAPCORE_LINKED_LIST_HPP
#define MAPCORE_LINKED_LIST_HPP

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

#include "errors.hpp"

namespace mapcore
{

    template <typename T>
    class LinkedList
    {
        /* Element node: owned by the list, linked both ways. */
        struct Node
        {
            T item;
            Node *prev;
            Node *next;

            Node(Node *p, T v, Node *n) : item(std::move(v)), prev(p), next(n) {}
        };

    public:
        using value_type = T;
        using size_type = std::size_t;

        class Cursor;
        class const_iterator;

        LinkedList() = default;
        ~LinkedList() { free_nodes(); }

        LinkedList(const LinkedList &) = delete;
        LinkedList &operator=(const LinkedList &) = delete;

        size_type size() const noexcept { return count; }
        bool empty() const noexcept { return count == 0; }
        std::size_t mod_count() const noexcept { return modifications; }

        void add(T v) { link_last(std::move(v)); }
        void add_first(T v) { link_first(std::move(v)); }

        /* Inserts before position i; i == size() appends. */
        void insert(size_type i, T v)
        {
            if (i > count)
                throw IndexOutOfRange(out_of_bounds(i));
            if (i == count)
                link_last(std::move(v));
            else
                link_before(std::move(v), node_at(i));
        }

        const T &get(size_type i) const
        {
            range_check(i);
            return node_at(i)->item;
        }

        T set(size_type i, T v)
        {
            range_check(i);
            Node *x = node_at(i);
            return std::exchange(x->item, std::move(v));
        }

        T remove_at(size_type i)
        {
            range_check(i);
            return unlink(node_at(i));
        }

        /* Removes the first element equal to `v`. */
        bool remove(const T &v)
        {
            for (Node *x = head; x != nullptr; x = x->next)
            {
                if (x->item == v)
                {
                    unlink(x);
                    return true;
                }
            }
            return false;
        }

        std::optional<size_type> index_of(const T &v) const
        {
            size_type i = 0;
            for (const Node *x = head; x != nullptr; x = x->next, ++i)
                if (x->item == v)
                    return i;
            return std::nullopt;
        }

        bool contains(const T &v) const { return index_of(v).has_value(); }

        const T &first() const
        {
            if (head == nullptr)
                throw NoSuchElement("first() on an empty LinkedList");
            return head->item;
        }

        const T &last() const
        {
            if (tail == nullptr)
                throw NoSuchElement("last() on an empty LinkedList");
            return tail->item;
        }

        void clear() noexcept
        {
            free_nodes();
            head = tail = nullptr;
            count = 0;
            ++modifications;
        }

        /* Cursor positioned before element `index` (0 ≤ index ≤ size()). */
        Cursor cursor(size_type index = 0)
        {
            if (index > count)
                throw IndexOutOfRange(out_of_bounds(index));
            return Cursor(this, index == count ? nullptr : node_at(index), index);
        }

        /*===========================================================================
         *  Cursor
         *===========================================================================
         *  Same contract as ArrayList::Cursor.  Holds the node that next()
         *  would return (nullptr at the end) and the last node stepped over.
         *===========================================================================*/
        class Cursor
        {
        public:
            bool has_next() const noexcept { return next_pos < list->count; }
            bool has_previous() const noexcept { return next_pos > 0; }

            size_type next_index() const noexcept { return next_pos; }
            std::ptrdiff_t previous_index() const noexcept { return static_cast<std::ptrdiff_t>(next_pos) - 1; }

            const T &next()
            {
                check();
                if (!has_next())
                    throw NoSuchElement("cursor has no next element");
                last_returned = next_node;
                next_node = next_node->next;
                ++next_pos;
                return last_returned->item;
            }

            const T &previous()
            {
                check();
                if (!has_previous())
                    throw NoSuchElement("cursor has no previous element");
                next_node = (next_node == nullptr) ? list->tail : next_node->prev;
                last_returned = next_node;
                --next_pos;
                return last_returned->item;
            }

            void remove()
            {
                check();
                if (last_returned == nullptr)
                    throw IllegalState("remove() without next() or previous()");
                Node *after = last_returned->next;
                list->unlink(last_returned);
                if (next_node == last_returned) // stepped back over it
                    next_node = after;
                else
                    --next_pos;
                last_returned = nullptr;
                expected = list->modifications;
            }

            void set(T v)
            {
                if (last_returned == nullptr)
                    throw IllegalState("set() without next() or previous()");
                check();
                last_returned->item = std::move(v);
            }

            void add(T v)
            {
                check();
                last_returned = nullptr;
                if (next_node == nullptr)
                    list->link_last(std::move(v));
                else
                    list->link_before(std::move(v), next_node);
                ++next_pos;
                expected = list->modifications;
            }

        private:
            friend class LinkedList;

            Cursor(LinkedList *l, Node *n, size_type index)
                : list(l), next_node(n), next_pos(index), expected(l->modifications) {}

            void check() const
            {
                if (list->modifications != expected)
                    throw ConcurrentModification("LinkedList modified outside the cursor");
            }

            LinkedList *list;
            Node *next_node;
            Node *last_returned{nullptr};
            size_type next_pos;
            std::size_t expected;
        };

        /* Forward read-only iteration, fail-fast. */
        class const_iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = const T *;
            using reference = const T &;

            const_iterator() = default;

            reference operator*() const
            {
                check();
                return node->item;
            }

            pointer operator->() const
            {
                check();
                return &node->item;
            }

            const_iterator &operator++()
            {
                check();
                if (node == nullptr)
                    throw NoSuchElement("LinkedList iterator advanced past the end");
                node = node->next;
                return *this;
            }

            const_iterator operator++(int)
            {
                const_iterator tmp = *this;
                ++*this;
                return tmp;
            }

            bool operator==(const const_iterator &o) const noexcept { return node == o.node; }
            bool operator!=(const const_iterator &o) const noexcept { return node != o.node; }

        private:
            friend class LinkedList;

            const_iterator(const LinkedList *l, const Node *n)
                : list(l), node(n), expected(l->modifications) {}

            void check() const
            {
                if (list != nullptr && list->modifications != expected)
                    throw ConcurrentModification("LinkedList modified during iteration");
            }

            const LinkedList *list{nullptr};
            const Node *node{nullptr};
            std::size_t expected{0};
        };

        const_iterator begin() const { return const_iterator(this, head); }
        const_iterator end() const { return const_iterator(this, nullptr); }

    private:
        Node *head{nullptr};
        Node *tail{nullptr};
        size_type count{0};
        std::size_t modifications{0};

        void range_check(size_type i) const
        {
            if (i >= count)
                throw IndexOutOfRange(out_of_bounds(i));
        }

        std::string out_of_bounds(size_type i) const
        {
            return "Index: " + std::to_string(i) + ", Size: " + std::to_string(count);
        }

        /* Node at position i (< count), walking from the nearer end. */
        Node *node_at(size_type i) const noexcept
        {
            if (i < (count >> 1))
            {
                Node *x = head;
                for (size_type k = 0; k < i; ++k)
                    x = x->next;
                return x;
            }
            Node *x = tail;
            for (size_type k = count - 1; k > i; --k)
                x = x->prev;
            return x;
        }

        void link_first(T v)
        {
            Node *n = new Node(nullptr, std::move(v), head);
            if (head == nullptr)
                tail = n;
            else
                head->prev = n;
            head = n;
            ++count;
            ++modifications;
        }

        void link_last(T v)
        {
            Node *n = new Node(tail, std::move(v), nullptr);
            if (tail == nullptr)
                head = n;
            else
                tail->next = n;
            tail = n;
            ++count;
            ++modifications;
        }

        /* Links a new node right before `succ` (non-null). */
        void link_before(T v, Node *succ)
        {
            Node *pred = succ->prev;
            Node *n = new Node(pred, std::move(v), succ);
            succ->prev = n;
            if (pred == nullptr)
                head = n;
            else
                pred->next = n;
            ++count;
            ++modifications;
        }

        /* Detaches and frees `x`, returning its element. */
        T unlink(Node *x)
        {
            T item = std::move(x->item);
            Node *prev = x->prev;
            Node *next = x->next;

            if (prev == nullptr)
                head = next;
            else
                prev->next = next;

            if (next == nullptr)
                tail = prev;
            else
                next->prev = prev;

            delete x;
            --count;
            ++modifications;
            return item;
        }

        void free_nodes() noexcept
        {
            Node *x = head;
            while (x != nullptr)
            {
                Node *next = x->next;
                delete x;
                x = next;
            }
        }
    };

} // namespace mapcore

#endif // MAPCORE_LINKED_LIST_HPP
