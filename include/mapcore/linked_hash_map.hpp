// linked_hash_map.hpp
// HashMap with a predictable iteration order and optional LRU eviction.
// -----------------------------------------------------------
// * LinkedOrder threads every entry of the hash engine on a doubly linked
//   list (HashNode::before/after), eldest at the head, youngest at the tail.
// * Insertion order (default): re-putting an existing key keeps its place.
//   Access order: get / put of an existing key moves it to the tail, so the
//   head is always the least recently used entry.
// * After every insert the eviction predicate sees the eldest entry and the
//   new size; returning true removes that entry.  A bounded LRU cache is
//   an access-order map whose predicate is `size > capacity`.

#ifndef MAPCORE_LINKED_HASH_MAP_HPP
#define MAPCORE_LINKED_HASH_MAP_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include "config.hpp"
#include "hash_map.hpp"

namespace mapcore
{

    /*-------------------------------------------------------------------------
     *  LinkedOrder<NodeT>
     *-------------------------------------------------------------------------
     *  Order policy maintaining the before/after list.  All hooks are O(1).
     *-------------------------------------------------------------------------*/
    template <typename NodeT>
    class LinkedOrder
    {
    public:
        using key_type = typename NodeT::key_type;
        using mapped_type = typename NodeT::mapped_type;
        using EvictionPredicate =
            std::function<bool(const key_type &, const mapped_type &, std::size_t)>;

        static constexpr bool ordered = true;

        explicit LinkedOrder(bool access_order = false) noexcept : by_access(access_order) {}

        /* New entries join at the young end. */
        void on_insert(NodeT *p) noexcept { link_last(p); }

        /* Access order only: move `e` to the tail.  Returns true when the
           order changed. */
        bool on_access(NodeT *e) noexcept
        {
            if (!by_access || tail == e)
                return false;
            unlink(e);
            link_last(e);
            return true;
        }

        void on_remove(NodeT *e) noexcept { unlink(e); }

        void on_clear() noexcept { head = tail = nullptr; }

        NodeT *eldest() const noexcept { return head; }
        NodeT *youngest() const noexcept { return tail; }

        bool eviction_check(const NodeT *eldest, std::size_t size) const
        {
            return predicate && predicate(eldest->key, eldest->val, size);
        }

        bool access_order() const noexcept { return by_access; }

        void set_eviction_predicate(EvictionPredicate p) { predicate = std::move(p); }

        /* Both directions agree and the list holds exactly `size` nodes. */
        bool check(std::size_t size) const noexcept
        {
            std::size_t n = 0;
            const NodeT *prev = nullptr;
            for (const NodeT *e = head; e != nullptr; e = e->after)
            {
                if (e->before != prev)
                    return false;
                prev = e;
                ++n;
            }
            return prev == tail && n == size;
        }

    private:
        NodeT *head{nullptr};
        NodeT *tail{nullptr};
        bool by_access;
        EvictionPredicate predicate;

        void link_last(NodeT *p) noexcept
        {
            p->after = nullptr;
            p->before = tail;
            if (tail == nullptr)
                head = p;
            else
                tail->after = p;
            tail = p;
        }

        void unlink(NodeT *p) noexcept
        {
            NodeT *b = p->before;
            NodeT *a = p->after;
            if (b == nullptr)
                head = a;
            else
                b->after = a;
            if (a == nullptr)
                tail = b;
            else
                a->before = b;
            p->before = p->after = nullptr;
        }
    };

    /*===========================================================================
     *  LinkedHashMap
     *===========================================================================
     *  Front end over HashMap<..., LinkedOrder>.  Differs from the plain map
     *  in that get() / get_or_default() count as accesses, and in the
     *  eldest()/youngest() peeks and the eviction predicate.
     *===========================================================================*/
    template <typename K, typename V,
              typename Hash = std::hash<K>,
              typename KeyEqual = std::equal_to<K>>
    class LinkedHashMap
    {
    public:
        using engine_type = HashMap<K, V, Hash, KeyEqual, LinkedOrder>;
        using NodeT = typename engine_type::NodeT;
        using const_iterator = typename engine_type::const_iterator;
        using EvictionPredicate = typename LinkedOrder<NodeT>::EvictionPredicate;
        using key_type = K;
        using mapped_type = V;
        using size_type = std::size_t;

        LinkedHashMap() : map(HashOptions{}) {}

        explicit LinkedHashMap(std::int64_t initial_capacity,
                               float load_factor = DEFAULT_LOAD_FACTOR,
                               bool access_order = false)
            : map(HashOptions{initial_capacity, load_factor, access_order}) {}

        explicit LinkedHashMap(const HashOptions &opts, Hash hash = Hash(), KeyEqual eq = KeyEqual())
            : map(opts, std::move(hash), std::move(eq)) {}

        size_type size() const noexcept { return map.size(); }
        bool empty() const noexcept { return map.empty(); }
        size_type capacity() const noexcept { return map.capacity(); }
        std::size_t mod_count() const noexcept { return map.mod_count(); }
        bool access_order() const noexcept { return map.order_policy().access_order(); }

        /* Replaces the eviction predicate; an empty function never evicts. */
        void set_eviction_predicate(EvictionPredicate p)
        {
            map.order_policy().set_eviction_predicate(std::move(p));
        }

        /* Value for `k`, counted as an access (may reorder). */
        std::optional<V> get(const K &k)
        {
            if (V *v = map.access(k))
                return *v;
            return std::nullopt;
        }

        V get_or_default(const K &k, V fallback)
        {
            if (V *v = map.access(k))
                return *v;
            return fallback;
        }

        /* Membership tests never count as accesses. */
        bool contains(const K &k) const { return map.contains(k); }
        bool contains_value(const V &v) const { return map.contains_value(v); }

        std::optional<V> put(K k, V v) { return map.put(std::move(k), std::move(v)); }
        std::optional<V> put_if_absent(K k, V v) { return map.put_if_absent(std::move(k), std::move(v)); }

        std::optional<V> remove(const K &k) { return map.remove(k); }
        bool remove(const K &k, const V &v) { return map.remove(k, v); }

        void clear() noexcept { map.clear(); }

        /* Head (least recently inserted / used) and tail entries; nullptr
           when empty. */
        const NodeT *eldest() const noexcept { return map.order_policy().eldest(); }
        const NodeT *youngest() const noexcept { return map.order_policy().youngest(); }

        bool validate() const { return map.validate(); }

        /* Underlying engine, for bucket introspection. */
        const engine_type &engine() const noexcept { return map; }

        const_iterator begin() const { return map.begin(); }
        const_iterator end() const { return map.end(); }

    private:
        engine_type map;
    };

} // namespace mapcore

#endif // MAPCORE_LINKED_HASH_MAP_HPP
