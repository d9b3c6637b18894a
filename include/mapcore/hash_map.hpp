// hash_map.hpp
// Power-of-two bucketed hash map with tree-form overflow buckets.
// -----------------------------------------------------------
// * A key's bucket is fingerprint(key) & (capacity - 1), where the
//   fingerprint folds the high half of the hash into the low half so
//   small tables still see the high bits.
// * Buckets are singly linked chains.  A chain that grows past
//   TREEIFY_THRESHOLD in a table of at least MIN_TREEIFY_CAPACITY buckets
//   is promoted to a red-black tree (see tree_bin.hpp); in a smaller table
//   the table doubles instead.
// * Resize doubles the table and splits every bucket in two on one hash
//   bit, preserving relative order.
// * An order policy (NoOrder, LinkedOrder) observes inserts, accesses and
//   removals; LinkedHashMap is this engine with a LinkedOrder.
// * Single-writer container with fail-fast iterators, like TreeMap.

#ifndef MAPCORE_HASH_MAP_HPP
#define MAPCORE_HASH_MAP_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "key_traits.hpp"
#include "log.hpp"
#include "rb_algorithms.hpp"
#include "tree_bin.hpp"

namespace mapcore
{

    /*-------------------------------------------------------------------------
     *  struct HashNode<K,V>
     *-------------------------------------------------------------------------
     *  hash                  – cached fingerprint of `key`.
     *  next                  – bucket chain link (owning); kept in both
     *                          bucket forms.
     *  prev/parent/left/right/color
     *                        – tree-form bucket links; meaningless while the
     *                          bucket is a list.
     *  before/after          – order-tracking overlay links; unused under
     *                          NoOrder.
     *-------------------------------------------------------------------------*/
    template <typename K, typename V>
    struct HashNode
    {
        using key_type = K;
        using mapped_type = V;

        std::size_t hash;
        K key;
        V val;
        HashNode *next{nullptr};

        HashNode *prev{nullptr};
        HashNode *parent{nullptr};
        HashNode *left{nullptr};
        HashNode *right{nullptr};
        Color color{Color::RED};

        HashNode *before{nullptr};
        HashNode *after{nullptr};

        HashNode(std::size_t h, K k, V v)
            : hash(h), key(std::move(k)), val(std::move(v)) {}
    };

    /*-------------------------------------------------------------------------
     *  NoOrder<NodeT>
     *-------------------------------------------------------------------------
     *  Order policy of a plain HashMap: every hook is a no-op and iteration
     *  follows bucket order.  Any policy provides the same members.
     *-------------------------------------------------------------------------*/
    template <typename NodeT>
    struct NoOrder
    {
        static constexpr bool ordered = false;

        explicit NoOrder(bool = false) noexcept {}

        void on_insert(NodeT *) noexcept {}
        bool on_access(NodeT *) noexcept { return false; } // true if order changed
        void on_remove(NodeT *) noexcept {}
        void on_clear() noexcept {}

        NodeT *eldest() const noexcept { return nullptr; }
        bool eviction_check(const NodeT *, std::size_t) const { return false; }

        bool check(std::size_t) const noexcept { return true; }
    };

    template <typename K, typename V,
              typename Hash = std::hash<K>,
              typename KeyEqual = std::equal_to<K>,
              template <typename> class Order = NoOrder>
    class HashMap
    {
    public:
        using NodeT = HashNode<K, V>;
        using BinT = Bin<NodeT>;
        using OrderT = Order<NodeT>;
        using key_type = K;
        using mapped_type = V;
        using hasher = Hash;
        using key_equal = KeyEqual;
        using size_type = std::size_t;

        class const_iterator;

        /*───────────────────────────────────────────────────────────────────────────
          Constructors
          ────────────
          • Throw InvalidArgument for a negative capacity or a load factor
            that is NaN or <= 0.
          • No bucket array is allocated until the first insert.  Until then
            the rounded-up requested capacity is parked in the threshold.
         ──────────────────────────────────────────────────────────────────────────*/
        HashMap() : HashMap(HashOptions{}) {}

        explicit HashMap(std::int64_t initial_capacity, float load_factor = DEFAULT_LOAD_FACTOR)
            : HashMap(HashOptions{initial_capacity, load_factor, false}) {}

        explicit HashMap(const HashOptions &opts, Hash hash = Hash(), KeyEqual eq = KeyEqual())
            : lf(opts.load_factor),
              hash_fn(std::move(hash)),
              key_eq(std::move(eq)),
              order(opts.access_order)
        {
            opts.validate();
            resize_threshold = opts.requested_capacity();
        }

        ~HashMap() { destroy_all(); }

        HashMap(const HashMap &) = delete;
        HashMap &operator=(const HashMap &) = delete;
        HashMap(HashMap &&) = delete;
        HashMap &operator=(HashMap &&) = delete;

        size_type size() const noexcept { return node_count; }
        bool empty() const noexcept { return node_count == 0; }

        /* Current bucket count; 0 before the first insert. */
        size_type capacity() const noexcept { return table.size(); }

        /* Size above which the next insert doubles the table. */
        size_type threshold() const noexcept { return resize_threshold; }

        float load_factor() const noexcept { return lf; }

        std::size_t mod_count() const noexcept { return modifications; }

        OrderT &order_policy() noexcept { return order; }
        const OrderT &order_policy() const noexcept { return order; }

        /* Hash of `k` with the high half folded into the low half; 0 for an
           absent key. */
        std::size_t fingerprint(const K &k) const
        {
            if (detail::key_absent(k))
                return 0;
            std::size_t h = hash_fn(k);
            return h ^ (h >> 16);
        }

        // ────────────────────────────────────────────────────────────────────────
        //  Lookup
        // ────────────────────────────────────────────────────────────────────────

        /* Pointer to the value mapped to `k`, or nullptr. */
        const V *find(const K &k) const
        {
            const NodeT *e = find_node(fingerprint(k), k);
            return e != nullptr ? &e->val : nullptr;
        }

        std::optional<V> get(const K &k) const
        {
            if (const V *v = find(k))
                return *v;
            return std::nullopt;
        }

        V get_or_default(const K &k, V fallback) const
        {
            if (const V *v = find(k))
                return *v;
            return fallback;
        }

        bool contains(const K &k) const { return find(k) != nullptr; }

        bool contains_value(const V &v) const
        {
            for (const BinT &b : table)
                for (const NodeT *e = b.head; e != nullptr; e = e->next)
                    if (e->val == v)
                        return true;
            return false;
        }

        /* Lookup that counts as an access for the order policy (moves the
           entry to the young end in access-order mode).  Returns nullptr on
           a miss. */
        V *access(const K &k)
        {
            NodeT *e = find_node(fingerprint(k), k);
            if (e == nullptr)
                return nullptr;
            if (order.on_access(e))
                ++modifications;
            return &e->val;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  PUT
        //
        //  1. Allocate the table on first use.
        //  2. Empty bucket → the new node becomes its head.
        //  3. Otherwise look for the key: the head first, then the tree or the
        //     rest of the chain.  A miss appends to the chain tail (or links
        //     into the tree); a chain that already held TREEIFY_THRESHOLD
        //     nodes is then treeified, or the table grows if it is small.
        //  4. A hit overwrites the value unless `only_if_absent` (an absent
        //     value still counts as missing) and is reported to the order
        //     policy as an access.  No structural change.
        //  5. After an insert: size above threshold → resize; then, if
        //     `evict`, the order policy may evict its eldest entry.
        //
        //  Returns the previous value, or std::nullopt when the key was new.
        // ────────────────────────────────────────────────────────────────────────
        std::optional<V> put(K k, V v, bool only_if_absent = false, bool evict = true)
        {
            const std::size_t h = fingerprint(k);

            if (table.empty())
                resize();

            const std::size_t i = h & (table.size() - 1);
            BinT &bin = table[i];
            NodeT *e = nullptr;

            if (bin.head == nullptr)
            {
                bin.head = new_node(h, k, v);
            }
            else if (bin.head->hash == h && key_eq(bin.head->key, k))
            {
                e = bin.head;
            }
            else if (bin.tree)
            {
                auto placed = tree_bin::put(bin, h, k, key_eq,
                                            [&] { return new_node(h, k, v); });
                if (!placed.second)
                    e = placed.first;
            }
            else
            {
                NodeT *p = bin.head;
                for (int chain = 0;; ++chain)
                {
                    if ((e = p->next) == nullptr)
                    {
                        p->next = new_node(h, k, v);
                        if (chain >= TREEIFY_THRESHOLD - 1)
                            treeify_bin(h);
                        break;
                    }
                    if (e->hash == h && key_eq(e->key, k))
                        break;
                    p = e;
                }
            }

            if (e != nullptr) // existing mapping
            {
                std::optional<V> old;
                if (!only_if_absent || detail::key_absent(e->val))
                    old.emplace(std::exchange(e->val, std::move(v)));
                else
                    old.emplace(e->val);
                if (order.on_access(e))
                    ++modifications;
                return old;
            }

            ++modifications;
            if (++node_count > resize_threshold)
                resize();
            after_insert(evict);
            return std::nullopt;
        }

        /* Insert only when `k` is unmapped (or mapped to an absent value);
           returns the existing value otherwise. */
        std::optional<V> put_if_absent(K k, V v)
        {
            return put(std::move(k), std::move(v), true, true);
        }

        // ────────────────────────────────────────────────────────────────────────
        //  REMOVE
        //
        //  Returns the removed value, or std::nullopt (size unchanged) when the
        //  key is not present.  Tree-form buckets stay trees however small
        //  they get; only a resize split demotes them.
        // ────────────────────────────────────────────────────────────────────────
        std::optional<V> remove(const K &k)
        {
            NodeT *e = unlink_node(fingerprint(k), k, nullptr);
            if (e == nullptr)
                return std::nullopt;
            std::optional<V> old(std::move(e->val));
            delete e;
            return old;
        }

        /* Removes `k` only while it is mapped to a value equal to `v`. */
        bool remove(const K &k, const V &v)
        {
            NodeT *e = unlink_node(fingerprint(k), k, &v);
            if (e == nullptr)
                return false;
            delete e;
            return true;
        }

        /* Drops every entry but keeps the bucket array at its current size. */
        void clear() noexcept
        {
            ++modifications;
            if (node_count == 0)
                return;
            destroy_all();
            for (BinT &b : table)
                b = BinT{};
            node_count = 0;
            order.on_clear();
        }

        /*────────────────────────────────────────────────────────────────────────────
          Introspection
          ─────────────
          bucket_index(k) – index of the bucket holding `k`, or std::nullopt.
          bucket_kind(i)  – Empty / List / Tree.
          bucket_size(i)  – number of entries in bucket i.
          Out-of-range indices throw IndexOutOfRange.
         ───────────────────────────────────────────────────────────────────────────*/
        std::optional<size_type> bucket_index(const K &k) const
        {
            const std::size_t h = fingerprint(k);
            if (find_node(h, k) == nullptr)
                return std::nullopt;
            return h & (table.size() - 1);
        }

        BinKind bucket_kind(size_type i) const
        {
            return table_at(i).kind();
        }

        size_type bucket_size(size_type i) const
        {
            size_type n = 0;
            for (const NodeT *e = table_at(i).head; e != nullptr; e = e->next)
                ++n;
            return n;
        }

        /*────────────────────────────────────────────────────────────────────────────
          validate
          ────────
          True when: every node sits in bucket (hash & (capacity - 1)) and
          caches the right fingerprint; every tree-form bucket passes
          tree_bin::check; the node total matches size(); the order policy's
          own structure is consistent.
         ───────────────────────────────────────────────────────────────────────────*/
        bool validate() const
        {
            if (table.empty())
                return node_count == 0 && order.check(0);

            const std::size_t mask = table.size() - 1;
            size_type seen = 0;
            for (size_type i = 0; i < table.size(); ++i)
            {
                const BinT &b = table[i];
                if (b.head == nullptr)
                {
                    if (b.tree || b.root != nullptr)
                        return false;
                    continue;
                }
                for (const NodeT *e = b.head; e != nullptr; e = e->next)
                {
                    if ((e->hash & mask) != i || e->hash != fingerprint(e->key))
                        return false;
                    ++seen;
                }
                if (b.tree && !tree_bin::check(b))
                    return false;
                if (!b.tree && b.root != nullptr)
                    return false;
            }
            return seen == node_count && order.check(node_count);
        }

        /*===========================================================================
         *  const_iterator
         *===========================================================================
         *  Forward iterator over the nodes.  Bucket order under NoOrder; the
         *  policy's order (eldest first) under an ordered policy.  Fail-fast on
         *  structural modification, like TreeMap's iterator.
         *===========================================================================*/
        class const_iterator
        {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = NodeT;
            using difference_type = std::ptrdiff_t;
            using pointer = const NodeT *;
            using reference = const NodeT &;

            const_iterator() = default;

            reference operator*() const
            {
                check();
                return *node;
            }

            pointer operator->() const
            {
                check();
                return node;
            }

            const_iterator &operator++()
            {
                check();
                if (node == nullptr)
                    throw NoSuchElement("HashMap iterator advanced past the end");
                if constexpr (OrderT::ordered)
                {
                    node = node->after;
                }
                else
                {
                    node = node->next;
                    while (node == nullptr && ++index < map->table.size())
                        node = map->table[index].head;
                }
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
            friend class HashMap;

            const_iterator(const HashMap *m, const NodeT *n, size_type i)
                : map(m), node(n), index(i), expected(m->modifications) {}

            void check() const
            {
                if (map != nullptr && map->modifications != expected)
                    throw ConcurrentModification("HashMap modified during iteration");
            }

            const HashMap *map{nullptr};
            const NodeT *node{nullptr};
            size_type index{0};
            std::size_t expected{0};
        };

        const_iterator begin() const
        {
            if constexpr (OrderT::ordered)
            {
                return const_iterator(this, order.eldest(), 0);
            }
            else
            {
                for (size_type i = 0; i < table.size(); ++i)
                    if (table[i].head != nullptr)
                        return const_iterator(this, table[i].head, i);
                return end();
            }
        }

        const_iterator end() const { return const_iterator(this, nullptr, table.size()); }

    private:
        std::vector<BinT> table;
        size_type node_count{0};
        size_type resize_threshold{0};
        float lf;
        std::size_t modifications{0};
        Hash hash_fn;
        KeyEqual key_eq;
        OrderT order;

        const BinT &table_at(size_type i) const
        {
            if (i >= table.size())
                throw IndexOutOfRange("bucket index " + std::to_string(i) +
                                      " out of range for capacity " + std::to_string(table.size()));
            return table[i];
        }

        NodeT *new_node(std::size_t h, K &k, V &v)
        {
            NodeT *n = new NodeT(h, std::move(k), std::move(v));
            order.on_insert(n);
            return n;
        }

        NodeT *find_node(std::size_t h, const K &k) const
        {
            if (table.empty())
                return nullptr;

            const BinT &bin = table[h & (table.size() - 1)];
            NodeT *first = bin.head;
            if (first == nullptr)
                return nullptr;
            if (first->hash == h && key_eq(first->key, k))
                return first;
            if (bin.tree)
                return tree_bin::find(bin.root, h, k, key_eq);
            for (NodeT *e = first->next; e != nullptr; e = e->next)
                if (e->hash == h && key_eq(e->key, k))
                    return e;
            return nullptr;
        }

        /*────────────────────────────────────────────────────────────────────────────
          unlink_node(h, k, match)
          ────────────────────────
          Detaches the node for `k` from its bucket and from the order policy
          and returns it (the caller frees it).  With `match`, only a node
          whose value equals *match is detached.  nullptr on a miss.
         ───────────────────────────────────────────────────────────────────────────*/
        NodeT *unlink_node(std::size_t h, const K &k, const V *match)
        {
            if (table.empty())
                return nullptr;

            BinT &bin = table[h & (table.size() - 1)];
            if (bin.head == nullptr)
                return nullptr;

            NodeT *node = nullptr;
            NodeT *pred = nullptr; // chain predecessor, list form only
            if (bin.head->hash == h && key_eq(bin.head->key, k))
            {
                node = bin.head;
            }
            else if (bin.tree)
            {
                node = tree_bin::find(bin.root, h, k, key_eq);
            }
            else
            {
                for (NodeT *p = bin.head, *e = p->next; e != nullptr; p = e, e = e->next)
                {
                    if (e->hash == h && key_eq(e->key, k))
                    {
                        node = e;
                        pred = p;
                        break;
                    }
                }
            }

            if (node == nullptr || (match != nullptr && !(node->val == *match)))
                return nullptr;

            if (bin.tree)
                tree_bin::remove(bin, node);
            else if (pred == nullptr)
                bin.head = node->next;
            else
                pred->next = node->next;
            node->next = nullptr;

            ++modifications;
            --node_count;
            order.on_remove(node);
            return node;
        }

        /* Post-insert eviction: offers the eldest entry to the policy. */
        void after_insert(bool evict)
        {
            if (!evict)
                return;
            NodeT *first = order.eldest();
            if (first == nullptr || !order.eviction_check(first, node_count))
                return;

            log_debug("evicting eldest entry (size {})", node_count);
            NodeT *gone = unlink_node(first->hash, first->key, nullptr);
            delete gone;
        }

        /*────────────────────────────────────────────────────────────────────────────
          treeify_bin(h)
          ──────────────
          Promotes the bucket of fingerprint `h` to tree form, or doubles the
          table instead while it is smaller than MIN_TREEIFY_CAPACITY.
         ───────────────────────────────────────────────────────────────────────────*/
        void treeify_bin(std::size_t h)
        {
            if (table.size() < MIN_TREEIFY_CAPACITY)
            {
                resize();
                return;
            }
            const std::size_t i = h & (table.size() - 1);
            BinT &bin = table[i];
            if (bin.head != nullptr && !bin.tree)
            {
                tree_bin::treeify(bin);
                log_debug("bucket {} treeified (capacity {})", i, table.size());
            }
        }

        /*────────────────────────────────────────────────────────────────────────────
          resize
          ──────
          • First call: allocate the requested capacity parked in the
            threshold, or DEFAULT_INITIAL_CAPACITY.
          • Later calls: double.  At MAXIMUM_CAPACITY the table stays and the
            threshold becomes unbounded.
          • Each old bucket i is split on (hash & old_capacity): 0 → i,
            1 → i + old_capacity, chain order preserved.  A single-node bucket
            moves as is; tree-form buckets go through tree_bin::split.
          • The new threshold is doubled directly when the old table had at
            least DEFAULT_INITIAL_CAPACITY buckets, else recomputed from the
            load factor.
         ───────────────────────────────────────────────────────────────────────────*/
        void resize()
        {
            const size_type old_cap = table.size();
            const size_type old_thr = resize_threshold;
            size_type new_cap = 0;
            size_type new_thr = 0;

            if (old_cap > 0)
            {
                if (old_cap >= MAXIMUM_CAPACITY)
                {
                    resize_threshold = THRESHOLD_UNBOUNDED;
                    return;
                }
                new_cap = old_cap << 1;
                if (new_cap < MAXIMUM_CAPACITY && old_cap >= DEFAULT_INITIAL_CAPACITY)
                    new_thr = old_thr << 1;
            }
            else if (old_thr > 0)
            {
                new_cap = old_thr;
            }
            else
            {
                new_cap = DEFAULT_INITIAL_CAPACITY;
                new_thr = static_cast<size_type>(DEFAULT_LOAD_FACTOR * DEFAULT_INITIAL_CAPACITY);
            }

            if (new_thr == 0)
            {
                const float ft = static_cast<float>(new_cap) * lf;
                new_thr = (new_cap < MAXIMUM_CAPACITY && ft < static_cast<float>(MAXIMUM_CAPACITY))
                              ? static_cast<size_type>(ft)
                              : THRESHOLD_UNBOUNDED;
            }

            std::vector<BinT> fresh(new_cap);
            for (size_type j = 0; j < old_cap; ++j)
            {
                BinT &bin = table[j];
                NodeT *e = bin.head;
                if (e == nullptr)
                    continue;

                if (e->next == nullptr)
                {
                    fresh[e->hash & (new_cap - 1)] = bin;
                }
                else if (bin.tree)
                {
                    tree_bin::split(bin, fresh[j], fresh[j + old_cap], old_cap);
                    log_debug("tree bucket {} split: {} -> {}, {} -> {}",
                              j, j, kind_name(fresh[j].kind()),
                              j + old_cap, kind_name(fresh[j + old_cap].kind()));
                }
                else
                {
                    NodeT *lo_head = nullptr, *lo_tail = nullptr;
                    NodeT *hi_head = nullptr, *hi_tail = nullptr;
                    for (NodeT *next; e != nullptr; e = next)
                    {
                        next = e->next;
                        if ((e->hash & old_cap) == 0)
                        {
                            if (lo_tail == nullptr)
                                lo_head = e;
                            else
                                lo_tail->next = e;
                            lo_tail = e;
                        }
                        else
                        {
                            if (hi_tail == nullptr)
                                hi_head = e;
                            else
                                hi_tail->next = e;
                            hi_tail = e;
                        }
                    }
                    if (lo_tail != nullptr)
                    {
                        lo_tail->next = nullptr;
                        fresh[j].head = lo_head;
                    }
                    if (hi_tail != nullptr)
                    {
                        hi_tail->next = nullptr;
                        fresh[j + old_cap].head = hi_head;
                    }
                }
            }

            table.swap(fresh);
            resize_threshold = new_thr;

            if (old_cap == 0)
                log_debug("table allocated: capacity {}, threshold {}", new_cap, new_thr);
            else
                log_debug("table resized: capacity {} -> {}, threshold {}", old_cap, new_cap, new_thr);
        }

        static const char *kind_name(BinKind k) noexcept
        {
            switch (k)
            {
            case BinKind::Empty:
                return "empty";
            case BinKind::List:
                return "list";
            case BinKind::Tree:
                return "tree";
            }
            return "?";
        }

        void destroy_all() noexcept
        {
            for (BinT &b : table)
            {
                NodeT *e = b.head;
                while (e != nullptr)
                {
                    NodeT *next = e->next;
                    delete e;
                    e = next;
                }
            }
        }
    };

} // namespace mapcore

#endif // MAPCORE_HASH_MAP_HPP
