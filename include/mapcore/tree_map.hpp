// tree_map.hpp
// Ordered map backed by a red-black tree.
// -----------------------------------------------------------
// * Keys are ordered by a strict-weak-ordering functor (NaturalOrder<K> by
//   default, i.e. operator<).  Equal keys overwrite in place.
// * get / put / remove are O(log n); iteration is in ascending key order.
// * Single-writer container: no internal locking.  Readers may run in
//   parallel only while no thread mutates the map.
// * Iterators are fail-fast: they throw ConcurrentModification if the map
//   was structurally modified (insert / remove / clear) after they were
//   created.  A value-only overwrite is not structural.

#ifndef MAPCORE_TREE_MAP_HPP
#define MAPCORE_TREE_MAP_HPP

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>

#include "errors.hpp"
#include "key_traits.hpp"
#include "rb_algorithms.hpp"

namespace mapcore
{

    /*-------------------------------------------------------------------------
     *  struct TreeNode<K,V>
     *-------------------------------------------------------------------------
     *  key, val          – the mapping.  `key` is not const because removal
     *                      of a two-child node moves its successor's key in.
     *  color             – RED or BLACK; fresh nodes are RED until linked.
     *  parent            – non-owning back link (nullptr for the root).
     *  left, right       – owned children; nullptr when absent.
     *-------------------------------------------------------------------------*/
    template <typename K, typename V>
    struct TreeNode
    {
        K key;
        V val;
        Color color{Color::RED};

        TreeNode *parent{nullptr};
        TreeNode *left{nullptr};
        TreeNode *right{nullptr};

        TreeNode(K k, V v, TreeNode *p)
            : key(std::move(k)), val(std::move(v)), parent(p) {}
    };

    template <typename K, typename V, typename Compare = NaturalOrder<K>>
    class TreeMap
    {
    public:
        using NodeT = TreeNode<K, V>;
        using key_type = K;
        using mapped_type = V;
        using key_compare = Compare;
        using size_type = std::size_t;

        class const_iterator;

        /*───────────────────────────────────────────────────────────────────────────
          Constructor
          ───────────
          • The tree starts empty: root == nullptr.
          • `c` is copied into the map and used for every ordering decision.
         ──────────────────────────────────────────────────────────────────────────*/
        explicit TreeMap(Compare c = Compare()) : comp(std::move(c)) {}

        ~TreeMap() { destroy_rec(root); }

        /*───────────────────────────────────────────────────────────────────────────
          Copy operations are deleted: nodes are owned through raw links and a
          shallow copy would double-free.  Moving hands the whole tree over.
         ──────────────────────────────────────────────────────────────────────────*/
        TreeMap(const TreeMap &) = delete;
        TreeMap &operator=(const TreeMap &) = delete;

        TreeMap(TreeMap &&other) noexcept
            : root(std::exchange(other.root, nullptr)),
              comp(std::move(other.comp)),
              node_count(std::exchange(other.node_count, 0)),
              modifications(other.modifications)
        {
            ++other.modifications; // outstanding iterators on `other` are now stale
        }

        TreeMap &operator=(TreeMap &&other) noexcept
        {
            if (this != &other)
            {
                destroy_rec(root);
                root = std::exchange(other.root, nullptr);
                comp = std::move(other.comp);
                node_count = std::exchange(other.node_count, 0);
                ++modifications;
                ++other.modifications;
            }
            return *this;
        }

        size_type size() const noexcept { return node_count; }
        bool empty() const noexcept { return node_count == 0; }

        /* Structural-change counter; see the fail-fast contract above. */
        std::size_t mod_count() const noexcept { return modifications; }

        const Compare &comparator() const noexcept { return comp; }

        // ────────────────────────────────────────────────────────────────────────
        //  Lookup
        //
        //  Plain BST descent from the root; O(log n).  Returns the node holding
        //  `k`, or nullptr when the key is not present.
        //  Throws InvalidKey for an absent key under natural ordering.
        // ────────────────────────────────────────────────────────────────────────
        const NodeT *find(const K &k) const
        {
            check_key(k);
            const NodeT *n = root;
            while (n != nullptr)
            {
                if (comp(k, n->key))
                    n = n->left;
                else if (comp(n->key, k))
                    n = n->right;
                else
                    return n;
            }
            return nullptr;
        }

        /* Copy of the value mapped to `k`, or std::nullopt. */
        std::optional<V> get(const K &k) const
        {
            if (const NodeT *n = find(k))
                return n->val;
            return std::nullopt;
        }

        bool contains(const K &k) const { return find(k) != nullptr; }

        // ────────────────────────────────────────────────────────────────────────
        //  PUT
        //
        //  • Descend comparing against each visited key.  An equal key is
        //    overwritten and its previous value returned; the shape and the
        //    change counter are untouched.
        //  • Otherwise the new node hangs off the last visited node on the side
        //    of the last comparison and insert_fixup() rebalances.
        //  • The node is allocated only after the descent, so a comparator
        //    that throws InvalidKey leaves the tree exactly as it was.
        // ────────────────────────────────────────────────────────────────────────
        std::optional<V> put(K k, V v)
        {
            check_key(k);

            NodeT *t = root;
            if (t == nullptr)
            {
                // nothing to compare against yet; still let the comparator
                // reject a key it cannot order
                static_cast<void>(comp(k, k));
                root = new NodeT(std::move(k), std::move(v), nullptr);
                root->color = Color::BLACK;
                node_count = 1;
                ++modifications;
                return std::nullopt;
            }

            NodeT *parent = nullptr;
            bool go_left = false;
            do
            {
                parent = t;
                if (comp(k, t->key))
                {
                    go_left = true;
                    t = t->left;
                }
                else if (comp(t->key, k))
                {
                    go_left = false;
                    t = t->right;
                }
                else // DUPLICATE KEY
                {
                    V old = std::exchange(t->val, std::move(v));
                    return old;
                }
            } while (t != nullptr);

            NodeT *e = new NodeT(std::move(k), std::move(v), parent);
            if (go_left)
                parent->left = e;
            else
                parent->right = e;

            rb::insert_fixup(root, e);
            ++node_count;
            ++modifications;
            return std::nullopt;
        }

        /* Insert only when `k` is not mapped yet; returns the existing value
           otherwise. */
        std::optional<V> put_if_absent(K k, V v)
        {
            if (const NodeT *n = find(k))
                return n->val;
            return put(std::move(k), std::move(v));
        }

        // ────────────────────────────────────────────────────────────────────────
        //  REMOVE
        //
        //  Returns the removed value, or std::nullopt (size unchanged) when the
        //  key is not present.
        // ────────────────────────────────────────────────────────────────────────
        std::optional<V> remove(const K &k)
        {
            NodeT *p = const_cast<NodeT *>(find(k));
            if (p == nullptr)
                return std::nullopt;

            std::optional<V> old(std::move(p->val));
            delete_entry(p);
            --node_count;
            ++modifications;
            return old;
        }

        void clear() noexcept
        {
            destroy_rec(root);
            root = nullptr;
            node_count = 0;
            ++modifications;
        }

        /*────────────────────────────────────────────────────────────────────────────
          Navigation
          ──────────
          first()/last() throw NoSuchElement on an empty map; floor()/ceiling()
          return nullptr when no key qualifies.
         ───────────────────────────────────────────────────────────────────────────*/
        const NodeT &first() const
        {
            if (root == nullptr)
                throw NoSuchElement("first() on an empty TreeMap");
            return *rb::minimum(root);
        }

        const NodeT &last() const
        {
            if (root == nullptr)
                throw NoSuchElement("last() on an empty TreeMap");
            return *rb::maximum(root);
        }

        /* Greatest key <= k. */
        const NodeT *floor(const K &k) const
        {
            check_key(k);
            const NodeT *best = nullptr;
            const NodeT *n = root;
            while (n != nullptr)
            {
                if (comp(k, n->key))
                    n = n->left;
                else if (comp(n->key, k))
                {
                    best = n;
                    n = n->right;
                }
                else
                    return n;
            }
            return best;
        }

        /* Least key >= k. */
        const NodeT *ceiling(const K &k) const
        {
            check_key(k);
            const NodeT *best = nullptr;
            const NodeT *n = root;
            while (n != nullptr)
            {
                if (comp(k, n->key))
                {
                    best = n;
                    n = n->left;
                }
                else if (comp(n->key, k))
                    n = n->right;
                else
                    return n;
            }
            return best;
        }

        /* In-order successor of a node owned by this map. */
        static const NodeT *successor(const NodeT *n) noexcept { return rb::successor(n); }

        /*────────────────────────────────────────────────────────────────────────────
          validate
          ────────
          True when all red-black invariants hold: root BLACK, no RED node
          with a RED child, equal black-height on every path, strictly
          increasing in-order keys, and a node count matching size().
         ───────────────────────────────────────────────────────────────────────────*/
        bool validate() const
        {
            if (root == nullptr)
                return node_count == 0;
            if (root->parent != nullptr || root->color != Color::BLACK)
                return false;
            if (rb::black_height(root) < 0)
                return false;

            size_type seen = 0;
            const NodeT *prev = nullptr;
            for (const NodeT *n = rb::minimum(root); n != nullptr; n = rb::successor(n))
            {
                if (prev != nullptr && !comp(prev->key, n->key))
                    return false;
                prev = n;
                ++seen;
            }
            return seen == node_count;
        }

        /*===========================================================================
         *  const_iterator
         *===========================================================================
         *  Forward iterator in ascending key order.  Captures mod_count() when
         *  created and throws ConcurrentModification from operator* / ++ once
         *  the map has been structurally modified.
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
                    throw NoSuchElement("TreeMap iterator advanced past the end");
                node = rb::successor(node);
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
            friend class TreeMap;

            const_iterator(const TreeMap *m, const NodeT *n)
                : map(m), node(n), expected(m->modifications) {}

            void check() const
            {
                if (map != nullptr && map->modifications != expected)
                    throw ConcurrentModification("TreeMap modified during iteration");
            }

            const TreeMap *map{nullptr};
            const NodeT *node{nullptr};
            std::size_t expected{0};
        };

        const_iterator begin() const { return const_iterator(this, rb::minimum(root)); }
        const_iterator end() const { return const_iterator(this, nullptr); }

    private:
        NodeT *root{nullptr};
        Compare comp;
        size_type node_count{0};
        std::size_t modifications{0};

        void check_key(const K &k) const
        {
            if constexpr (!permits_absent_keys<Compare>::value)
            {
                if (detail::key_absent(k))
                    throw InvalidKey("absent key under natural ordering");
            }
            static_cast<void>(k);
        }

        /*────────────────────────────────────────────────────────────────────────────
         *  destroy_rec
         *  ------------------------------------------------------------------------
         *  Post-order free of a subtree: children first, then the node.
         *──────────────────────────────────────────────────────────────────────────*/
        static void destroy_rec(NodeT *n) noexcept
        {
            if (n == nullptr)
                return;
            destroy_rec(n->left);
            destroy_rec(n->right);
            delete n;
        }

        /*────────────────────────────────────────────────────────────────────────────
          delete_entry(p)
          ───────────────
          1. Two children → move the in-order successor's key/value into p and
             delete the successor instead (it has no left child).
          2. One child → splice the child into p's slot; if p was BLACK the
             child carries the missing black: erase_fixup(child).
          3. No child, not root → if p is BLACK run erase_fixup(p) while p is
             still linked (it plays the empty position), then detach it.
          4. No child, root → the tree becomes empty.
         ───────────────────────────────────────────────────────────────────────────*/
        void delete_entry(NodeT *p)
        {
            if (p->left != nullptr && p->right != nullptr)
            {
                NodeT *s = rb::successor(p);
                p->key = std::move(s->key);
                p->val = std::move(s->val);
                p = s;
            }

            NodeT *replacement = (p->left != nullptr ? p->left : p->right);

            if (replacement != nullptr)
            {
                replacement->parent = p->parent;
                if (p->parent == nullptr)
                    root = replacement;
                else if (p == p->parent->left)
                    p->parent->left = replacement;
                else
                    p->parent->right = replacement;

                p->left = p->right = p->parent = nullptr;

                if (p->color == Color::BLACK)
                    rb::erase_fixup(root, replacement);
            }
            else if (p->parent == nullptr)
            {
                root = nullptr;
            }
            else
            {
                if (p->color == Color::BLACK)
                    rb::erase_fixup(root, p);

                if (p->parent != nullptr)
                {
                    if (p == p->parent->left)
                        p->parent->left = nullptr;
                    else if (p == p->parent->right)
                        p->parent->right = nullptr;
                    p->parent = nullptr;
                }
            }

            delete p;
        }
    };

} // namespace mapcore

#endif // MAPCORE_TREE_MAP_HPP
