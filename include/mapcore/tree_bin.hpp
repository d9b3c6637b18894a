// tree_bin.hpp
// Tree-form hash buckets.
// -----------------------------------------------------------
// A bucket normally holds a singly linked chain of nodes (`next`).  When a
// chain grows long in a large enough table the same nodes are additionally
// linked into a red-black tree ordered by fingerprint, then by operator< when
// the key type has one.  The `next` chain is kept alive alongside the tree
// (with `prev` back links) so that iteration, resize splitting and demotion
// never need to walk the tree.
//
// Nodes are never re-allocated by promotion or demotion; only their tree
// links change.  Every helper is a template over the node type, which must
// provide: hash, key, next, prev, parent, left, right, color.

#ifndef MAPCORE_TREE_BIN_HPP
#define MAPCORE_TREE_BIN_HPP

#include <cstddef>
#include <cstdint>
#include <utility>

#include "config.hpp"
#include "key_traits.hpp"
#include "rb_algorithms.hpp"

namespace mapcore
{

    /* Observable state of one bucket. */
    enum class BinKind : uint8_t
    {
        Empty,
        List,
        Tree
    };

    /*-------------------------------------------------------------------------
     *  struct Bin<NodeT>
     *-------------------------------------------------------------------------
     *  head – first node of the `next` chain (owning); nullptr when empty.
     *  root – red-black root while the bucket is tree-form, else nullptr.
     *  tree – bucket form flag.
     *-------------------------------------------------------------------------*/
    template <typename NodeT>
    struct Bin
    {
        NodeT *head{nullptr};
        NodeT *root{nullptr};
        bool tree{false};

        BinKind kind() const noexcept
        {
            if (head == nullptr)
                return BinKind::Empty;
            return tree ? BinKind::Tree : BinKind::List;
        }
    };

    namespace tree_bin
    {

        /* Secondary ordering for equal fingerprints: -1/0/1 through
           operator< when available, 0 ("no opinion") otherwise. */
        template <typename K>
        int compare_keys(const K &a, const K &b)
        {
            if constexpr (has_less<K>::value)
            {
                if (a < b)
                    return -1;
                if (b < a)
                    return 1;
            }
            static_cast<void>(a);
            static_cast<void>(b);
            return 0;
        }

        /* Keys with equal fingerprints and no ordering go left.  Any
           consistent choice works: lookups search both subtrees in that
           situation. */
        constexpr int tie_break_order() noexcept { return -1; }

        /*────────────────────────────────────────────────────────────────────────────
          find(p, h, k)
          ─────────────
          Searches the subtree rooted at `p` for key `k` with fingerprint `h`.
          Descends by fingerprint, then by operator<; when neither decides,
          the right subtree is searched recursively and the walk continues
          left.
         ───────────────────────────────────────────────────────────────────────────*/
        template <typename NodeT, typename K, typename KeyEqual>
        NodeT *find(NodeT *p, std::size_t h, const K &k, const KeyEqual &eq)
        {
            while (p != nullptr)
            {
                NodeT *pl = p->left;
                NodeT *pr = p->right;
                int dir = 0;

                if (p->hash > h)
                    p = pl;
                else if (p->hash < h)
                    p = pr;
                else if (eq(p->key, k))
                    return p;
                else if (pl == nullptr)
                    p = pr;
                else if (pr == nullptr)
                    p = pl;
                else if ((dir = compare_keys(k, p->key)) != 0)
                    p = (dir < 0) ? pl : pr;
                else if (NodeT *q = find(pr, h, k, eq))
                    return q;
                else
                    p = pl;
            }
            return nullptr;
        }

        /*────────────────────────────────────────────────────────────────────────────
          treeify(bin)
          ────────────
          Links every node of the bucket's chain into a fresh red-black tree.
          The chain order (and `head`) is left as it is; `prev` back links
          are rebuilt.
         ───────────────────────────────────────────────────────────────────────────*/
        template <typename NodeT>
        void treeify(Bin<NodeT> &bin) noexcept
        {
            NodeT *root = nullptr;
            NodeT *prev = nullptr;

            for (NodeT *x = bin.head; x != nullptr; x = x->next)
            {
                x->prev = prev;
                prev = x;
                x->left = x->right = nullptr;

                if (root == nullptr)
                {
                    x->parent = nullptr;
                    x->color = Color::BLACK;
                    root = x;
                    continue;
                }

                for (NodeT *p = root;;)
                {
                    int dir;
                    if (p->hash > x->hash)
                        dir = -1;
                    else if (p->hash < x->hash)
                        dir = 1;
                    else if ((dir = compare_keys(x->key, p->key)) == 0)
                        dir = tie_break_order();

                    NodeT *xp = p;
                    p = (dir <= 0) ? p->left : p->right;
                    if (p == nullptr)
                    {
                        x->parent = xp;
                        if (dir <= 0)
                            xp->left = x;
                        else
                            xp->right = x;
                        rb::insert_fixup(root, x);
                        break;
                    }
                }
            }

            bin.root = root;
            bin.tree = true;
        }

        /* Drops the tree links; the `next` chain becomes the bucket again. */
        template <typename NodeT>
        void untreeify(Bin<NodeT> &bin) noexcept
        {
            for (NodeT *x = bin.head; x != nullptr; x = x->next)
            {
                x->parent = x->left = x->right = x->prev = nullptr;
                x->color = Color::RED;
            }
            bin.root = nullptr;
            bin.tree = false;
        }

        /*────────────────────────────────────────────────────────────────────────────
          put(bin, h, k, eq, make_node)
          ─────────────────────────────
          Tree-form counterpart of the chain walk in HashMap::put.
          Returns {existing node, false} when `k` is present.  Otherwise calls
          make_node() once, links the result into the tree and into the chain
          right after its tree parent, rebalances, and returns {node, true}.
         ───────────────────────────────────────────────────────────────────────────*/
        template <typename NodeT, typename K, typename KeyEqual, typename MakeNode>
        std::pair<NodeT *, bool> put(Bin<NodeT> &bin, std::size_t h, const K &k,
                                     const KeyEqual &eq, MakeNode &&make_node)
        {
            bool searched = false;
            for (NodeT *p = bin.root;;)
            {
                int dir;
                if (p->hash > h)
                    dir = -1;
                else if (p->hash < h)
                    dir = 1;
                else if (eq(p->key, k))
                    return {p, false};
                else if ((dir = compare_keys(k, p->key)) == 0)
                {
                    // equal fingerprint and no ordering: the key may sit on
                    // either side, look once before picking a side
                    if (!searched)
                    {
                        searched = true;
                        NodeT *q = nullptr;
                        if ((p->left != nullptr && (q = find(p->left, h, k, eq)) != nullptr) ||
                            (p->right != nullptr && (q = find(p->right, h, k, eq)) != nullptr))
                            return {q, false};
                    }
                    dir = tie_break_order();
                }

                NodeT *xp = p;
                p = (dir <= 0) ? p->left : p->right;
                if (p == nullptr)
                {
                    NodeT *x = make_node();
                    NodeT *xpn = xp->next;

                    if (dir <= 0)
                        xp->left = x;
                    else
                        xp->right = x;

                    x->next = xpn;
                    xp->next = x;
                    x->parent = x->prev = xp;
                    if (xpn != nullptr)
                        xpn->prev = x;

                    NodeT *root = bin.root;
                    rb::insert_fixup(root, x);
                    bin.root = root;
                    return {x, true};
                }
            }
        }

        /*────────────────────────────────────────────────────────────────────────────
          remove(bin, p)
          ──────────────
          Unlinks `p` from both the chain and the tree.  The node is not freed.

          Unlike TreeMap, a two-child node cannot take over its successor's
          key/value: other structures (the order-tracking overlay, the chain)
          hold the node itself.  So p and its successor s swap *positions*
          (links and colours) and p is then removed from s's old spot, where
          it has at most one child.

          The bucket stays tree-form even when it gets small; only a resize
          split turns a tree back into a list.
         ───────────────────────────────────────────────────────────────────────────*/
        template <typename NodeT>
        void remove(Bin<NodeT> &bin, NodeT *p) noexcept
        {
            /* 1. chain unlink */
            NodeT *succ = p->next;
            NodeT *pred = p->prev;
            if (pred == nullptr)
                bin.head = succ;
            else
                pred->next = succ;
            if (succ != nullptr)
                succ->prev = pred;
            p->next = p->prev = nullptr;

            if (bin.head == nullptr)
            {
                p->parent = p->left = p->right = nullptr;
                bin.root = nullptr;
                bin.tree = false;
                return;
            }

            /* 2. tree unlink */
            NodeT *root = bin.root;
            NodeT *pl = p->left;
            NodeT *pr = p->right;
            NodeT *replacement;

            if (pl != nullptr && pr != nullptr)
            {
                NodeT *s = pr;
                while (s->left != nullptr) // successor
                    s = s->left;

                std::swap(s->color, p->color);

                NodeT *sr = s->right;
                NodeT *pp = p->parent;

                if (s == pr) // p was s's direct parent
                {
                    p->parent = s;
                    s->right = p;
                }
                else
                {
                    NodeT *sp = s->parent;
                    p->parent = sp;
                    if (sp != nullptr)
                    {
                        if (s == sp->left)
                            sp->left = p;
                        else
                            sp->right = p;
                    }
                    s->right = pr;
                    pr->parent = s;
                }

                p->left = nullptr;
                p->right = sr;
                if (sr != nullptr)
                    sr->parent = p;

                s->left = pl;
                pl->parent = s;

                s->parent = pp;
                if (pp == nullptr)
                    root = s;
                else if (p == pp->left)
                    pp->left = s;
                else
                    pp->right = s;

                replacement = (sr != nullptr) ? sr : p;
            }
            else if (pl != nullptr)
                replacement = pl;
            else if (pr != nullptr)
                replacement = pr;
            else
                replacement = p;

            if (replacement != p)
            {
                NodeT *pp = p->parent;
                replacement->parent = pp;
                if (pp == nullptr)
                    root = replacement;
                else if (p == pp->left)
                    pp->left = replacement;
                else
                    pp->right = replacement;
                p->left = p->right = p->parent = nullptr;
            }

            /* 3. rebalance; p still stands in for the empty slot if it had
                  no child */
            if (p->color == Color::BLACK)
                rb::erase_fixup(root, replacement);

            if (replacement == p)
            {
                NodeT *pp = p->parent;
                p->parent = nullptr;
                if (pp != nullptr)
                {
                    if (p == pp->left)
                        pp->left = nullptr;
                    else if (p == pp->right)
                        pp->right = nullptr;
                }
            }

            if (root != nullptr)
                root->color = Color::BLACK;
            bin.root = root;
        }

        /*────────────────────────────────────────────────────────────────────────────
          split(bin, lo, hi, bit)
          ───────────────────────
          Resize step for a tree-form bucket.  `bit` is the old capacity:
          nodes with (hash & bit) == 0 go to `lo` (same index), the others to
          `hi` (index + bit).  Chain order is preserved.  Each half holding
          at most UNTREEIFY_THRESHOLD nodes becomes a list; a larger half is
          re-treeified, unless the other half is empty, in which case the old
          tree moved over whole and is still valid.
         ───────────────────────────────────────────────────────────────────────────*/
        template <typename NodeT>
        void split(Bin<NodeT> &bin, Bin<NodeT> &lo, Bin<NodeT> &hi, std::size_t bit) noexcept
        {
            NodeT *lo_head = nullptr, *lo_tail = nullptr;
            NodeT *hi_head = nullptr, *hi_tail = nullptr;
            int lc = 0, hc = 0;

            for (NodeT *e = bin.head, *next; e != nullptr; e = next)
            {
                next = e->next;
                e->next = nullptr;
                if ((e->hash & bit) == 0)
                {
                    e->prev = lo_tail;
                    if (lo_tail == nullptr)
                        lo_head = e;
                    else
                        lo_tail->next = e;
                    lo_tail = e;
                    ++lc;
                }
                else
                {
                    e->prev = hi_tail;
                    if (hi_tail == nullptr)
                        hi_head = e;
                    else
                        hi_tail->next = e;
                    hi_tail = e;
                    ++hc;
                }
            }

            auto settle = [&bin](Bin<NodeT> &half, NodeT *head, int n, bool other_empty)
            {
                half.head = head;
                if (n <= UNTREEIFY_THRESHOLD)
                    untreeify(half);
                else if (other_empty)
                {
                    half.root = bin.root;
                    half.tree = true;
                }
                else
                    treeify(half);
            };

            if (lo_head != nullptr)
                settle(lo, lo_head, lc, hi_head == nullptr);
            if (hi_head != nullptr)
                settle(hi, hi_head, hc, lo_head == nullptr);

            bin = Bin<NodeT>{};
        }

        /*────────────────────────────────────────────────────────────────────────────
          check(bin)
          ──────────
          Structural self-check of a tree-form bucket: chain `prev` links,
          root colour and parent, red-black shape, fingerprint order in-order,
          and that the tree holds exactly the chain's nodes.
         ───────────────────────────────────────────────────────────────────────────*/
        template <typename NodeT>
        bool check(const Bin<NodeT> &bin)
        {
            std::size_t chain = 0;
            const NodeT *prev = nullptr;
            for (const NodeT *e = bin.head; e != nullptr; e = e->next)
            {
                if (e->prev != prev)
                    return false;
                prev = e;
                ++chain;
            }

            const NodeT *root = bin.root;
            if (root == nullptr || root->parent != nullptr || root->color != Color::BLACK)
                return false;
            if (rb::black_height(root) < 0)
                return false;

            std::size_t in_tree = 0;
            const NodeT *last = nullptr;
            for (const NodeT *n = rb::minimum(root); n != nullptr; n = rb::successor(n))
            {
                if (last != nullptr && last->hash > n->hash)
                    return false;
                last = n;
                ++in_tree;
            }
            return in_tree == chain;
        }

    } // namespace tree_bin

} // namespace mapcore

#endif // MAPCORE_TREE_BIN_HPP
