// rb_algorithms.hpp
// Red-black tree primitives shared by TreeMap and the tree-form buckets of
// HashMap.
// -----------------------------------------------------------
// * Every helper is a free function template over a node type that exposes
//   `parent`, `left`, `right` (raw pointers) and `color` members, so the same
//   rotation / fix-up code rebalances both engines.
// * Absent children are nullptr.  There is no shared NIL sentinel: the
//   null-safe accessors below give an absent node the colour BLACK, which is
//   all the fix-ups need.
// * The root is passed by reference; rotations re-home it when the pivot was
//   the root.

#ifndef MAPCORE_RB_ALGORITHMS_HPP
#define MAPCORE_RB_ALGORITHMS_HPP

#include <cstdint>

namespace mapcore
{

    /*-------------------------------------------------------------------------
     *  enum Color
     *-------------------------------------------------------------------------
     *  • Each node is either RED or BLACK; these colours encode the RB-tree
     *    invariants that keep the structure (approximately) balanced.
     *  • Backed by uint8_t to keep node footprint small yet type-safe.
     *-------------------------------------------------------------------------*/
    enum class Color : uint8_t
    {
        RED,
        BLACK
    };

    namespace rb
    {

        /*===========================================================================
         *  Null-safe accessors
         *===========================================================================
         *  The fix-up loops walk through parents/uncles/nephews that may not
         *  exist.  Reading through these keeps the algorithms free of special
         *  cases: a missing node is BLACK, has no relatives, and ignores
         *  recolouring.
         *===========================================================================*/
        template <typename Node>
        inline Color color_of(const Node *p) noexcept
        {
            return p == nullptr ? Color::BLACK : p->color;
        }

        template <typename Node>
        inline Node *parent_of(Node *p) noexcept
        {
            return p == nullptr ? nullptr : p->parent;
        }

        template <typename Node>
        inline Node *left_of(Node *p) noexcept
        {
            return p == nullptr ? nullptr : p->left;
        }

        template <typename Node>
        inline Node *right_of(Node *p) noexcept
        {
            return p == nullptr ? nullptr : p->right;
        }

        template <typename Node>
        inline void set_color(Node *p, Color c) noexcept
        {
            if (p != nullptr)
                p->color = c;
        }

        /*===========================================================================
         *  Tree Rotations
         *===========================================================================
         *  Rotations preserve in-order key ordering while changing the tree's
         *  shape.  Three link pairs are re-pointed; O(1).
         *
         *  Left rotation:
         *          g              g
         *         /              /
         *        p              r
         *       / \    --->    / \
         *      α   r          p   γ
         *         / \        / \
         *        β   γ      α   β
         *
         *  Right rotation is the mirror image.
         *===========================================================================*/
        template <typename Node>
        void rotate_left(Node *&root, Node *p) noexcept
        {
            if (p == nullptr || p->right == nullptr)
                return;

            Node *r = p->right; // r will move up

            /* Step 1: r's LEFT subtree (β) becomes p's RIGHT subtree */
            p->right = r->left;
            if (r->left != nullptr)
                r->left->parent = p;

            /* Step 2: link p's parent to r */
            r->parent = p->parent;
            if (p->parent == nullptr) // p was root → r becomes new root
                root = r;
            else if (p->parent->left == p)
                p->parent->left = r;
            else
                p->parent->right = r;

            /* Step 3: put p on r's LEFT */
            r->left = p;
            p->parent = r;
        }

        template <typename Node>
        void rotate_right(Node *&root, Node *p) noexcept
        {
            if (p == nullptr || p->left == nullptr)
                return;

            Node *l = p->left; // l will move up

            p->left = l->right;
            if (l->right != nullptr)
                l->right->parent = p;

            l->parent = p->parent;
            if (p->parent == nullptr)
                root = l;
            else if (p->parent->right == p)
                p->parent->right = l;
            else
                p->parent->left = l;

            l->right = p;
            p->parent = l;
        }

        /* --------------------------------------------------------------------------
         *  RB-TREE INSERT FIX-UP
         *
         *  x :  The newly linked node.  It is coloured RED here, which keeps the
         *       black-height invariant by construction; only "a RED node has no
         *       RED child" can now be violated.
         *
         *  ── While x is not the root and x's parent is RED:
         *     Case 1:  Uncle is RED        → recolour parent & uncle BLACK, gp RED,
         *                                    continue fixing from gp.
         *     Case 2:  Uncle BLACK/absent and x is an "inner" grandchild
         *                                  → rotate at the parent to turn it
         *                                    into Case 3.
         *     Case 3:  Uncle BLACK/absent and x is an "outer" grandchild
         *                                  → recolour parent BLACK, gp RED,
         *                                    rotate gp away from x.
         *
         *  The root is forced BLACK at the end; Case 1 may have reddened it.
         * -------------------------------------------------------------------------- */
        template <typename Node>
        void insert_fixup(Node *&root, Node *x) noexcept
        {
            x->color = Color::RED;

            while (x != nullptr && x != root && x->parent->color == Color::RED)
            {
                /* ================================================================
                 *   PARENT IS LEFT CHILD  (mirror branch further below)
                 * ================================================================ */
                if (parent_of(x) == left_of(parent_of(parent_of(x))))
                {
                    Node *y = right_of(parent_of(parent_of(x))); // uncle

                    if (color_of(y) == Color::RED)
                    {
                        //        gp(B)            gp(R)
                        //       /     \          /     \
                        //   p(R)      y(R) →  p(B)     y(B)
                        //   /                  /
                        // x(R)               x(R)
                        set_color(parent_of(x), Color::BLACK);
                        set_color(y, Color::BLACK);
                        set_color(parent_of(parent_of(x)), Color::RED);
                        x = parent_of(parent_of(x));
                    }
                    else
                    {
                        if (x == right_of(parent_of(x))) // inner → outer
                        {
                            x = parent_of(x);
                            rotate_left(root, x);
                        }
                        set_color(parent_of(x), Color::BLACK);
                        set_color(parent_of(parent_of(x)), Color::RED);
                        rotate_right(root, parent_of(parent_of(x)));
                    }
                }
                /* ================================================================
                 *   PARENT IS RIGHT CHILD  (mirror of above)
                 * ================================================================ */
                else
                {
                    Node *y = left_of(parent_of(parent_of(x)));

                    if (color_of(y) == Color::RED)
                    {
                        set_color(parent_of(x), Color::BLACK);
                        set_color(y, Color::BLACK);
                        set_color(parent_of(parent_of(x)), Color::RED);
                        x = parent_of(parent_of(x));
                    }
                    else
                    {
                        if (x == left_of(parent_of(x)))
                        {
                            x = parent_of(x);
                            rotate_right(root, x);
                        }
                        set_color(parent_of(x), Color::BLACK);
                        set_color(parent_of(parent_of(x)), Color::RED);
                        rotate_left(root, parent_of(parent_of(x)));
                    }
                }
            }

            root->color = Color::BLACK;
        }

        /* --------------------------------------------------------------------------
         * Fix-up after RB-tree deletion
         *
         *  x  – the node that took the removed BLACK node's place.  When the
         *       removed node had no child, the caller passes the removed node
         *       itself while it is still linked: it stands in for the empty
         *       position (BLACK, right parent, right side) and is unlinked
         *       after this returns.
         *
         *  Case 1:  Sibling w is RED            -> recolour & rotate to make w BLACK
         *  Case 2:  w BLACK, both nephews BLACK -> w = RED, move the double-black
         *                                          up to the parent
         *  Case 3:  w BLACK, far nephew BLACK   -> rotate w toward x to convert
         *                                          to Case 4
         *  Case 4:  w BLACK, far nephew RED     -> w takes parent's colour,
         *                                          parent & far nephew BLACK,
         *                                          rotate parent toward x, done
         * -------------------------------------------------------------------------- */
        template <typename Node>
        void erase_fixup(Node *&root, Node *x) noexcept
        {
            while (x != root && color_of(x) == Color::BLACK)
            {
                // ─────────────────────────  x is LEFT child  ────────────────────────
                if (x == left_of(parent_of(x)))
                {
                    Node *w = right_of(parent_of(x));

                    if (color_of(w) == Color::RED) // Case 1
                    {
                        set_color(w, Color::BLACK);
                        set_color(parent_of(x), Color::RED);
                        rotate_left(root, parent_of(x));
                        w = right_of(parent_of(x));
                    }

                    if (color_of(left_of(w)) == Color::BLACK &&
                        color_of(right_of(w)) == Color::BLACK) // Case 2
                    {
                        set_color(w, Color::RED);
                        x = parent_of(x);
                    }
                    else
                    {
                        if (color_of(right_of(w)) == Color::BLACK) // Case 3
                        {
                            set_color(left_of(w), Color::BLACK);
                            set_color(w, Color::RED);
                            rotate_right(root, w);
                            w = right_of(parent_of(x));
                        }
                        // Case 4
                        set_color(w, color_of(parent_of(x)));
                        set_color(parent_of(x), Color::BLACK);
                        set_color(right_of(w), Color::BLACK);
                        rotate_left(root, parent_of(x));
                        x = root;
                    }
                }
                // ────────────────────────  x is RIGHT child (mirror)  ──────────────
                else
                {
                    Node *w = left_of(parent_of(x));

                    if (color_of(w) == Color::RED)
                    {
                        set_color(w, Color::BLACK);
                        set_color(parent_of(x), Color::RED);
                        rotate_right(root, parent_of(x));
                        w = left_of(parent_of(x));
                    }

                    if (color_of(right_of(w)) == Color::BLACK &&
                        color_of(left_of(w)) == Color::BLACK)
                    {
                        set_color(w, Color::RED);
                        x = parent_of(x);
                    }
                    else
                    {
                        if (color_of(left_of(w)) == Color::BLACK)
                        {
                            set_color(right_of(w), Color::BLACK);
                            set_color(w, Color::RED);
                            rotate_left(root, w);
                            w = left_of(parent_of(x));
                        }
                        set_color(w, color_of(parent_of(x)));
                        set_color(parent_of(x), Color::BLACK);
                        set_color(left_of(w), Color::BLACK);
                        rotate_right(root, parent_of(x));
                        x = root;
                    }
                }
            }

            set_color(x, Color::BLACK);
        }

        /*────────────────────────────────────────────────────────────────────────────
          minimum / maximum
          ─────────────────
          Left-most (right-most) node of the subtree rooted at `x`, or nullptr
          for an empty subtree.  O(height).
        ────────────────────────────────────────────────────────────────────────────*/
        template <typename Node>
        Node *minimum(Node *x) noexcept
        {
            if (x != nullptr)
                while (x->left != nullptr)
                    x = x->left;
            return x;
        }

        template <typename Node>
        Node *maximum(Node *x) noexcept
        {
            if (x != nullptr)
                while (x->right != nullptr)
                    x = x->right;
            return x;
        }

        /* In-order successor; nullptr after the maximum. */
        template <typename Node>
        Node *successor(Node *t) noexcept
        {
            if (t == nullptr)
                return nullptr;
            if (t->right != nullptr)
                return minimum(t->right);

            Node *p = t->parent;
            Node *ch = t;
            while (p != nullptr && ch == p->right)
            {
                ch = p;
                p = p->parent;
            }
            return p;
        }

        template <typename Node>
        Node *predecessor(Node *t) noexcept
        {
            if (t == nullptr)
                return nullptr;
            if (t->left != nullptr)
                return maximum(t->left);

            Node *p = t->parent;
            Node *ch = t;
            while (p != nullptr && ch == p->left)
            {
                ch = p;
                p = p->parent;
            }
            return p;
        }

        /*────────────────────────────────────────────────────────────────────────────
          black_height
          ────────────
          Checks the structural half of the red-black invariants on the
          subtree rooted at `n`:
            • every child's parent link points back at its parent;
            • a RED node has no RED child;
            • all paths to an empty position carry the same BLACK count.
          Returns that BLACK count (empty subtree = 0), or -1 on violation.
          Key ordering is checked by each engine with its own comparator.
         ───────────────────────────────────────────────────────────────────────────*/
        template <typename Node>
        int black_height(const Node *n) noexcept
        {
            if (n == nullptr)
                return 0;

            if (n->left != nullptr && n->left->parent != n)
                return -1;
            if (n->right != nullptr && n->right->parent != n)
                return -1;

            if (n->color == Color::RED &&
                (color_of(n->left) == Color::RED || color_of(n->right) == Color::RED))
                return -1;

            int lh = black_height(n->left);
            if (lh < 0)
                return -1;
            int rh = black_height(n->right);
            if (rh < 0 || lh != rh)
                return -1;

            return lh + (n->color == Color::BLACK ? 1 : 0);
        }

    } // namespace rb

} // namespace mapcore

#endif // MAPCORE_RB_ALGORITHMS_HPP
