// binary_search_tree.hpp
// Unbalanced binary search tree ordered by a swappable three-way comparator.
// -----------------------------------------------------------
// * Compare is any callable Ordering(const T&, const T&) that is a strict
//   weak ordering over T.  Values comparing EQUAL are duplicates: only the
//   first one inserted is kept.
// * The comparator can be replaced at runtime with set_comparator().  The
//   tree does NOT re-sort itself; build a fresh tree with rebuild() when the
//   order changes.
// * No rebalancing.  Depth is bounded only by the number of values, so every
//   walk below uses an explicit stack rather than recursion.
// * Single-threaded; callers serialise access.

#ifndef BST_BINARY_SEARCH_TREE_HPP
#define BST_BINARY_SEARCH_TREE_HPP

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "three_way.hpp"

namespace bst
{

    /*-------------------------------------------------------------------------
     *  struct Node<T>
     *-------------------------------------------------------------------------
     *  value        – the stored value.  Overwritten only when a two-child
     *                 node takes over its in-order successor's value.
     *  left,right   – children, owned exclusively by this node.  No parent
     *                 link: erase() walks with a pointer to the incoming link
     *                 instead.
     *-------------------------------------------------------------------------*/
    template <typename T>
    struct Node
    {
        T value;

        Node *left{nullptr};
        Node *right{nullptr};

        explicit Node(const T &v) : value(v) {}
    };

    template <typename T, typename Compare = NaturalOrdering<T>>
    class BinarySearchTree
    {
    public:
        using NodeT = Node<T>;

        explicit BinarySearchTree(Compare c = Compare()) : comp(std::move(c)) {}

        ~BinarySearchTree() { destroy(root); }

        /*───────────────────────────────────────────────────────────────────────────
          Copy is deleted: the tree owns its node graph and a shallow copy would
          double-delete.  Moving hands the whole graph over and leaves the source
          empty (with its comparator intact).
         ──────────────────────────────────────────────────────────────────────────*/
        BinarySearchTree(const BinarySearchTree &) = delete;
        BinarySearchTree &operator=(const BinarySearchTree &) = delete;

        BinarySearchTree(BinarySearchTree &&other) noexcept
            : comp(other.comp), root(other.root), count(other.count)
        {
            other.root = nullptr;
            other.count = 0;
        }

        BinarySearchTree &operator=(BinarySearchTree &&other) noexcept
        {
            if (this != &other)
            {
                destroy(root);
                comp = other.comp;
                root = other.root;
                count = other.count;
                other.root = nullptr;
                other.count = 0;
            }
            return *this;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  INSERT
        //
        //  Descend from the root: LESS goes left, GREATER goes right.  The new
        //  node hangs off the first empty child slot.  EQUAL anywhere on the path
        //  aborts; the tree is unchanged and false is returned.
        // ────────────────────────────────────────────────────────────────────────
        bool insert(const T &value)
        {
            NodeT **link = &root;
            while (*link != nullptr)
            {
                const Ordering r = comp(value, (*link)->value);
                if (r == Ordering::EQUAL)
                    return false;
                link = (r == Ordering::LESS) ? &(*link)->left : &(*link)->right;
            }

            *link = new NodeT(value);
            ++count;
            return true;
        }

        bool contains(const T &value) const
        {
            const NodeT *n = root;
            while (n != nullptr)
            {
                const Ordering r = comp(value, n->value);
                if (r == Ordering::EQUAL)
                    return true;
                n = (r == Ordering::LESS) ? n->left : n->right;
            }
            return false;
        }

        // ────────────────────────────────────────────────────────────────────────
        //  ERASE
        //
        //  Removes the node comparing EQUAL to `value`; absent values are a
        //  no-op.  Three cases for the node z found:
        //    1. leaf            → its incoming link becomes null
        //    2. one child       → its incoming link adopts that child
        //    3. two children    → z takes the value of its in-order successor
        //                         (left-most node of z->right), and the
        //                         successor node, which has no left child, is
        //                         spliced out as in case 1 or 2.
        // ────────────────────────────────────────────────────────────────────────
        void erase(const T &value)
        {
            NodeT **link = &root;
            while (*link != nullptr)
            {
                const Ordering r = comp(value, (*link)->value);
                if (r == Ordering::EQUAL)
                    break;
                link = (r == Ordering::LESS) ? &(*link)->left : &(*link)->right;
            }

            NodeT *z = *link;
            if (z == nullptr)
                return;

            if (z->left != nullptr && z->right != nullptr)
            {
                NodeT **succ_link = minimum_link(&z->right);
                NodeT *succ = *succ_link;
                z->value = std::move(succ->value);
                *succ_link = succ->right;
                delete succ;
            }
            else
            {
                *link = (z->left != nullptr) ? z->left : z->right;
                delete z;
            }
            --count;
        }

        /*───────────────────────────────────────────────────────────────────────────
          Traversals
          ──────────
          Each returns a fully materialised copy of the values.
            in_order   – left, node, right: ascending under the comparator
            pre_order  – node, left, right: parents before children
            post_order – left, right, node: children before parents
         ──────────────────────────────────────────────────────────────────────────*/
        std::vector<T> in_order() const
        {
            std::vector<T> out;
            out.reserve(count);

            std::vector<const NodeT *> stack;
            const NodeT *n = root;
            while (n != nullptr || !stack.empty())
            {
                while (n != nullptr)
                {
                    stack.push_back(n);
                    n = n->left;
                }
                n = stack.back();
                stack.pop_back();
                out.push_back(n->value);
                n = n->right;
            }
            return out;
        }

        std::vector<T> pre_order() const
        {
            std::vector<T> out;
            out.reserve(count);
            walk_pre_order([&out](const NodeT &n, std::size_t)
                           { out.push_back(n.value); });
            return out;
        }

        std::vector<T> post_order() const
        {
            std::vector<T> out;
            out.reserve(count);

            std::vector<const NodeT *> stack;
            const NodeT *n = root;
            const NodeT *last = nullptr; // last node emitted
            while (n != nullptr || !stack.empty())
            {
                if (n != nullptr)
                {
                    stack.push_back(n);
                    n = n->left;
                    continue;
                }

                const NodeT *top = stack.back();
                if (top->right != nullptr && top->right != last)
                {
                    n = top->right; // right subtree not done yet
                }
                else
                {
                    out.push_back(top->value);
                    last = top;
                    stack.pop_back();
                }
            }
            return out;
        }

        /*  Replaces the comparator only.  Existing placements are left alone
            and may violate the new order until the tree is rebuilt.  */
        void set_comparator(Compare c) { comp = std::move(c); }

        const Compare &comparator() const noexcept { return comp; }

        /*───────────────────────────────────────────────────────────────────────────
          to_text
          ───────
          Diagnostic dump, pre-order, one line per node:
              - Milk (P2)
                - Bread (P1)
                - Eggs (P2)
          Two spaces of indent per level of depth; the node text is whatever
          operator<< prints for T.  An empty tree gives "".
         ──────────────────────────────────────────────────────────────────────────*/
        std::string to_text() const
        {
            std::ostringstream oss;
            bool first = true;
            walk_pre_order([&](const NodeT &n, std::size_t depth)
                           {
                if (!first)
                    oss << '\n';
                first = false;
                oss << std::string(depth * 2, ' ') << "- " << n.value; });
            return oss.str();
        }

        std::size_t size() const noexcept { return count; }
        bool empty() const noexcept { return count == 0; }

        /*  Number of nodes on the longest root-to-leaf path; 0 when empty.  */
        std::size_t height() const
        {
            std::size_t h = 0;
            walk_pre_order([&h](const NodeT &, std::size_t depth)
                           { h = std::max(h, depth + 1); });
            return h;
        }

        void clear() noexcept
        {
            destroy(root);
            root = nullptr;
            count = 0;
        }

        /*───────────────────────────────────────────────────────────────────────────
          validate
          ────────
          True iff the in-order sequence is strictly increasing under the
          current comparator (which is exactly the BST ordering property when
          duplicates are excluded) and the cached size matches the node count.
          Expected to fail after set_comparator() until the tree is rebuilt.
         ──────────────────────────────────────────────────────────────────────────*/
        bool validate() const
        {
            std::size_t seen = 0;
            const NodeT *prev = nullptr;

            std::vector<const NodeT *> stack;
            const NodeT *n = root;
            while (n != nullptr || !stack.empty())
            {
                while (n != nullptr)
                {
                    stack.push_back(n);
                    n = n->left;
                }
                n = stack.back();
                stack.pop_back();

                if (prev != nullptr && comp(prev->value, n->value) != Ordering::LESS)
                    return false;
                prev = n;
                ++seen;

                n = n->right;
            }
            return seen == count;
        }

    private:
        Compare comp;
        NodeT *root{nullptr};
        std::size_t count{0};

        /*  Visits every node parent-first, left before right, with its depth
            (root = 0).  */
        template <typename Visit>
        void walk_pre_order(Visit &&visit) const
        {
            std::vector<std::pair<const NodeT *, std::size_t>> stack;
            if (root != nullptr)
                stack.emplace_back(root, 0);

            while (!stack.empty())
            {
                const auto [n, depth] = stack.back();
                stack.pop_back();
                visit(*n, depth);

                // right pushed first so left is visited first
                if (n->right != nullptr)
                    stack.emplace_back(n->right, depth + 1);
                if (n->left != nullptr)
                    stack.emplace_back(n->left, depth + 1);
            }
        }

        /*  Link pointing at the left-most node of the non-empty subtree
            *link.  */
        static NodeT **minimum_link(NodeT **link)
        {
            while ((*link)->left != nullptr)
                link = &(*link)->left;
            return link;
        }

        /*  Frees a whole subtree.  Order is irrelevant since nothing is read
            after a node is deleted.  */
        static void destroy(NodeT *n) noexcept
        {
            std::vector<NodeT *> stack;
            if (n != nullptr)
                stack.push_back(n);
            while (!stack.empty())
            {
                NodeT *x = stack.back();
                stack.pop_back();
                if (x->left != nullptr)
                    stack.push_back(x->left);
                if (x->right != nullptr)
                    stack.push_back(x->right);
                delete x;
            }
        }
    };

    /*───────────────────────────────────────────────────────────────────────────
      rebuild
      ───────
      Fresh tree bound to `comp`, filled by inserting `values` in the given
      order.  Insertion order shapes the tree but never its in-order sequence.
      This is the only safe way to change the order of a populated tree.
     ──────────────────────────────────────────────────────────────────────────*/
    template <typename T, typename Compare>
    BinarySearchTree<T, Compare> rebuild(Compare comp, const std::vector<T> &values)
    {
        BinarySearchTree<T, Compare> tree(std::move(comp));
        for (const T &v : values)
            tree.insert(v);
        return tree;
    }

} // namespace bst

#endif // BST_BINARY_SEARCH_TREE_HPP
