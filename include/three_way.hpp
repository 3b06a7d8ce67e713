// three_way.hpp
// Three-way comparison result shared by the tree and the item strategies.

#ifndef BST_THREE_WAY_HPP
#define BST_THREE_WAY_HPP

#include <cstdint>

namespace bst
{

    enum class Ordering : int8_t
    {
        LESS = -1,
        EQUAL = 0,
        GREATER = 1
    };

    /*  Three-way compare of two values that already support operator<.  */
    template <typename T>
    Ordering three_way(const T &a, const T &b)
    {
        if (a < b)
            return Ordering::LESS;
        if (b < a)
            return Ordering::GREATER;
        return Ordering::EQUAL;
    }

    /*  Default comparator for BinarySearchTree: T's own operator<.  */
    template <typename T>
    struct NaturalOrdering
    {
        Ordering operator()(const T &a, const T &b) const { return three_way(a, b); }
    };

} // namespace bst

#endif // BST_THREE_WAY_HPP
