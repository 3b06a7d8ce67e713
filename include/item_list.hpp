// item_list.hpp
// The operations a front end calls: add, search, delete, change order,
// traverse and dump.  All state lives in ListState, which the caller owns
// and passes in by reference.
// -----------------------------------------------------------
// Invariant kept by every mutation: the registry and the tree hold the same
// set of items.  The registry is checked first; the tree is only touched once
// the registry agrees, so a failed call leaves both unchanged.

#ifndef BST_ITEM_LIST_HPP
#define BST_ITEM_LIST_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "binary_search_tree.hpp"
#include "item.hpp"
#include "ordering.hpp"
#include "registry.hpp"

namespace bst
{

    using ItemTree = BinarySearchTree<Item, StrategyComparator>;

    /*  Adds `item` to the registry, then to the tree.  Returns false and
        leaves both unchanged if either refuses: the registry when the key is
        taken, the tree when an EQUAL record is already placed.  */
    bool register_item(Registry &registry, ItemTree &tree, const Item &item);

    enum class AddResult : uint8_t
    {
        Added,
        AlreadyExists,
        InvalidName
    };

    enum class SearchResult : uint8_t
    {
        Found,
        NotFound,
        InvalidName
    };

    enum class DeleteResult : uint8_t
    {
        Deleted,
        NotFound,
        InvalidName
    };

    enum class TraversalKind : uint8_t
    {
        InOrder,
        PreOrder,
        PostOrder
    };

    const char *to_string(AddResult r);
    const char *to_string(SearchResult r);
    const char *to_string(DeleteResult r);
    const char *to_string(TraversalKind k);

    /*-------------------------------------------------------------------------
     *  ListState
     *-------------------------------------------------------------------------
     *  The registry and tree are only reachable read-only from outside; the
     *  operations below are the only writers.  That keeps the two in step
     *  and makes change_ordering() the only way to switch order (a bare
     *  set_comparator() on the tree would strand misplaced nodes).
     *-------------------------------------------------------------------------*/
    class ListState
    {
    public:
        explicit ListState(StrategyId order = StrategyId::ByName)
            : tree_(StrategyComparator(order)) {}

        const Registry &registry() const noexcept { return registry_; }
        const ItemTree &tree() const noexcept { return tree_; }

        StrategyId order() const noexcept { return tree_.comparator().id(); }

    private:
        Registry registry_;
        ItemTree tree_;

        friend AddResult add_item(ListState &state, std::string_view name, int priority);
        friend DeleteResult delete_item(ListState &state, std::string_view name);
        friend void change_ordering(ListState &state, StrategyId id);
    };

    /*  priority is parsed with parse_priority(); bad or missing input
        silently becomes kLowestPriority.  */
    AddResult add_item(ListState &state, std::string_view name,
                       std::optional<std::string_view> priority = std::nullopt);
    AddResult add_item(ListState &state, std::string_view name, int priority);

    SearchResult search_item(const ListState &state, std::string_view name);
    DeleteResult delete_item(ListState &state, std::string_view name);

    /*  Rebuilds the tree from the registry under the new strategy.  Always
        rebuilds, even when `id` is already active.  */
    void change_ordering(ListState &state, StrategyId id);

    std::vector<Item> traverse(const ListState &state, TraversalKind kind);

    std::string dump_text(const ListState &state);

} // namespace bst

#endif // BST_ITEM_LIST_HPP
