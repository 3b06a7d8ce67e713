// item_list_test.cpp
// End-to-end checks of the list operations a front end drives.
// -------------------------------------------------------------------
// Build: see CMakeLists.txt (target item_list_test)

#undef NDEBUG // the asserts are the test

#include <cassert>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "command.hpp"
#include "item_list.hpp"

using bst::AddResult;
using bst::DeleteResult;
using bst::ListState;
using bst::SearchResult;
using bst::StrategyId;
using bst::TraversalKind;

namespace
{

    std::vector<std::string> in_order_names(const ListState &state)
    {
        std::vector<std::string> out;
        for (const auto &item : bst::traverse(state, TraversalKind::InOrder))
            out.push_back(item.name());
        return out;
    }

    /*  Registry and tree agree: same size, same keys, tree ordered.  */
    void check_consistent(const ListState &state)
    {
        const auto in = bst::traverse(state, TraversalKind::InOrder);
        const auto pre = bst::traverse(state, TraversalKind::PreOrder);
        const auto post = bst::traverse(state, TraversalKind::PostOrder);

        assert(in.size() == state.registry().size());
        assert(pre.size() == state.registry().size());
        assert(post.size() == state.registry().size());
        for (const auto &item : in)
            assert(state.registry().has(item.key()));
        assert(state.tree().validate());
    }

    void add_groceries(ListState &state)
    {
        assert(bst::add_item(state, "Milk", 2) == AddResult::Added);
        assert(bst::add_item(state, "Bread", 1) == AddResult::Added);
        assert(bst::add_item(state, "Eggs", 2) == AddResult::Added);
    }

    void test_add_by_name()
    {
        ListState state;
        assert(state.order() == StrategyId::ByName);
        add_groceries(state);

        const auto items = bst::traverse(state, TraversalKind::InOrder);
        assert(items.size() == 3);
        assert(items[0].name() == "Bread" && items[0].priority() == 1);
        assert(items[1].name() == "Eggs" && items[1].priority() == 2);
        assert(items[2].name() == "Milk" && items[2].priority() == 2);

        assert(bst::dump_text(state) == "- Milk (P2)\n"
                                        "  - Bread (P1)\n"
                                        "    - Eggs (P2)");
        check_consistent(state);
        std::cout << "  ✔ Milk, Bread, Eggs by name → Bread, Eggs, Milk\n";
    }

    void test_change_ordering()
    {
        ListState state;
        add_groceries(state);
        assert(bst::add_item(state, "Apples", 3) == AddResult::Added);
        assert(bst::add_item(state, "tea", 1) == AddResult::Added);

        bst::change_ordering(state, StrategyId::ByPriority);
        assert(state.order() == StrategyId::ByPriority);
        assert((in_order_names(state) ==
                std::vector<std::string>{"Bread", "tea", "Eggs", "Milk", "Apples"}));
        check_consistent(state);

        // same strategy again is a plain rebuild
        bst::change_ordering(state, StrategyId::ByPriority);
        assert(state.tree().size() == 5);

        bst::change_ordering(state, StrategyId::ByName);
        assert((in_order_names(state) ==
                std::vector<std::string>{"Apples", "Bread", "Eggs", "Milk", "tea"}));
        check_consistent(state);

        std::cout << "  ✔ changing the order rebuilds the tree from the registry\n";
    }

    void test_delete_and_readd()
    {
        ListState state;
        add_groceries(state);

        assert(bst::delete_item(state, "Bread") == DeleteResult::Deleted);
        assert(bst::search_item(state, "Bread") == SearchResult::NotFound);
        assert((in_order_names(state) == std::vector<std::string>{"Eggs", "Milk"}));
        check_consistent(state);

        assert(bst::add_item(state, "Bread", 3) == AddResult::Added);
        assert(bst::search_item(state, "bread") == SearchResult::Found);
        assert(state.registry().get("bread")->priority() == 3);
        check_consistent(state);

        assert(bst::delete_item(state, "Butter") == DeleteResult::NotFound);
        assert(state.registry().size() == 3);

        std::cout << "  ✔ deleted items are gone and can be added again\n";
    }

    void test_delete_after_reorder()
    {
        // erase has to find the node under whatever order is active
        ListState state(StrategyId::ByPriority);
        add_groceries(state);
        assert(bst::add_item(state, "Jam", 3) == AddResult::Added);
        assert(bst::add_item(state, "Coffee", 1) == AddResult::Added);

        bst::change_ordering(state, StrategyId::ByName);
        assert(bst::delete_item(state, "MILK") == DeleteResult::Deleted);
        bst::change_ordering(state, StrategyId::ByPriority);
        assert(bst::delete_item(state, "coffee") == DeleteResult::Deleted);

        assert((in_order_names(state) == std::vector<std::string>{"Bread", "Eggs", "Jam"}));
        check_consistent(state);

        std::cout << "  ✔ delete works under either order\n";
    }

    void test_delete_inner_nodes()
    {
        ListState state;
        for (const char *name : {"M", "F", "T", "C", "H", "P", "W", "G", "K"})
            assert(bst::add_item(state, name, 2) == AddResult::Added);

        assert(bst::delete_item(state, "M") == DeleteResult::Deleted); // root, two children
        assert(bst::delete_item(state, "F") == DeleteResult::Deleted); // two children
        assert(bst::delete_item(state, "C") == DeleteResult::Deleted); // leaf
        assert(bst::delete_item(state, "W") == DeleteResult::Deleted); // leaf
        assert((in_order_names(state) == std::vector<std::string>{"G", "H", "K", "P", "T"}));
        check_consistent(state);

        std::cout << "  ✔ two-child deletions keep the registry and tree in step\n";
    }

    void test_case_insensitive_identity()
    {
        ListState state;
        add_groceries(state);

        assert(bst::add_item(state, "milk", 1) == AddResult::AlreadyExists);
        assert(bst::add_item(state, "  MILK  ") == AddResult::AlreadyExists);
        assert(state.registry().size() == 3);
        assert(state.registry().get("milk")->priority() == 2);

        assert(bst::search_item(state, "  eGGs ") == SearchResult::Found);
        assert(bst::delete_item(state, "EGGS") == DeleteResult::Deleted);
        check_consistent(state);

        std::cout << "  ✔ identity is the trimmed, case-insensitive name\n";
    }

    void test_accented_identity()
    {
        ListState state;
        assert(bst::add_item(state, "Ñoquis", 1) == AddResult::Added);
        assert(bst::add_item(state, "ñoquis", 2) == AddResult::AlreadyExists);
        assert(bst::add_item(state, "ÉCLAIR") == AddResult::Added);
        assert(bst::search_item(state, "éclair") == SearchResult::Found);
        assert(bst::add_item(state, "Łódź", 2) == AddResult::Added);
        assert(bst::add_item(state, "łÓDŹ") == AddResult::AlreadyExists);
        assert(state.registry().size() == 3);
        assert(state.registry().get("ñoquis")->name() == "Ñoquis");

        assert(bst::delete_item(state, "ÑOQUIS") == DeleteResult::Deleted);
        check_consistent(state);

        assert(bst::normalize_key("  ÀÉÎÕÜ Ÿ ") == "àéîõü ÿ");
        assert(bst::normalize_key("Ĳ Ĺ Ŋ Ž") == "ĳ ĺ ŋ ž");
        assert(bst::normalize_key("×÷ß") == "×÷ß");   // no case
        assert(bst::normalize_key("ΑΒΓ") == "ΑΒΓ");   // outside the folded ranges
        assert(bst::normalize_key("a\xC3") == "a\xC3"); // truncated sequence kept

        std::cout << "  ✔ accented capitals share a key with their lowercase form\n";
    }

    void test_add_arguments()
    {
        const auto args = [](const char *rest) { return bst::parse_add_arguments(rest); };

        auto a = args("  Whole Milk 2 ");
        assert(a.name == "Whole Milk" && a.priority == 2);
        a = args("Tea +1");
        assert(a.name == "Tea" && a.priority == 1);
        a = args("Bread");
        assert(a.name == "Bread" && !a.priority);

        // trailing tokens that are not a rank stay in the name
        a = args("Route 66");
        assert(a.name == "Route 66" && !a.priority);
        a = args("Milk 2.5");
        assert(a.name == "Milk 2.5" && !a.priority);
        a = args("Tea -1");
        assert(a.name == "Tea -1" && !a.priority);
        a = args("Jam 4");
        assert(a.name == "Jam 4" && !a.priority);
        a = args("7");
        assert(a.name == "7" && !a.priority);
        a = args("");
        assert(a.name.empty() && !a.priority);

        const bst::CommandLine c = bst::split_command("  ADD\tRoute 66  ");
        assert(c.verb == "add" && c.rest == "Route 66");
        const bst::CommandLine q = bst::split_command("quit");
        assert(q.verb == "quit" && q.rest.empty());

        ListState state;
        a = args("Route 66");
        assert(bst::add_item(state, a.name, a.priority.value_or(bst::kLowestPriority)) ==
               AddResult::Added);
        assert(bst::search_item(state, "route 66") == SearchResult::Found);
        assert(bst::search_item(state, "Route") == SearchResult::NotFound);

        std::cout << "  ✔ add arguments keep every typed token\n";
    }

    void test_register_rolls_back()
    {
        bst::Registry registry;
        bst::ItemTree tree;
        const bst::Item tea("Tea", 1);

        // tree already holds the record: registry must not keep the entry
        assert(tree.insert(tea));
        assert(!bst::register_item(registry, tree, tea));
        assert(registry.empty() && tree.size() == 1);

        // key already registered: tree untouched
        bst::Registry taken;
        bst::ItemTree empty_tree;
        assert(taken.put(tea.key(), tea));
        assert(!bst::register_item(taken, empty_tree, bst::Item("TEA", 2)));
        assert(taken.size() == 1 && empty_tree.empty());

        bst::Registry fresh;
        bst::ItemTree fresh_tree;
        assert(bst::register_item(fresh, fresh_tree, tea));
        assert(fresh.has("tea") && fresh_tree.contains(tea));

        std::cout << "  ✔ a refused insert leaves registry and tree unchanged\n";
    }

    void test_state_is_read_only()
    {
        static_assert(std::is_same_v<decltype(std::declval<ListState &>().tree()),
                                     const bst::ItemTree &>,
                      "tree must not be mutable from outside");
        static_assert(std::is_same_v<decltype(std::declval<ListState &>().registry()),
                                     const bst::Registry &>,
                      "registry must not be mutable from outside");
        std::cout << "  ✔ list state exposes registry and tree read-only\n";
    }

    void test_invalid_input()
    {
        ListState state;
        add_groceries(state);

        assert(bst::add_item(state, "") == AddResult::InvalidName);
        assert(bst::add_item(state, "   \t", 1) == AddResult::InvalidName);
        assert(bst::search_item(state, " ") == SearchResult::InvalidName);
        assert(bst::delete_item(state, "\n") == DeleteResult::InvalidName);
        assert(state.registry().size() == 3);

        // bad priorities are not errors, they become the lowest rank
        assert(bst::add_item(state, "  Tea  ", "abc") == AddResult::Added);
        assert(bst::add_item(state, "Jam") == AddResult::Added);
        assert(bst::add_item(state, "Salt", 9) == AddResult::Added);
        assert(bst::add_item(state, "Coffee", " 1 ") == AddResult::Added);
        assert(state.registry().get("tea")->name() == "Tea");
        assert(state.registry().get("tea")->priority() == 3);
        assert(state.registry().get("jam")->priority() == 3);
        assert(state.registry().get("salt")->priority() == 3);
        assert(state.registry().get("coffee")->priority() == 1);
        check_consistent(state);

        std::cout << "  ✔ blank names are rejected, bad priorities default\n";
    }

    void test_empty_list()
    {
        ListState state;
        assert(bst::dump_text(state).empty());
        assert(bst::traverse(state, TraversalKind::PostOrder).empty());
        bst::change_ordering(state, StrategyId::ByPriority);
        assert(state.tree().empty());
        assert(bst::search_item(state, "x") == SearchResult::NotFound);

        assert(std::string(bst::to_string(AddResult::AlreadyExists)) == "already exists");
        assert(std::string(bst::to_string(TraversalKind::PreOrder)) == "pre-order");
        std::cout << "  ✔ empty list behaves\n";
    }

} // namespace

int main()
{
    std::cout << "[ITEM LIST]\n";
    test_add_by_name();
    test_change_ordering();
    test_delete_and_readd();
    test_delete_after_reorder();
    test_delete_inner_nodes();
    test_case_insensitive_identity();
    test_accented_identity();
    test_invalid_input();
    test_add_arguments();
    test_register_rolls_back();
    test_state_is_read_only();
    test_empty_list();

    std::cout << "🎉 ALL ITEM LIST TESTS PASSED\n";
    return 0;
}
