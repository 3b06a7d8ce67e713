// item_list.cpp

#include "item_list.hpp"

namespace bst
{

    const char *to_string(AddResult r)
    {
        switch (r)
        {
        case AddResult::Added:
            return "added";
        case AddResult::AlreadyExists:
            return "already exists";
        case AddResult::InvalidName:
            return "invalid name";
        }
        return "invalid name";
    }

    const char *to_string(SearchResult r)
    {
        switch (r)
        {
        case SearchResult::Found:
            return "found";
        case SearchResult::NotFound:
            return "not found";
        case SearchResult::InvalidName:
            return "invalid name";
        }
        return "invalid name";
    }

    const char *to_string(DeleteResult r)
    {
        switch (r)
        {
        case DeleteResult::Deleted:
            return "deleted";
        case DeleteResult::NotFound:
            return "not found";
        case DeleteResult::InvalidName:
            return "invalid name";
        }
        return "invalid name";
    }

    const char *to_string(TraversalKind k)
    {
        switch (k)
        {
        case TraversalKind::InOrder:
            return "in-order";
        case TraversalKind::PreOrder:
            return "pre-order";
        case TraversalKind::PostOrder:
            return "post-order";
        }
        return "in-order";
    }

    bool register_item(Registry &registry, ItemTree &tree, const Item &item)
    {
        if (!registry.put(item.key(), item))
            return false;
        if (!tree.insert(item))
        {
            registry.remove(item.key());
            return false;
        }
        return true;
    }

    AddResult add_item(ListState &state, std::string_view name,
                       std::optional<std::string_view> priority)
    {
        return add_item(state, name, parse_priority(priority));
    }

    AddResult add_item(ListState &state, std::string_view name, int priority)
    {
        if (normalize_key(name).empty())
            return AddResult::InvalidName;

        const Item item(name, priority);
        return register_item(state.registry_, state.tree_, item) ? AddResult::Added
                                                                 : AddResult::AlreadyExists;
    }

    SearchResult search_item(const ListState &state, std::string_view name)
    {
        const std::string key = normalize_key(name);
        if (key.empty())
            return SearchResult::InvalidName;
        return state.registry().has(key) ? SearchResult::Found : SearchResult::NotFound;
    }

    DeleteResult delete_item(ListState &state, std::string_view name)
    {
        const std::string key = normalize_key(name);
        if (key.empty())
            return DeleteResult::InvalidName;

        // The tree finds nodes by comparison, so it needs the stored record
        // (same priority and created_at), not one rebuilt from `name`.
        std::optional<Item> item = state.registry_.get(key);
        if (!item)
            return DeleteResult::NotFound;

        state.tree_.erase(*item);
        state.registry_.remove(key);
        return DeleteResult::Deleted;
    }

    void change_ordering(ListState &state, StrategyId id)
    {
        state.tree_ = rebuild(StrategyComparator(id), state.registry_.values());
    }

    std::vector<Item> traverse(const ListState &state, TraversalKind kind)
    {
        switch (kind)
        {
        case TraversalKind::InOrder:
            return state.tree().in_order();
        case TraversalKind::PreOrder:
            return state.tree().pre_order();
        case TraversalKind::PostOrder:
            return state.tree().post_order();
        }
        return state.tree().in_order();
    }

    std::string dump_text(const ListState &state)
    {
        return state.tree().to_text();
    }

} // namespace bst
