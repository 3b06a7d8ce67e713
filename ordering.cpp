// ordering.cpp

#include "ordering.hpp"

namespace bst
{

    namespace
    {
        /*  Last tie-break of both strategies.  Only reached for two records
            with the same key and priority.  */
        Ordering by_creation(const Item &a, const Item &b)
        {
            return three_way(a.created_at(), b.created_at());
        }
    } // namespace

    const char *to_string(StrategyId id)
    {
        switch (id)
        {
        case StrategyId::ByName:
            return "name";
        case StrategyId::ByPriority:
            return "priority";
        }
        return "name";
    }

    std::optional<StrategyId> parse_strategy_id(std::string_view text)
    {
        const std::string key = normalize_key(text);
        if (key == "name")
            return StrategyId::ByName;
        if (key == "priority")
            return StrategyId::ByPriority;
        return std::nullopt;
    }

    Ordering ByNameOrdering::compare(const Item &a, const Item &b) const
    {
        Ordering r = three_way(a.key(), b.key());
        if (r != Ordering::EQUAL)
            return r;
        r = three_way(a.priority(), b.priority());
        if (r != Ordering::EQUAL)
            return r;
        return by_creation(a, b);
    }

    Ordering ByPriorityOrdering::compare(const Item &a, const Item &b) const
    {
        Ordering r = three_way(a.priority(), b.priority());
        if (r != Ordering::EQUAL)
            return r;
        r = three_way(a.key(), b.key());
        if (r != Ordering::EQUAL)
            return r;
        return by_creation(a, b);
    }

    std::shared_ptr<const OrderingStrategy> make_strategy(StrategyId id)
    {
        // Stateless, so one instance of each is enough for the whole process.
        static const auto by_name = std::make_shared<const ByNameOrdering>();
        static const auto by_priority = std::make_shared<const ByPriorityOrdering>();

        switch (id)
        {
        case StrategyId::ByName:
            return by_name;
        case StrategyId::ByPriority:
            return by_priority;
        }
        return by_name;
    }

} // namespace bst
