// ordering.hpp
// Three-way ordering strategies over Item, swappable at runtime.
// -----------------------------------------------------------
// Every strategy must be a strict weak ordering, and EQUAL must never hold
// between items with different keys: the tree uses EQUAL as its duplicate
// test, the registry uses the key, and the registry check runs first.  Both
// strategies below compare the lowercase name at some level, so EQUAL means
// same key, same priority and same created_at, i.e. the same record.

#ifndef BST_ORDERING_HPP
#define BST_ORDERING_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "item.hpp"
#include "three_way.hpp"

namespace bst
{

    enum class StrategyId : uint8_t
    {
        ByName,
        ByPriority
    };

    const char *to_string(StrategyId id);

    /*  "name" / "priority" (case-insensitive), otherwise nullopt.  */
    std::optional<StrategyId> parse_strategy_id(std::string_view text);

    class OrderingStrategy
    {
    public:
        virtual ~OrderingStrategy() = default;

        /*  Pure and deterministic: depends on the two items only.  */
        virtual Ordering compare(const Item &a, const Item &b) const = 0;
        virtual StrategyId id() const noexcept = 0;
    };

    /*  lowercase name, then priority, then created_at.  */
    class ByNameOrdering final : public OrderingStrategy
    {
    public:
        Ordering compare(const Item &a, const Item &b) const override;
        StrategyId id() const noexcept override { return StrategyId::ByName; }
    };

    /*  priority, then lowercase name, then created_at.  */
    class ByPriorityOrdering final : public OrderingStrategy
    {
    public:
        Ordering compare(const Item &a, const Item &b) const override;
        StrategyId id() const noexcept override { return StrategyId::ByPriority; }
    };

    std::shared_ptr<const OrderingStrategy> make_strategy(StrategyId id);

    /*-------------------------------------------------------------------------
     *  StrategyComparator
     *-------------------------------------------------------------------------
     *  Value-type handle on the active strategy, callable as
     *  Ordering(const Item&, const Item&).  BinarySearchTree stores it by
     *  value, so swapping strategies is just assigning a new handle.
     *-------------------------------------------------------------------------*/
    class StrategyComparator
    {
    public:
        explicit StrategyComparator(StrategyId id = StrategyId::ByName)
            : strategy_(make_strategy(id)) {}

        Ordering operator()(const Item &a, const Item &b) const
        {
            return strategy_->compare(a, b);
        }

        StrategyId id() const noexcept { return strategy_->id(); }

    private:
        std::shared_ptr<const OrderingStrategy> strategy_;
    };

} // namespace bst

#endif // BST_ORDERING_HPP
