// registry.hpp
// Exact-key index of every live item.  Source of truth for "which items
// exist" and the input of every tree rebuild.

#ifndef BST_REGISTRY_HPP
#define BST_REGISTRY_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "item.hpp"

namespace bst
{

    class Registry
    {
    public:
        /*  Adds key → item.  Returns false and changes nothing if key is
            already present.  */
        bool put(const std::string &key, const Item &item);

        /*  Returns false if key was not present.  */
        bool remove(const std::string &key);

        bool has(const std::string &key) const;

        /*  Copy of the stored item, or nullopt.  */
        std::optional<Item> get(const std::string &key) const;

        /*  Every stored item in the map's iteration order.  */
        std::vector<Item> values() const;

        std::size_t size() const noexcept { return items.size(); }
        bool empty() const noexcept { return items.empty(); }

    private:
        std::unordered_map<std::string, Item> items;
    };

} // namespace bst

#endif // BST_REGISTRY_HPP
