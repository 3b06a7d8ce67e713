// registry.cpp

#include "registry.hpp"

namespace bst
{

    bool Registry::put(const std::string &key, const Item &item)
    {
        return items.emplace(key, item).second;
    }

    bool Registry::remove(const std::string &key)
    {
        return items.erase(key) > 0;
    }

    bool Registry::has(const std::string &key) const
    {
        return items.find(key) != items.end();
    }

    std::optional<Item> Registry::get(const std::string &key) const
    {
        auto it = items.find(key);
        if (it == items.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<Item> Registry::values() const
    {
        std::vector<Item> out;
        out.reserve(items.size());
        for (const auto &[key, item] : items)
            out.push_back(item);
        return out;
    }

} // namespace bst
