// item.hpp
// The record stored in the list: a named item with an urgency rank.
// -----------------------------------------------------------
// * Immutable after construction.  Deleting an item removes it by identity,
//   it is never edited in place.
// * Identity is the case-insensitive, trimmed name (see normalize_key()).
// * created_at comes from a process-wide logical clock and is only used as
//   the last tie-breaker by the ordering strategies.

#ifndef BST_ITEM_HPP
#define BST_ITEM_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace bst
{

    /*  Rank 1 is the most urgent; anything we cannot read becomes the least
        urgent rank.  */
    constexpr int kHighestPriority = 1;
    constexpr int kLowestPriority = 3;

    /*  Strips leading/trailing ASCII whitespace.  */
    std::string trim(std::string_view text);

    /*  Registry key for a raw name: trimmed, then lowercased.  UTF-8 input
        is folded for ASCII, Latin-1 Supplement and Latin Extended-A, so
        "Ñoquis" and "ñoquis" share a key.  Other code points and malformed
        bytes pass through unchanged.  */
    std::string normalize_key(std::string_view raw_name);

    /*-------------------------------------------------------------------------
     *  parse_priority
     *-------------------------------------------------------------------------
     *  Accepts an optionally signed decimal integer surrounded by whitespace.
     *  Returns it if it lies in [kHighestPriority, kLowestPriority], otherwise
     *  kLowestPriority.  Absent, empty and non-numeric input also map to
     *  kLowestPriority.  Never throws.
     *-------------------------------------------------------------------------*/
    int parse_priority(std::optional<std::string_view> raw);
    int sanitize_priority(int priority) noexcept;

    /*  Next tick of the logical clock shared by every Item in the process.  */
    std::uint64_t next_sequence() noexcept;

    class Item
    {
    public:
        Item(std::string_view raw_name, std::string_view raw_priority);
        Item(std::string_view raw_name, int priority);

        const std::string &name() const noexcept { return name_; }
        int priority() const noexcept { return priority_; }
        std::uint64_t created_at() const noexcept { return created_at_; }

        /*  Lowercased name; equal keys mean the same item.  */
        const std::string &key() const noexcept { return key_; }

    private:
        std::string name_;
        std::string key_;
        int priority_;
        std::uint64_t created_at_;
    };

    /*  "Milk (P2)"  */
    std::ostream &operator<<(std::ostream &os, const Item &item);

} // namespace bst

#endif // BST_ITEM_HPP
