// item.cpp
// Item construction, name normalisation and priority parsing.

#include "item.hpp"

#include <atomic>
#include <cctype>
#include <charconv>

namespace bst
{

    namespace
    {
        bool is_space(char c)
        {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        std::atomic<std::uint64_t> sequence_counter{0};

        /*  Lowercase form of one code point.  Covers ASCII, Latin-1
            Supplement and Latin Extended-A; everything else is returned
            unchanged.  */
        char32_t fold_case(char32_t cp)
        {
            if (cp >= U'A' && cp <= U'Z')
                return cp + 0x20;
            if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) // À..Þ, not ×
                return cp + 0x20;
            if (cp == 0x178) // Ÿ
                return 0xFF;
            // Latin Extended-A pairs: upper case is even up to U+0137, odd in
            // U+0139..U+0148, even again in U+014A..U+0177, odd in
            // U+0179..U+017E.  U+0130, U+0131, U+0138, U+0149, U+017F have no
            // simple pair.
            if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) ||
                (cp >= 0x14A && cp <= 0x177))
                return (cp % 2 == 0) ? cp + 1 : cp;
            if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E))
                return (cp % 2 == 1) ? cp + 1 : cp;
            return cp;
        }

        /*  Decodes one UTF-8 sequence at text[i] into cp and returns its
            length, or 0 if the bytes there are not a well-formed two- or
            three-byte sequence (ASCII is handled by the caller).  */
        size_t decode_utf8(std::string_view text, size_t i, char32_t &cp)
        {
            const auto byte = [&](size_t k)
            { return static_cast<unsigned char>(text[k]); };
            const auto continuation = [&](size_t k)
            { return k < text.size() && (byte(k) & 0xC0) == 0x80; };

            const unsigned char lead = byte(i);
            if ((lead & 0xE0) == 0xC0 && lead >= 0xC2 && continuation(i + 1))
            {
                cp = (char32_t(lead & 0x1F) << 6) | (byte(i + 1) & 0x3F);
                return 2;
            }
            if ((lead & 0xF0) == 0xE0 && continuation(i + 1) && continuation(i + 2))
            {
                cp = (char32_t(lead & 0x0F) << 12) | (char32_t(byte(i + 1) & 0x3F) << 6) |
                     (byte(i + 2) & 0x3F);
                return cp >= 0x800 ? 3 : 0;
            }
            return 0;
        }

        /*  Only ever called with code points below U+0800.  */
        void append_utf8(std::string &out, char32_t cp)
        {
            if (cp < 0x80)
            {
                out.push_back(static_cast<char>(cp));
                return;
            }
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    } // namespace

    std::string trim(std::string_view text)
    {
        size_t begin = 0;
        size_t end = text.size();
        while (begin < end && is_space(text[begin]))
            ++begin;
        while (end > begin && is_space(text[end - 1]))
            --end;
        return std::string(text.substr(begin, end - begin));
    }

    std::string normalize_key(std::string_view raw_name)
    {
        const std::string name = trim(raw_name);
        std::string key;
        key.reserve(name.size());

        size_t i = 0;
        while (i < name.size())
        {
            const unsigned char c = static_cast<unsigned char>(name[i]);
            if (c < 0x80)
            {
                key.push_back(static_cast<char>(fold_case(c)));
                ++i;
                continue;
            }

            char32_t cp = 0;
            const size_t len = decode_utf8(name, i, cp);
            if (len == 0)
            {
                key.push_back(name[i]); // stray byte: keep as is
                ++i;
            }
            else if (cp < 0x800)
            {
                append_utf8(key, fold_case(cp));
                i += len;
            }
            else
            {
                key.append(name, i, len); // outside the folded ranges
                i += len;
            }
        }
        return key;
    }

    int sanitize_priority(int priority) noexcept
    {
        if (priority < kHighestPriority || priority > kLowestPriority)
            return kLowestPriority;
        return priority;
    }

    int parse_priority(std::optional<std::string_view> raw)
    {
        if (!raw)
            return kLowestPriority;

        const std::string text = trim(*raw);
        if (text.empty())
            return kLowestPriority;

        const char *first = text.data();
        const char *last = text.data() + text.size();
        if (*first == '+') // from_chars rejects a leading plus
            ++first;

        int value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last)
            return kLowestPriority; // "abc", "2.5", "1e3", overflow
        return sanitize_priority(value);
    }

    std::uint64_t next_sequence() noexcept
    {
        return sequence_counter.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    Item::Item(std::string_view raw_name, std::string_view raw_priority)
        : Item(raw_name, parse_priority(raw_priority))
    {
    }

    Item::Item(std::string_view raw_name, int priority)
        : name_(trim(raw_name)),
          key_(normalize_key(raw_name)),
          priority_(sanitize_priority(priority)),
          created_at_(next_sequence())
    {
    }

    std::ostream &operator<<(std::ostream &os, const Item &item)
    {
        return os << item.name() << " (P" << item.priority() << ')';
    }

} // namespace bst
