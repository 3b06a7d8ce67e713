// command.cpp

#include "command.hpp"

#include <cctype>

#include "item.hpp"

namespace bst
{

    namespace
    {
        /*  "1", "+2" and so on; nullopt for anything outside the rank range
            or not a plain integer.  */
        std::optional<int> priority_token(std::string_view token)
        {
            if (!token.empty() && token.front() == '+')
                token.remove_prefix(1);
            if (token.empty() || token.size() > 2)
                return std::nullopt;

            int value = 0;
            for (char c : token)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return std::nullopt;
                value = value * 10 + (c - '0');
            }
            if (value < kHighestPriority || value > kLowestPriority)
                return std::nullopt;
            return value;
        }
    } // namespace

    CommandLine split_command(std::string_view line)
    {
        const std::string text = trim(line);
        const auto space = text.find_first_of(" \t");

        CommandLine cmd;
        cmd.verb = normalize_key(std::string_view(text).substr(0, space));
        if (space != std::string::npos)
            cmd.rest = trim(std::string_view(text).substr(space + 1));
        return cmd;
    }

    AddArguments parse_add_arguments(std::string_view rest)
    {
        AddArguments args;
        args.name = trim(rest);

        const auto cut = args.name.find_last_of(" \t");
        if (cut == std::string::npos)
            return args; // a lone token is always the name

        args.priority = priority_token(std::string_view(args.name).substr(cut + 1));
        if (args.priority)
            args.name = trim(std::string_view(args.name).substr(0, cut));
        return args;
    }

} // namespace bst
