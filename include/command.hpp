// command.hpp
// Grammar of the shell's command lines, kept out of the shell so it can be
// tested on its own.

#ifndef BST_COMMAND_HPP
#define BST_COMMAND_HPP

#include <optional>
#include <string>
#include <string_view>

namespace bst
{

    /*  "Add  Whole Milk 2" → verb "add", rest "Whole Milk 2".  The verb is
        lowercased; rest keeps its case but is trimmed.  */
    struct CommandLine
    {
        std::string verb;
        std::string rest;
    };

    CommandLine split_command(std::string_view line);

    /*-------------------------------------------------------------------------
     *  parse_add_arguments
     *-------------------------------------------------------------------------
     *  Splits the arguments of "add" into a name and an optional priority.
     *  The last whitespace-separated token is taken as the priority only
     *  when something precedes it and it is an integer in
     *  [kHighestPriority, kLowestPriority], optionally with a '+' sign.  Any
     *  other trailing token stays part of the name, so "Route 66",
     *  "Milk 2.5" and "Tea -1" are names, and nothing typed is dropped.
     *-------------------------------------------------------------------------*/
    struct AddArguments
    {
        std::string name;
        std::optional<int> priority;
    };

    AddArguments parse_add_arguments(std::string_view rest);

} // namespace bst

#endif // BST_COMMAND_HPP
