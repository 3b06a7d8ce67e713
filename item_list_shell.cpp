// item_list_shell.cpp
// Line-oriented front end for the item list.
// -----------------------------------------------------------
// Reads one command per line from stdin and answers with a tagged status
// line, the way a form UI would show a status bar:
//
//   add <name> [priority]     search <name>      delete <name>
//   order name|priority       inorder | preorder | postorder
//   tree                      help               quit
//
//   Build:  see CMakeLists.txt (target item_list_shell)

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "command.hpp"
#include "item_list.hpp"
#include "print.hpp"

namespace
{

    struct ShellConfig
    {
        bst::StrategyId initial_order = bst::StrategyId::ByName;
        bool echo_tree = false; // print the tree after every mutation
        bool prompt = true;
    };

    void print_usage(std::ostream &out, const char *argv0)
    {
        util::println(out, "usage: {} [--order=name|priority] [--echo-tree] [--no-prompt]", argv0);
    }

    void print_help()
    {
        util::println("commands:");
        util::println("  add <name> [priority]   priority 1 (high) .. 3 (low), default 3");
        util::println("  search <name>");
        util::println("  delete <name>");
        util::println("  order name|priority     rebuild the tree under a new order");
        util::println("  inorder | preorder | postorder");
        util::println("  tree                    print the tree structure");
        util::println("  quit");
    }

    /*  Returns nullopt after printing a message when argv is unusable.  */
    std::optional<ShellConfig> parse_args(int argc, char **argv)
    {
        ShellConfig config;
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            if (arg.rfind("--order=", 0) == 0)
            {
                auto id = bst::parse_strategy_id(arg.substr(8));
                if (!id)
                {
                    util::println(std::cerr, "unknown order '{}'", arg.substr(8));
                    return std::nullopt;
                }
                config.initial_order = *id;
            }
            else if (arg == "--echo-tree")
            {
                config.echo_tree = true;
            }
            else if (arg == "--no-prompt")
            {
                config.prompt = false;
            }
            else
            {
                util::println(std::cerr, "unknown option '{}'", arg);
                return std::nullopt;
            }
        }
        return config;
    }

    void print_items(const std::vector<bst::Item> &items)
    {
        if (items.empty())
        {
            util::println("(no results)");
            return;
        }
        for (const auto &item : items)
            util::println("{} (Priority {})", item.name(), item.priority());
    }

    void print_tree(const bst::ListState &state)
    {
        const std::string text = bst::dump_text(state);
        util::println("{}", text.empty() ? "(empty tree)" : text);
    }

    class Shell
    {
    public:
        explicit Shell(const ShellConfig &c) : config(c), state(c.initial_order) {}

        int run()
        {
            util::status(util::Level::info,
                         "Ready. Ordering by {}. Type 'help' for commands.",
                         bst::to_string(state.order()));

            std::string line;
            while (true)
            {
                if (config.prompt)
                    std::cout << "> " << std::flush;
                if (!std::getline(std::cin, line))
                    break;
                if (!dispatch(bst::trim(line)))
                    break;
            }
            return 0;
        }

    private:
        ShellConfig config;
        bst::ListState state;

        /*  Returns false on "quit".  */
        bool dispatch(const std::string &line)
        {
            if (line.empty())
                return true;

            const bst::CommandLine parsed = bst::split_command(line);
            const std::string &cmd = parsed.verb;
            const std::string &rest = parsed.rest;

            if (cmd == "quit" || cmd == "exit")
                return false;

            if (cmd == "add")
                do_add(rest);
            else if (cmd == "search")
                do_search(rest);
            else if (cmd == "delete")
                do_delete(rest);
            else if (cmd == "order")
                do_order(rest);
            else if (cmd == "inorder")
                do_traverse(bst::TraversalKind::InOrder);
            else if (cmd == "preorder")
                do_traverse(bst::TraversalKind::PreOrder);
            else if (cmd == "postorder")
                do_traverse(bst::TraversalKind::PostOrder);
            else if (cmd == "tree")
                print_tree(state);
            else if (cmd == "help")
                print_help();
            else
                util::status(util::Level::warn, "Unknown command '{}'. Type 'help'.", cmd);
            return true;
        }

        void do_add(const std::string &rest)
        {
            const bst::AddArguments args = bst::parse_add_arguments(rest);
            const int priority = args.priority.value_or(bst::kLowestPriority);

            switch (bst::add_item(state, args.name, priority))
            {
            case bst::AddResult::Added:
                util::status(util::Level::success, "Item added: {} (P{}).", args.name, priority);
                echo();
                break;
            case bst::AddResult::AlreadyExists:
                util::status(util::Level::warn, "\"{}\" is already in the list.", args.name);
                break;
            case bst::AddResult::InvalidName:
                util::status(util::Level::warn, "Enter an item name.");
                break;
            }
        }

        void do_search(const std::string &rest)
        {
            const std::string name = bst::trim(rest);
            switch (bst::search_item(state, name))
            {
            case bst::SearchResult::Found:
                util::status(util::Level::success, "\"{}\" is in the list.", name);
                break;
            case bst::SearchResult::NotFound:
                util::status(util::Level::error, "\"{}\" is not in the list.", name);
                break;
            case bst::SearchResult::InvalidName:
                util::status(util::Level::warn, "Enter an item name.");
                break;
            }
        }

        void do_delete(const std::string &rest)
        {
            const std::string name = bst::trim(rest);
            switch (bst::delete_item(state, name))
            {
            case bst::DeleteResult::Deleted:
                util::status(util::Level::success, "Item deleted: {}.", name);
                echo();
                break;
            case bst::DeleteResult::NotFound:
                util::status(util::Level::error, "Cannot delete: \"{}\" is not in the list.", name);
                break;
            case bst::DeleteResult::InvalidName:
                util::status(util::Level::warn, "Enter an item name.");
                break;
            }
        }

        void do_order(const std::string &rest)
        {
            auto id = bst::parse_strategy_id(rest);
            if (!id)
            {
                util::status(util::Level::warn, "Order must be 'name' or 'priority'.");
                return;
            }
            bst::change_ordering(state, *id);
            util::status(util::Level::info, "Ordering applied: {}.", bst::to_string(*id));
            echo();
        }

        void do_traverse(bst::TraversalKind kind)
        {
            print_items(bst::traverse(state, kind));
            util::status(util::Level::info, "Traversal: {}.", bst::to_string(kind));
        }

        void echo()
        {
            if (config.echo_tree)
                print_tree(state);
        }
    };

} // namespace

int main(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(std::cout, argv[0]);
            print_help();
            return 0;
        }
    }

    const std::optional<ShellConfig> config = parse_args(argc, argv);
    if (!config)
    {
        print_usage(std::cerr, argv[0]);
        return 2;
    }

    Shell shell(*config);
    return shell.run();
}
