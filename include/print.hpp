#ifndef UTIL_PRINT_HPP
#define UTIL_PRINT_HPP

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace util
{

/*  Status levels for user-facing messages.  The shell colours nothing; the
 *  level only decides the tag and the default stream.  */
enum class Level : uint8_t
{
    info,
    success,
    warn,
    error
};

inline const char* to_string(Level level)
{
    switch (level)
    {
    case Level::info:    return "info";
    case Level::success: return "success";
    case Level::warn:    return "warn";
    case Level::error:   return "error";
    }
    return "info";
}

namespace detail
{

template <typename T>
std::string to_string(const T& value)
{
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

/*  Replaces each "{}" in template_str with the next argument, in order.
 *  Surplus placeholders expand to nothing, surplus arguments are dropped.  */
template <typename... Args>
std::string format(const std::string& template_str, const Args&... args)
{
    std::ostringstream stream;
    std::vector<std::string> arg_list = {to_string(args)...};

    size_t start_pos = 0;
    size_t arg_index = 0;
    while (start_pos < template_str.size())
    {
        size_t open_brace = template_str.find("{}", start_pos);
        if (open_brace == std::string::npos)
        {
            stream << template_str.substr(start_pos);
            break;
        }

        stream << template_str.substr(start_pos, open_brace - start_pos);
        if (arg_index < arg_list.size())
            stream << arg_list[arg_index++];

        start_pos = open_brace + 2;
    }

    return stream.str();
}

// The empty pack cannot initialise the vector above.
inline std::string format(const std::string& template_str)
{
    return template_str;
}

}  // namespace detail

template <typename... Args>
void println(std::ostream& out, const std::string& message, const Args&... args)
{
    out << detail::format(message, args...) << '\n';
}

template <typename... Args>
void println(const std::string& message, const Args&... args)
{
    println(std::cout, message, args...);
}

/*  "[warn] text" style line.  */
template <typename... Args>
void status(std::ostream& out, Level level, const std::string& message,
            const Args&... args)
{
    out << '[' << to_string(level) << "] " << detail::format(message, args...)
        << '\n';
}

template <typename... Args>
void status(Level level, const std::string& message, const Args&... args)
{
    std::ostream& out = (level == Level::warn || level == Level::error)
                            ? std::cerr
                            : std::cout;
    status(out, level, message, args...);
}

}  // namespace util

#endif  // UTIL_PRINT_HPP
