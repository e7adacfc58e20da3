#ifndef MATCHA_STRING
#define MATCHA_STRING

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include <string>
#include <utility>

namespace Matcha::String {

    /// Split once on delim, returning the two halves.  The second is empty
    /// if delim is not found.
    std::pair<std::string, std::string> parse_pair(const std::string& in, const std::string& delim = ":");

    bool startswith(const std::string& whole, const std::string& part);

    // format a string using boost::format's "%" markers

    inline boost::format format_flatten(boost::format f) { return f; }

    template <typename TYPE>
    boost::format format_flatten(boost::format start, TYPE o)
    {
        return start % o;
    }

    template <typename TYPE, typename... MORE>
    boost::format format_flatten(boost::format start, TYPE o, MORE... objs)
    {
        auto next = start % o;
        return format_flatten(next, objs...);
    }

    /// Eg: format("a %s c", "b") or format("%2%b%1%", "a", "c")
    template <typename... TYPES>
    std::string format(const std::string& form, TYPES... objs)
    {
        auto final = format_flatten(boost::format(form), objs...);
        return final.str();
    }

}  // namespace Matcha::String

#endif
