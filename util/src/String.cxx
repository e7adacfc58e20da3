#include "MatchaUtil/String.h"

std::pair<std::string, std::string> Matcha::String::parse_pair(const std::string& in, const std::string& delim)
{
    const size_t pos = in.find(delim);
    if (pos == std::string::npos) {
        return std::make_pair(in, std::string(""));
    }
    return std::make_pair(in.substr(0, pos), in.substr(pos + delim.size()));
}

bool Matcha::String::startswith(const std::string& whole, const std::string& part)
{
    return boost::algorithm::starts_with(whole, part);
}
