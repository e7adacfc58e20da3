#include "MatchaUtil/Exceptions.h"

const char* Matcha::Exception::what() const throw()
{
    if (const std::string* msg = boost::get_error_info<errmsg_t>(*this)) {
        return msg->c_str();
    }
    return std::exception::what();
}

std::string Matcha::errmsg(const boost::exception& err)
{
    if (const std::string* msg = boost::get_error_info<errmsg_t>(err)) {
        return *msg;
    }
    return "";
}
