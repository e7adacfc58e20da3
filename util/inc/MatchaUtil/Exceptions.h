/** Matcha exceptions.

    All exceptions thrown by Matcha code derive from Matcha::Exception which
    is both a std::exception and a boost::exception.  Throw them with raise()
    so that the message and the throw location are attached:

        raise<ValueError>("bad value %f for %s", value, name);

    Catch by the most specific type that the caller can do something about.
    The message is available from what() or errmsg().
 */

#ifndef MATCHA_EXCEPTIONS
#define MATCHA_EXCEPTIONS

#include "MatchaUtil/String.h"

#include <boost/exception/all.hpp>
#include <boost/throw_exception.hpp>

#include <exception>
#include <string>

namespace Matcha {

    typedef boost::error_info<struct tag_errmsg, std::string> errmsg_t;

    /// The base exception.
    struct Exception : virtual public std::exception, virtual public boost::exception {
        char const* what() const throw();
    };

    /// Thrown for something wrong with a value.
    struct ValueError : virtual public Exception {
    };

    /// Thrown for an index out of range.
    struct IndexError : virtual public Exception {
    };

    /// Thrown for a missing key or name.
    struct KeyError : virtual public Exception {
    };

    /// Thrown for a failure reading or writing data.
    struct IOError : virtual public Exception {
    };

    /// Thrown when a required configuration parameter is missing or
    /// illegal at the time it is used.
    struct ConfigurationError : virtual public ValueError {
    };

    /// Return the message attached to the exception, or empty string.
    std::string errmsg(const boost::exception& err);

    template <class E, typename... Args>
    void raise(const std::string& form, Args... args)
    {
        E err;
        err << errmsg_t{String::format(form, args...)};
        BOOST_THROW_EXCEPTION(err);
    }

    template <class E>
    void raise(const std::string& msg)
    {
        E err;
        err << errmsg_t{msg};
        BOOST_THROW_EXCEPTION(err);
    }

}  // namespace Matcha

#endif
