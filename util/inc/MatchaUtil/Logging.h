#ifndef MATCHA_LOGGING
#define MATCHA_LOGGING

#include "MatchaUtil/Spdlog.h"

#include <memory>
#include <string>

namespace Matcha {

    namespace Log {

        typedef std::shared_ptr<spdlog::logger> logptr_t;
        typedef std::shared_ptr<spdlog::sinks::sink> sinkptr_t;

        // Sinks added here are shared by the default logger and by every
        // logger made afterward by logger().  There are none until an
        // application adds one.  The level is optional.

        void add_file(std::string filename, std::string level = "");
        void add_stdout(bool color = true, std::string level = "");
        void add_stderr(bool color = true, std::string level = "");

        // Return the named logger, making it on the shared sinks if it does
        // not yet exist.  Library code holds on to one with a short name.
        logptr_t logger(std::string name);

        // Set the level of all loggers if which is empty, else of the named
        // logger.  Raises ValueError on an unknown level name.
        void set_level(std::string level, std::string which = "");

        // A logger with no level of its own takes that of the explicitly
        // set logger whose name is its longest prefix, so "-L apps:debug"
        // reaches "apps.shift".
        void fill_levels();

    }  // namespace Log

}  // namespace Matcha

#endif
