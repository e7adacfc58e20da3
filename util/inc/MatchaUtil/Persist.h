/** Load and save JSON configuration and data.
 */

#ifndef MATCHA_PERSIST
#define MATCHA_PERSIST

#include "MatchaUtil/Configuration.h"

#include <string>

namespace Matcha::Persist {

    /// Return true if file exists.
    bool exists(const std::string& filename);

    /// Parse JSON text.  Raises ConfigurationError on a parse error.
    Configuration loads(const std::string& text);

    /// Load a JSON file.  Raises IOError if the file can not be read and
    /// ConfigurationError if it does not parse.
    Configuration load(const std::string& filename);

    /// Serialize to JSON text.
    std::string dumps(const Configuration& cfg, bool pretty = false);

    /// Save to a JSON file.  The filename "-" means stdout.  Raises IOError
    /// on failure to write.
    void dump(const std::string& filename, const Configuration& cfg, bool pretty = false);

}  // namespace Matcha::Persist

#endif
