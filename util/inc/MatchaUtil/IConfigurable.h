#ifndef MATCHA_ICONFIGURABLE
#define MATCHA_ICONFIGURABLE

#include "MatchaUtil/Configuration.h"

#include <memory>

namespace Matcha {

    /** Interface to something that can be configured.

        The usual sequence is to get the default configuration, update it
        with the user's values and pass the result to configure():

            auto cfg = obj.default_configuration();
            obj.configure(update(cfg, user_cfg));
     */
    class IConfigurable {
       public:
        typedef std::shared_ptr<IConfigurable> pointer;

        virtual ~IConfigurable() {}

        /// Return a configuration holding every parameter with its default.
        virtual Configuration default_configuration() const = 0;

        /// Accept a configuration.  Raise ConfigurationError if illegal.
        virtual void configure(const Configuration& config) = 0;
    };

}  // namespace Matcha

#endif
