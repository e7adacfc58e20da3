/** Matcha configuration is a JSON object held as a Json::Value.

    The helpers here convert JSON values to C++ types and give dotted-path
    access into nested objects, eg "drift.velocity".
 */

#ifndef MATCHA_CONFIGURATION
#define MATCHA_CONFIGURATION

#include "MatchaUtil/Exceptions.h"

#include <json/json.h>

#include <boost/algorithm/string.hpp>

#include <array>
#include <string>
#include <vector>

namespace Matcha {

    typedef Json::Value Configuration;

    /// Convert a configuration value to a particular type.  A null value
    /// gives def.
    template <typename T>
    T convert(const Configuration& /*cfg*/, const T& def = T())
    {
        return def;
    }
    template <>
    inline bool convert<bool>(const Configuration& cfg, const bool& def)
    {
        if (cfg.isNull()) {
            return def;
        }
        return cfg.asBool();
    }
    template <>
    inline double convert<double>(const Configuration& cfg, const double& def)
    {
        if (cfg.isNull()) {
            return def;
        }
        return cfg.asDouble();
    }

    /// Merge dictionary b into a, return a.  Object values in b are
    /// merged recursively, everything else in b replaces what is in a.
    Configuration update(Configuration& a, Configuration& b);
    Configuration update(Configuration& a, const Configuration& b);

    /// Return the value at the dotpath converted to type T or def if
    /// there is no value there.
    template <typename T>
    T get(Configuration cfg, const std::string& dotpath, const T& def = T())
    {
        std::vector<std::string> path;
        boost::algorithm::split(path, dotpath, boost::algorithm::is_any_of("."));
        for (auto name : path) {
            if (!cfg.isMember(name)) {
                return def;
            }
            cfg = cfg[name];
        }
        return convert<T>(cfg, def);
    }

    /// Assign a fixed size array to a configuration value.
    template <typename T, size_t N>
    void assign(Configuration& cfg, const std::array<T, N>& arr)
    {
        cfg = Json::arrayValue;
        for (const auto& one : arr) {
            cfg.append(one);
        }
    }

}  // namespace Matcha

#endif
