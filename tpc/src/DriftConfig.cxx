#include "MatchaTpc/DriftConfig.h"
#include "MatchaUtil/Exceptions.h"

#include <cmath>

using namespace Matcha;

DriftConfig::DriftConfig()
  : m_bounds(default_tpc_boundaries)
{
}

DriftConfig::DriftConfig(double drift_velocity, const tpc_boundaries_t& bounds)
{
    set_boundaries(bounds);
    set_drift_velocity(drift_velocity);
}

DriftConfig::~DriftConfig() {}

Configuration DriftConfig::default_configuration() const
{
    Configuration cfg;
    assign(cfg["boundaries"], default_tpc_boundaries);
    cfg["drift_velocity"] = Json::nullValue;
    return cfg;
}

void DriftConfig::configure(const Configuration& cfg)
{
    if (!cfg.isObject()) {
        raise<ConfigurationError>("DriftConfig: configuration must be a JSON object");
    }

    // validate everything before changing anything
    std::optional<tpc_boundaries_t> bounds;
    auto jbounds = cfg["boundaries"];
    if (!jbounds.isNull()) {
        if (!jbounds.isArray() || (int) jbounds.size() != ntpc_regions - 1) {
            raise<ConfigurationError>("DriftConfig: \"boundaries\" must be an array of %d numbers",
                                      ntpc_regions - 1);
        }
        bounds = tpc_boundaries_t{};
        for (int ind = 0; ind < ntpc_regions - 1; ++ind) {
            if (!jbounds[ind].isNumeric()) {
                raise<ConfigurationError>("DriftConfig: boundary %d is not a number", ind);
            }
            (*bounds)[ind] = convert<double>(jbounds[ind]);
        }
        check_boundaries(*bounds);
    }

    // A missing key keeps the current velocity, an explicit null unsets it.
    const bool have_velocity = cfg.isMember("drift_velocity");
    auto jvel = cfg["drift_velocity"];
    if (have_velocity && !jvel.isNull()) {
        if (!jvel.isNumeric()) {
            raise<ConfigurationError>("DriftConfig: \"drift_velocity\" must be a number");
        }
        check_drift_velocity(jvel.asDouble());
    }

    if (bounds) {
        m_bounds = *bounds;
    }
    if (have_velocity) {
        if (jvel.isNull()) {
            m_drift_velocity.reset();
        }
        else {
            m_drift_velocity = jvel.asDouble();
        }
    }
}

double DriftConfig::drift_velocity() const
{
    if (!m_drift_velocity) {
        raise<ConfigurationError>("DriftConfig: drift velocity is not set");
    }
    return *m_drift_velocity;
}

void DriftConfig::set_drift_velocity(double v)
{
    check_drift_velocity(v);
    m_drift_velocity = v;
}

void DriftConfig::set_boundaries(const tpc_boundaries_t& bounds)
{
    check_boundaries(bounds);
    m_bounds = bounds;
}

void DriftConfig::check_drift_velocity(double v)
{
    if (!std::isfinite(v) || v <= 0) {
        raise<ConfigurationError>("DriftConfig: illegal drift velocity %f", v);
    }
}

void DriftConfig::check_boundaries(const tpc_boundaries_t& bounds)
{
    for (int ind = 0; ind < ntpc_regions - 1; ++ind) {
        if (!std::isfinite(bounds[ind])) {
            raise<ConfigurationError>("DriftConfig: boundary %d is not finite", ind);
        }
        if (ind && bounds[ind] <= bounds[ind - 1]) {
            raise<ConfigurationError>("DriftConfig: boundaries not ascending at %d: %f <= %f",
                                      ind, bounds[ind], bounds[ind - 1]);
        }
    }
}
