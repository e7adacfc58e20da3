#include "MatchaApps/TrackPointShifter.h"

using namespace Matcha;
using namespace Matcha::Apps;

TrackPointShifter::TrackPointShifter()
  : log(Log::logger("apps"))
{
}

TrackPointShifter::~TrackPointShifter() {}

Configuration TrackPointShifter::default_configuration() const
{
    Configuration cfg = m_drift.default_configuration();
    cfg["skip_undefined"] = m_skip_undefined;
    return cfg;
}

void TrackPointShifter::configure(const Configuration& cfg)
{
    if (!cfg.isObject()) {
        raise<ConfigurationError>("TrackPointShifter: configuration must be a JSON object");
    }
    auto jskip = cfg["skip_undefined"];
    if (!jskip.isNull() && !jskip.isBool()) {
        raise<ConfigurationError>("TrackPointShifter: \"skip_undefined\" must be true or false");
    }
    m_drift.configure(cfg);
    m_skip_undefined = get(cfg, "skip_undefined", m_skip_undefined);
}

size_t TrackPointShifter::shift(std::vector<TrackPoint>& points, double t0) const
{
    // fail on an unset velocity before touching any point
    const double velocity = m_drift.drift_velocity();

    // in strict mode reject the batch before touching any point
    if (!m_skip_undefined) {
        for (const auto& tp : points) {
            if (!tp.has_drift_direction()) {
                raise<UndefinedDriftDirection>("track %d point at x=%f in %s has no drift direction to shift along",
                                               tp.track_id(), tp.position_x(), region_name(tp.region()));
            }
        }
    }

    m_nskipped = 0;
    size_t nshifted = 0;
    for (auto& tp : points) {
        if (!tp.has_drift_direction() && m_skip_undefined) {
            SPDLOG_LOGGER_DEBUG(log, "skip shift of track {} point in {}", tp.track_id(), tp.region());
            ++m_nskipped;
            continue;
        }
        tp.shift_position_x(t0, velocity);
        ++nshifted;
    }
    log->debug("shifted {} of {} points by t0={} us at {} cm/us", nshifted, points.size(), t0, velocity);
    return nshifted;
}
