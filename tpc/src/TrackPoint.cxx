#include "MatchaTpc/TrackPoint.h"
#include "MatchaTpc/DriftConfig.h"
#include "MatchaUtil/Logging.h"

using namespace Matcha;

static Log::logptr_t tpc_log()
{
    static Log::logptr_t log = Log::logger("tpc");
    return log;
}

TrackPoint::TrackPoint(int track_id,
                       double position_x, double position_y, double position_z,
                       double direction_x, double direction_y, double direction_z,
                       const tpc_boundaries_t& bounds)
  : m_track_id(track_id)
  , m_position_x(position_x)
  , m_position_y(position_y)
  , m_position_z(position_z)
  , m_direction_x(direction_x)
  , m_direction_y(direction_y)
  , m_direction_z(direction_z)
  , m_bounds(bounds)
{
    reclassify();
}

void TrackPoint::reclassify()
{
    m_region = classify_region(m_position_x, m_bounds);
    m_drift_direction = Matcha::drift_direction(m_region);
}

void TrackPoint::shift_position_x(double t0, double drift_velocity)
{
    if (!m_drift_direction) {
        raise<UndefinedDriftDirection>("track %d point at x=%f in %s has no drift direction to shift along",
                                       m_track_id, m_position_x, region_name(m_region));
    }
    const double shifted_x = m_position_x + drift_velocity * t0 * (*m_drift_direction);
    tpc_log()->debug("track {} shift x: {} -> {} with t0={} v={} dir={}",
                     m_track_id, m_position_x, shifted_x, t0, drift_velocity, *m_drift_direction);
    m_position_x = shifted_x;
}

void TrackPoint::shift_position_x(double t0, const DriftConfig& drift)
{
    shift_position_x(t0, drift.drift_velocity());
}

TrackPoint TrackPoint::with_shifted_x(double t0, double drift_velocity) const
{
    TrackPoint ret(*this);
    ret.shift_position_x(t0, drift_velocity);
    ret.reclassify();
    return ret;
}

Configuration TrackPoint::to_json() const
{
    Configuration jpt;
    jpt["track_id"] = m_track_id;
    jpt["position"][0] = m_position_x;
    jpt["position"][1] = m_position_y;
    jpt["position"][2] = m_position_z;
    jpt["direction"][0] = m_direction_x;
    jpt["direction"][1] = m_direction_y;
    jpt["direction"][2] = m_direction_z;
    if (m_drift_direction) {
        jpt["drift_direction"] = *m_drift_direction;
    }
    else {
        jpt["drift_direction"] = Json::nullValue;
    }
    jpt["region"] = region_short_name(m_region);
    return jpt;
}

static std::array<double, 3> get_triple(const Configuration& jpt, const std::string& key)
{
    auto jarr = jpt[key];
    if (!jarr.isArray() || jarr.size() != 3) {
        raise<ConfigurationError>("track point \"%s\" must be an array of 3 numbers", key);
    }
    std::array<double, 3> ret;
    for (int ind = 0; ind < 3; ++ind) {
        if (!jarr[ind].isNumeric()) {
            raise<ConfigurationError>("track point \"%s\"[%d] is not a number", key, ind);
        }
        ret[ind] = jarr[ind].asDouble();
    }
    return ret;
}

TrackPoint TrackPoint::from_json(const Configuration& jpt, const tpc_boundaries_t& bounds)
{
    if (!jpt.isObject()) {
        raise<ConfigurationError>("track point must be a JSON object");
    }
    if (!jpt["track_id"].isInt()) {
        raise<ConfigurationError>("track point \"track_id\" must be an integer");
    }
    const auto pos = get_triple(jpt, "position");
    const auto dir = get_triple(jpt, "direction");
    return TrackPoint(jpt["track_id"].asInt(),
                      pos[0], pos[1], pos[2],
                      dir[0], dir[1], dir[2], bounds);
}

std::ostream& Matcha::operator<<(std::ostream& os, const TrackPoint& tp)
{
    os << "<TrackPoint track:" << tp.track_id()
       << " pos:(" << tp.position_x() << "," << tp.position_y() << "," << tp.position_z() << ")"
       << " dir:(" << tp.direction_x() << "," << tp.direction_y() << "," << tp.direction_z() << ")"
       << " region:" << tp.region() << " drift:";
    if (tp.drift_direction()) {
        os << *tp.drift_direction();
    }
    else {
        os << "none";
    }
    os << ">";
    return os;
}
