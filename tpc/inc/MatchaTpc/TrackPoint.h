/** One end point of a reconstructed TPC track as used in matching tracks to
    CRT hits.

    The point carries its position, its direction and the drift direction of
    the TPC region holding it.  The region and drift direction are a cached
    classification of position_x.  They are made at construction and by
    reclassify() and may be overridden with set_drift_direction().  Setting
    or shifting position_x does NOT reclassify.  Use with_shifted_x() to get
    a shifted point that is classified at its new position.
 */

#ifndef MATCHA_TRACKPOINT
#define MATCHA_TRACKPOINT

#include "MatchaTpc/TpcRegion.h"
#include "MatchaUtil/Configuration.h"
#include "MatchaUtil/Exceptions.h"

#include <optional>
#include <ostream>

namespace Matcha {

    class DriftConfig;

    /// Thrown when a shift is asked of a point that has no drift direction.
    struct UndefinedDriftDirection : virtual public ValueError {
    };

    class TrackPoint {
       public:
        typedef std::optional<int> drift_direction_t;

        TrackPoint(int track_id,
                   double position_x, double position_y, double position_z,
                   double direction_x, double direction_y, double direction_z,
                   const tpc_boundaries_t& bounds = default_tpc_boundaries);

        int track_id() const { return m_track_id; }
        void set_track_id(int value) { m_track_id = value; }

        double position_x() const { return m_position_x; }
        void set_position_x(double value) { m_position_x = value; }
        double position_y() const { return m_position_y; }
        void set_position_y(double value) { m_position_y = value; }
        double position_z() const { return m_position_z; }
        void set_position_z(double value) { m_position_z = value; }

        double direction_x() const { return m_direction_x; }
        void set_direction_x(double value) { m_direction_x = value; }
        double direction_y() const { return m_direction_y; }
        void set_direction_y(double value) { m_direction_y = value; }
        double direction_z() const { return m_direction_z; }
        void set_direction_z(double value) { m_direction_z = value; }

        /// +1 (west), -1 (east) or empty if outside any active volume.
        drift_direction_t drift_direction() const { return m_drift_direction; }
        bool has_drift_direction() const { return m_drift_direction.has_value(); }

        /// Override the drift direction.  The region is left as is.
        void set_drift_direction(drift_direction_t value) { m_drift_direction = value; }

        /// The region found by the last classification.
        TpcRegion region() const { return m_region; }

        const tpc_boundaries_t& boundaries() const { return m_bounds; }

        /// Classify the current position_x again, replacing region and
        /// drift direction.
        void reclassify();

        /// Move position_x along the drift by drift_velocity * t0 in the
        /// drift direction.  The t0 is in us and may be negative and the
        /// drift velocity is in cm/us.  Raises UndefinedDriftDirection if
        /// the point has no drift direction.
        void shift_position_x(double t0, double drift_velocity);

        /// As above taking the drift velocity from the configuration.
        /// Raises ConfigurationError if that is unset.
        void shift_position_x(double t0, const DriftConfig& drift);

        /// Return a copy shifted as by shift_position_x() and then
        /// reclassified at its new position.  This point is not changed.
        TrackPoint with_shifted_x(double t0, double drift_velocity) const;

        /// Return a JSON object with keys track_id, position, direction,
        /// drift_direction (null if none) and region (short name).
        Configuration to_json() const;

        /// Make a point from an object as returned by to_json().  Only
        /// track_id, position and direction are read, the rest is
        /// recalculated.  Raises ConfigurationError if malformed.
        static TrackPoint from_json(const Configuration& jpt,
                                    const tpc_boundaries_t& bounds = default_tpc_boundaries);

       private:
        int m_track_id;
        double m_position_x, m_position_y, m_position_z;
        double m_direction_x, m_direction_y, m_direction_z;
        tpc_boundaries_t m_bounds;
        TpcRegion m_region;
        drift_direction_t m_drift_direction;
    };

    std::ostream& operator<<(std::ostream& os, const TrackPoint& tp);

}  // namespace Matcha

template <> struct fmt::formatter<Matcha::TrackPoint> : fmt::ostream_formatter {};

#endif
