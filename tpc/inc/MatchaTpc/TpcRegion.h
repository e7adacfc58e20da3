/** Classify an x coordinate into one of the seven regions of a two-cryostat
    TPC detector and give the electron drift direction there.

    Six ascending boundaries split the x axis into seven regions.  Each of
    the two active volumes is split by its cathode into a half that drifts
    toward increasing x (west, +1) and a half that drifts toward decreasing x
    (east, -1).  The gap between the volumes and the space outside them have
    no drift direction.

    Coordinates are in cm.
 */

#ifndef MATCHA_TPCREGION
#define MATCHA_TPCREGION

#include "MatchaUtil/Spdlog.h"

#include <array>
#include <optional>
#include <ostream>
#include <string>

namespace Matcha {

    /// The regions in order of increasing x.  The underlying value is the
    /// region index.
    enum class TpcRegion : int {
        WestOfOuterBoundary = 0,
        WestVolume = 1,
        EastFacingWestVolume = 2,
        BetweenVolumes = 3,
        WestFacingEastVolume = 4,
        EastVolume = 5,
        EastOfOuterBoundary = 6,
    };

    /// Number of regions.
    constexpr int ntpc_regions = 7;

    /// Region boundaries along x in cm, ascending.
    typedef std::array<double, ntpc_regions - 1> tpc_boundaries_t;

    /// Boundaries of the ICARUS TPCs.
    constexpr tpc_boundaries_t default_tpc_boundaries = {
        -358.49, -210.215, -61.94, 61.94, 210.215, 358.49};

    /// Return the region holding x.  A point on a boundary is in the region
    /// that starts at that boundary.  NaN is placed outside to the east.
    TpcRegion classify_region(double x, const tpc_boundaries_t& bounds = default_tpc_boundaries);

    /// Return +1 for regions drifting to the west, -1 for those drifting to
    /// the east and nothing for regions outside an active volume.
    std::optional<int> drift_direction(TpcRegion region);

    /// Classify and return the drift direction in one go.
    std::optional<int> drift_direction_at(double x, const tpc_boundaries_t& bounds = default_tpc_boundaries);

    /// True if the region is inside an active volume.
    bool is_active(TpcRegion region);

    /// Return the canonical name, eg "WestVolume".
    std::string region_name(TpcRegion region);

    /// Return the short name, eg "WW".
    std::string region_short_name(TpcRegion region);

    /// Return the region for a canonical or short name.  Raises KeyError on
    /// anything else.
    TpcRegion region_from_name(const std::string& name);

    std::ostream& operator<<(std::ostream& os, TpcRegion region);

}  // namespace Matcha

template <> struct fmt::formatter<Matcha::TpcRegion> : fmt::ostream_formatter {};

#endif
