#include "MatchaTpc/TpcRegion.h"
#include "MatchaUtil/Exceptions.h"

#include <algorithm>

using namespace Matcha;

namespace {
    struct RegionInfo {
        const char* name;
        const char* short_name;
        int dirx;               // 0 means none
    };

    // indexed by region
    const RegionInfo region_info[ntpc_regions] = {
        {"WestOfOuterBoundary", "WestOfWW", 0},
        {"WestVolume", "WW", +1},
        {"EastFacingWestVolume", "WE", -1},
        {"BetweenVolumes", "BetweenTPCs", 0},
        {"WestFacingEastVolume", "EW", +1},
        {"EastVolume", "EE", -1},
        {"EastOfOuterBoundary", "EastOfEE", 0},
    };

    const RegionInfo& info(TpcRegion region)
    {
        const int ind = static_cast<int>(region);
        if (ind < 0 || ind >= ntpc_regions) {
            raise<IndexError>("illegal TPC region index %d", ind);
        }
        return region_info[ind];
    }
}

TpcRegion Matcha::classify_region(double x, const tpc_boundaries_t& bounds)
{
    // Number of boundaries less than or equal to x.  NaN compares false
    // with everything and so lands past the last boundary.
    auto it = std::upper_bound(bounds.begin(), bounds.end(), x);
    return static_cast<TpcRegion>(it - bounds.begin());
}

std::optional<int> Matcha::drift_direction(TpcRegion region)
{
    const int dirx = info(region).dirx;
    if (dirx == 0) {
        return std::nullopt;
    }
    return dirx;
}

std::optional<int> Matcha::drift_direction_at(double x, const tpc_boundaries_t& bounds)
{
    return drift_direction(classify_region(x, bounds));
}

bool Matcha::is_active(TpcRegion region)
{
    return info(region).dirx != 0;
}

std::string Matcha::region_name(TpcRegion region)
{
    return info(region).name;
}

std::string Matcha::region_short_name(TpcRegion region)
{
    return info(region).short_name;
}

TpcRegion Matcha::region_from_name(const std::string& name)
{
    for (int ind = 0; ind < ntpc_regions; ++ind) {
        if (name == region_info[ind].name || name == region_info[ind].short_name) {
            return static_cast<TpcRegion>(ind);
        }
    }
    raise<KeyError>("unknown TPC region name \"%s\"", name);
    return TpcRegion::EastOfOuterBoundary;  // not reached
}

std::ostream& Matcha::operator<<(std::ostream& os, TpcRegion region)
{
    const int ind = static_cast<int>(region);
    if (ind < 0 || ind >= ntpc_regions) {
        os << "TpcRegion(" << ind << ")";
        return os;
    }
    os << region_info[ind].name;
    return os;
}
