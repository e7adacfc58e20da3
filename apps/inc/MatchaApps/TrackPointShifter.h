#ifndef MATCHA_APPS_TRACKPOINTSHIFTER
#define MATCHA_APPS_TRACKPOINTSHIFTER

#include "MatchaTpc/DriftConfig.h"
#include "MatchaTpc/TrackPoint.h"
#include "MatchaUtil/IConfigurable.h"
#include "MatchaUtil/Logging.h"

#include <vector>

namespace Matcha::Apps {

    /** Apply one t0 to a collection of track points.

        Configuration is that of DriftConfig plus:

        skip_undefined: if true (default) points without a drift direction
        are left unshifted, else any such point raises
        UndefinedDriftDirection before any point is shifted.
     */
    class TrackPointShifter : public IConfigurable {
       public:
        TrackPointShifter();
        virtual ~TrackPointShifter();

        virtual Configuration default_configuration() const;
        virtual void configure(const Configuration& cfg);

        /// Shift the points in place, return the number shifted.
        size_t shift(std::vector<TrackPoint>& points, double t0) const;

        /// Number of points left unshifted by the last call to shift().
        size_t nskipped() const { return m_nskipped; }

        const DriftConfig& drift() const { return m_drift; }
        DriftConfig& drift() { return m_drift; }

       private:
        DriftConfig m_drift;
        bool m_skip_undefined{true};
        mutable size_t m_nskipped{0};
        Log::logptr_t log;
    };

}  // namespace Matcha::Apps

#endif
