#ifndef MATCHA_DRIFTCONFIG
#define MATCHA_DRIFTCONFIG

#include "MatchaTpc/TpcRegion.h"
#include "MatchaUtil/IConfigurable.h"

#include <optional>

namespace Matcha {

    /** The detector drift parameters needed to classify and shift track
        points.

        There is no usable default drift velocity.  It must be configured or
        set before drift_velocity() is called.
     */
    class DriftConfig : public IConfigurable {
       public:
        DriftConfig();
        explicit DriftConfig(double drift_velocity,
                             const tpc_boundaries_t& bounds = default_tpc_boundaries);
        virtual ~DriftConfig();

        // IConfigurable

        /// Config: boundaries
        ///
        /// Array of six ascending region boundaries along x in cm.
        ///
        /// Config: drift_velocity
        ///
        /// Electron drift speed in cm/us.  The default is null which means
        /// unset.  A missing key leaves the current value.
        ///
        /// Nothing is changed if any parameter is illegal.
        virtual Configuration default_configuration() const;
        virtual void configure(const Configuration& cfg);

        bool has_drift_velocity() const { return m_drift_velocity.has_value(); }

        /// Raises ConfigurationError if the drift velocity is unset.
        double drift_velocity() const;

        /// Raises ConfigurationError unless v is finite and positive.
        void set_drift_velocity(double v);

        const tpc_boundaries_t& boundaries() const { return m_bounds; }

        /// Raises ConfigurationError unless finite and strictly ascending.
        void set_boundaries(const tpc_boundaries_t& bounds);

        TpcRegion classify(double x) const { return classify_region(x, m_bounds); }

       private:
        static void check_drift_velocity(double v);
        static void check_boundaries(const tpc_boundaries_t& bounds);

        tpc_boundaries_t m_bounds;
        std::optional<double> m_drift_velocity;
    };

}  // namespace Matcha

#endif
