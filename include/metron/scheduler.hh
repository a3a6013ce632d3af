#ifndef LIBMETRON_SCHEDULER_HH
#define LIBMETRON_SCHEDULER_HH

#include <chrono>
#include <vector>

#include "metron/meter.hh"
#include "metron/registry.hh"
#include "metron/snapshot.hh"

namespace metron {

//! ticks every meter once per cycle, emitting and clearing on schedule
class flush_scheduler {
    const cycle_policy _policy;

public:
    //! \throw config_error unless tick > 0, flush_interval is a positive
    //! multiple of tick and clear_interval is <= 0 or a multiple of tick
    flush_scheduler(std::chrono::seconds tick,
            std::chrono::seconds flush_interval,
            std::chrono::seconds clear_interval);

    const cycle_policy &policy() const { return _policy; }

    //! run one cycle over every meter in reg
    //! \param proto host, timestamp and tags for this cycle's snapshots
    //! \return one snapshot per meter whose flush interval elapsed
    std::vector<snapshot> run(const meter_registry &reg, const snapshot &proto) const;
};

} // end namespace metron

#endif // LIBMETRON_SCHEDULER_HH
