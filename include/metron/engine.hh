#ifndef LIBMETRON_ENGINE_HH
#define LIBMETRON_ENGINE_HH

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "metron/clock.hh"
#include "metron/registry.hh"
#include "metron/scheduler.hh"
#include "metron/snapshot.hh"

namespace metron {

//! engine options; see engine::engine for validation
struct engine_config {
    //! key template, used by the record resolver rather than the engine
    std::string meter;
    std::chrono::seconds tick{5};
    std::chrono::seconds flush_interval{5};
    //! -1 never clears
    std::chrono::seconds clear_interval{-1};
    //! 0 counts records of any age
    std::chrono::seconds ignore_older_than{0};
    //! minutes, subset of rate_windows
    std::vector<unsigned> rates{1, 5, 15};
    //! empty means this machine's hostname
    std::string host;
    //! attached to every snapshot
    std::vector<std::string> add_tag;
};

//! hostname of this machine
//! \throw errno_error
std::string hostname();

//! windowed meters keyed by name, with an age gate in front
//
//! mark() may be called from any number of threads; flush() from one
//! thread at a time on the tick cadence.
class engine {
public:
    using time_point = clock_source::time_point;
    using clock_ptr = std::shared_ptr<clock_source>;

private:
    const engine_config _conf;
    const clock_ptr _clock;
    meter_registry _registry;
    const flush_scheduler _scheduler;

public:
    //! \throw config_error for rates outside {1, 5, 15}, no rates at all,
    //! a negative ignore_older_than, or a bad tick/flush/clear combination
    explicit engine(engine_config conf,
            clock_ptr clock = std::make_shared<system_clock_source>());

    engine(const engine &) = delete;
    engine &operator = (const engine &) = delete;

    //! count one record with timestamp event_time against key, unless the
    //! record is older than ignore_older_than
    void mark(const std::string &key, time_point event_time);
    void mark(const std::string &key, time_point event_time, time_point now);

    //! one scheduler cycle
    //! \return snapshots for the keys due this cycle, possibly none
    std::vector<snapshot> flush();

    const engine_config &config() const { return _conf; }
    clock_source &clock() const         { return *_clock; }
    meter_registry &registry()          { return _registry; }
    const meter_registry &registry() const { return _registry; }
};

} // end namespace metron

#endif // LIBMETRON_ENGINE_HH
