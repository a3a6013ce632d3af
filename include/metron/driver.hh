#ifndef LIBMETRON_DRIVER_HH
#define LIBMETRON_DRIVER_HH

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "metron/engine.hh"
#include "metron/snapshot.hh"
#include "metron/thread_guard.hh"

namespace metron {

//! background thread calling engine::flush() every tick and handing the
//! snapshots to a sink
class flush_driver {
    using clock_type = std::chrono::steady_clock;

    engine &_engine;
    snapshot_sink &_sink;
    const clock_type::duration _period;
    std::mutex _mutex;
    std::condition_variable _cv;
    bool _stopping = false;
    std::atomic<uint64_t> _cycles{0};
    thread_guard _thread;

    void _driver_main();

public:
    //! starts the thread, flushing every engine tick
    flush_driver(engine &e, snapshot_sink &sink);

    //! for tests. each flush still advances intervals and rates by the
    //! engine tick, so any period other than the tick scales them.
    flush_driver(engine &e, snapshot_sink &sink, clock_type::duration period);
    ~flush_driver();

    flush_driver(const flush_driver &) = delete;
    flush_driver &operator = (const flush_driver &) = delete;

    //! wake the thread and wait for it to exit; no final flush
    void stop();

    uint64_t cycles() const { return _cycles.load(); }

    clock_type::duration period() const { return _period; }
};

} // end namespace metron

#endif // LIBMETRON_DRIVER_HH
