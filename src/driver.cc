#include "metron/driver.hh"
#include "metron/error.hh"
#include "metron/logging.hh"

namespace metron {

flush_driver::flush_driver(engine &e, snapshot_sink &sink)
    : flush_driver(e, sink, e.config().tick)
{
}

flush_driver::flush_driver(engine &e, snapshot_sink &sink, clock_type::duration period)
    : _engine(e), _sink(sink), _period(period)
{
    if (period <= clock_type::duration::zero())
        throw config_error("flush_driver: period must be positive");
    if (period != e.config().tick)
        LOG(WARNING) << "flush_driver: period of "
            << std::chrono::duration_cast<std::chrono::milliseconds>(period).count()
            << "ms differs from the " << e.config().tick.count()
            << "s engine tick; rates and intervals will be scaled";
    _thread = thread_guard(std::thread([this] {
        _driver_main();
    }));
}

flush_driver::~flush_driver() {
    stop();
}

void flush_driver::stop() {
    {
        std::lock_guard<std::mutex> lk(_mutex);
        _stopping = true;
    }
    _cv.notify_all();
    _thread.join();
}

void flush_driver::_driver_main() {
    auto next = clock_type::now() + _period;
    for (;;) {
        {
            std::unique_lock<std::mutex> lk(_mutex);
            if (_cv.wait_until(lk, next, [this] { return _stopping; }))
                return;
        }
        next += _period;

        const auto batch = _engine.flush();
        ++_cycles;
        for (const auto &s : batch) {
            try {
                _sink.emit(s);
            } catch (std::exception &e) {
                LOG(ERROR) << "dropping snapshot for " << s.name << ": " << e.what();
            }
        }
    }
}

} // end namespace metron
