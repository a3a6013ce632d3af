#ifndef LIBMETRON_EWMA_HH
#define LIBMETRON_EWMA_HH

#include <chrono>
#include <cmath>
#include <atomic>
#include <cstdint>

namespace metron {

//! exponentially weighted moving average of an event rate
//
//! update() only accumulates and may be called from any thread.
//! tick() folds the accumulated events into the average; it, rate() and
//! reset() belong to one ticking thread at a time.
//! the first tick after construction or reset() seeds the average with the
//! instantaneous rate instead of decaying toward it.
template <class TimeUnit>
class ewma {
private:
    const TimeUnit _tick_interval;
    const double _alpha;
    std::atomic<uint64_t> _pending {};
    double _rate {};
    bool _seeded {};
public:
    ewma(TimeUnit window, TimeUnit tick_interval)
        : _tick_interval{tick_interval},
          _alpha{1.0 - std::exp(-(double)tick_interval.count() / window.count())}
    {}

    ewma(const ewma &) = delete;
    ewma &operator = (const ewma &) = delete;

    void update(uint64_t n) {
        _pending.fetch_add(n);
    }

    void tick() {
        const double instant = (double)_pending.exchange(0) / (double)_tick_interval.count();
        if (_seeded) {
            _rate += _alpha * (instant - _rate);
        } else {
            _rate = instant;
            _seeded = true;
        }
    }

    //! back to the state before the first tick
    void reset() {
        _pending.store(0);
        _rate = 0;
        _seeded = false;
    }

    uint64_t pending() const { return _pending.load(); }
    bool seeded()      const { return _seeded; }
    double alpha()     const { return _alpha; }
    TimeUnit tick_interval() const { return _tick_interval; }

    //! events per RateUnit, 0 before the first tick
    template <class RateUnit=std::chrono::seconds>
    double rate() const {
        using cvt = std::ratio_divide< typename RateUnit::period, typename TimeUnit::period >;
        return (_rate * cvt::num) / cvt::den;
    }
};

} // end namespace metron

#endif // LIBMETRON_EWMA_HH
