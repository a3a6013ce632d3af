#ifndef LIBMETRON_CLOCK_HH
#define LIBMETRON_CLOCK_HH

#include <chrono>
#include "metron/synchronized.hh"

namespace metron {

//! source of "now" for the engine and the record resolver
class clock_source {
public:
    using clock_type = std::chrono::system_clock;
    using time_point = clock_type::time_point;

    virtual ~clock_source() {}
    virtual time_point now() const = 0;
};

//! wall clock
class system_clock_source : public clock_source {
public:
    ~system_clock_source() override {}

    time_point now() const override {
        return clock_type::now();
    }
};

//! clock that only moves when told to
class manual_clock : public clock_source {
    synchronized<time_point> _now;

public:
    explicit manual_clock(time_point start = time_point{}) : _now(start) {}
    ~manual_clock() override {}

    time_point now() const override {
        return _now([](const time_point &t) { return t; });
    }

    void set(time_point t) {
        _now([t](time_point &n) { n = t; });
    }

    template <class Duration>
    void advance(Duration d) {
        _now([d](time_point &n) {
            n += std::chrono::duration_cast<clock_type::duration>(d);
        });
    }
};

} // end namespace metron

#endif // LIBMETRON_CLOCK_HH
