#ifndef LIBMETRON_METER_HH
#define LIBMETRON_METER_HH

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <boost/optional.hpp>

#include "metron/ewma.hh"
#include "metron/synchronized.hh"

namespace metron {

//! rate windows a meter can track, in minutes
extern const std::array<unsigned, 3> rate_windows;

//! slot of a window in rate_windows, or -1 if not a valid window
int window_slot(unsigned minutes);

//! count and per-minute rates of one meter at one instant
struct meter_reading {
    uint64_t count = 0;
    std::array<boost::optional<double>, 3> rates;  // by window_slot

    boost::optional<double> rate(unsigned minutes) const;
};

//! what a scheduler cycle does to each meter
struct cycle_policy {
    std::chrono::seconds tick{5};
    std::chrono::seconds flush_interval{5};
    std::chrono::seconds clear_interval{-1};  // <= 0 never clears
};

//! event counter with decayed 1, 5 and 15 minute rates
//
//! mark() is lock free and may be called from any number of threads.
//! everything that ticks, reads or clears the rates goes through the
//! per-meter cycle lock, so a flush holds at most one meter at a time.
class meter {
public:
    using rate_type = ewma<std::chrono::seconds>;

private:
    struct cycle_state {
        std::chrono::seconds since_flush{0};
        std::chrono::seconds since_clear{0};
    };

    const std::string _key;
    std::atomic<uint64_t> _count{0};
    std::array<std::unique_ptr<rate_type>, 3> _rates;
    synchronized<cycle_state> _cycle;

    meter_reading _read() const;
    void _clear();

public:
    //! \param windows subset of rate_windows to track
    //! \param tick cadence at which cycle() will be called
    //! \throw config_error for a window outside rate_windows
    meter(std::string key, const std::vector<unsigned> &windows, std::chrono::seconds tick);

    meter(const meter &) = delete;
    meter &operator = (const meter &) = delete;

    const std::string &key() const { return _key; }

    void mark(uint64_t n = 1);

    uint64_t count() const { return _count.load(); }

    //! marks not yet folded into the rates
    uint64_t uncounted() const;

    //! per-minute rate for window, none if the window is not tracked
    boost::optional<double> rate(unsigned minutes) const;

    meter_reading read() const;

    std::chrono::seconds since_flush() const;
    std::chrono::seconds since_clear() const;

    //! one scheduler step: advance intervals, tick rates, then flush and
    //! clear as the policy says.
    //! \return the reading taken if this cycle flushed, taken before any clear
    boost::optional<meter_reading> cycle(const cycle_policy &policy);

    //! zero the count and return every rate to its unseeded state
    void clear();
};

} // end namespace metron

#endif // LIBMETRON_METER_HH
