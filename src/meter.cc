#include "metron/meter.hh"
#include "metron/error.hh"
#include "metron/logging.hh"
#include <algorithm>

namespace metron {

const std::array<unsigned, 3> rate_windows{{1, 5, 15}};

int window_slot(unsigned minutes) {
    const auto i = std::find(rate_windows.begin(), rate_windows.end(), minutes);
    return i == rate_windows.end() ? -1 : int(i - rate_windows.begin());
}

boost::optional<double> meter_reading::rate(unsigned minutes) const {
    const int slot = window_slot(minutes);
    if (slot < 0)
        return boost::none;
    return rates[slot];
}

meter::meter(std::string key, const std::vector<unsigned> &windows, std::chrono::seconds tick)
    : _key(std::move(key))
{
    for (auto w : windows) {
        const int slot = window_slot(w);
        if (slot < 0)
            throw config_error("bad rate window: %u minutes", w);
        if (!_rates[slot])
            _rates[slot].reset(new rate_type(std::chrono::minutes{w}, tick));
    }
}

void meter::mark(uint64_t n) {
    for (auto &r : _rates) {
        if (r) r->update(n);
    }
    _count.fetch_add(n);
}

uint64_t meter::uncounted() const {
    for (auto &r : _rates) {
        if (r) return r->pending();
    }
    return 0;
}

boost::optional<double> meter::rate(unsigned minutes) const {
    return _cycle([&](const cycle_state &) {
        return _read().rate(minutes);
    });
}

meter_reading meter::read() const {
    return _cycle([&](const cycle_state &) {
        return _read();
    });
}

std::chrono::seconds meter::since_flush() const {
    return _cycle([](const cycle_state &st) { return st.since_flush; });
}

std::chrono::seconds meter::since_clear() const {
    return _cycle([](const cycle_state &st) { return st.since_clear; });
}

boost::optional<meter_reading> meter::cycle(const cycle_policy &policy) {
    return _cycle([&](cycle_state &st) -> boost::optional<meter_reading> {
        st.since_flush += policy.tick;
        st.since_clear += policy.tick;

        for (auto &r : _rates) {
            if (r) r->tick();
        }

        boost::optional<meter_reading> reading;
        if (st.since_flush >= policy.flush_interval) {
            reading = _read();
            st.since_flush = std::chrono::seconds::zero();
        }

        if (policy.clear_interval > std::chrono::seconds::zero()
                && st.since_clear >= policy.clear_interval) {
            VLOG(vlog_key) << "clearing meter " << _key << " at count " << count();
            _clear();
            st.since_clear = std::chrono::seconds::zero();
        }
        return reading;
    });
}

void meter::clear() {
    _cycle([this](cycle_state &) { _clear(); });
}

// caller holds the cycle lock

meter_reading meter::_read() const {
    meter_reading m;
    m.count = count();
    for (size_t i = 0; i < _rates.size(); ++i) {
        if (_rates[i])
            m.rates[i] = _rates[i]->rate<std::chrono::minutes>();
    }
    return m;
}

void meter::_clear() {
    _count.store(0);
    for (auto &r : _rates) {
        if (r) r->reset();
    }
}

} // end namespace metron
