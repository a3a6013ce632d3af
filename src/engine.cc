#include "metron/engine.hh"
#include "metron/error.hh"
#include "metron/logging.hh"
#include <algorithm>
#include <cstdint>
#include <limits.h>
#include <unistd.h>

namespace metron {

std::string hostname() {
    char buf[HOST_NAME_MAX + 1];
    throw_if(::gethostname(buf, sizeof(buf)) == -1, "gethostname");
    buf[HOST_NAME_MAX] = '\0';
    return buf;
}

namespace {

engine_config checked(engine_config conf) {
    if (conf.rates.empty())
        throw config_error("no rates configured. possible rates are 1, 5, 15");
    for (auto r : conf.rates) {
        if (window_slot(r) < 0)
            throw_stream<config_error>() << "invalid rates configuration. possible rates are 1, 5, 15. rates: "
                << conf.rates << endx;
    }
    std::sort(conf.rates.begin(), conf.rates.end());
    conf.rates.erase(std::unique(conf.rates.begin(), conf.rates.end()), conf.rates.end());

    if (conf.ignore_older_than.count() < 0)
        throw config_error("ignore_older_than must not be negative: %jd",
                intmax_t(conf.ignore_older_than.count()));
    const auto max_age = std::chrono::duration_cast<std::chrono::seconds>(
            clock_source::time_point::duration::max()) / 2;
    if (conf.ignore_older_than > max_age)
        throw config_error("ignore_older_than too large: %jd",
                intmax_t(conf.ignore_older_than.count()));

    if (conf.host.empty())
        conf.host = hostname();
    return conf;
}

} // anon namespace

engine::engine(engine_config conf, clock_ptr clock)
    : _conf(checked(std::move(conf))),
      _clock(std::move(clock)),
      _registry(_conf.rates, _conf.tick),
      _scheduler(_conf.tick, _conf.flush_interval, _conf.clear_interval)
{
    if (!_clock)
        throw config_error("engine needs a clock");
    VLOG(vlog_cycle) << "engine: tick=" << _conf.tick.count()
        << "s flush=" << _conf.flush_interval.count()
        << "s clear=" << _conf.clear_interval.count()
        << "s ignore_older_than=" << _conf.ignore_older_than.count()
        << "s rates=" << _conf.rates;
}

void engine::mark(const std::string &key, time_point event_time) {
    mark(key, event_time, _clock->now());
}

void engine::mark(const std::string &key, time_point event_time, time_point now) {
    // event_time may be anywhere in time_point's range; only now moves
    if (_conf.ignore_older_than.count() > 0 && event_time < now - _conf.ignore_older_than) {
        VLOG(vlog_key) << "skipping old record for " << key << " at "
            << std::chrono::duration_cast<std::chrono::seconds>(event_time.time_since_epoch()).count()
            << "s, limit " << _conf.ignore_older_than.count() << "s";
        return;
    }
    _registry.get_or_create(key)->mark(1);
}

std::vector<snapshot> engine::flush() {
    snapshot proto;
    proto.host = _conf.host;
    proto.timestamp = _clock->now();
    proto.tags = _conf.add_tag;
    return _scheduler.run(_registry, proto);
}

} // end namespace metron
