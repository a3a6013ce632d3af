#include "metron/scheduler.hh"
#include "metron/error.hh"
#include "metron/logging.hh"
#include <cstdint>

namespace metron {

namespace {

cycle_policy make_policy(std::chrono::seconds tick,
        std::chrono::seconds flush_interval,
        std::chrono::seconds clear_interval)
{
    if (tick.count() <= 0)
        throw config_error("tick must be positive: %jd", intmax_t(tick.count()));
    if (flush_interval.count() <= 0 || flush_interval.count() % tick.count())
        throw config_error("flush_interval must be a positive multiple of %jds: %jd",
                intmax_t(tick.count()), intmax_t(flush_interval.count()));
    if (clear_interval.count() > 0 && clear_interval.count() % tick.count())
        throw config_error("clear_interval must be a multiple of %jds: %jd",
                intmax_t(tick.count()), intmax_t(clear_interval.count()));
    cycle_policy p;
    p.tick = tick;
    p.flush_interval = flush_interval;
    p.clear_interval = clear_interval;
    return p;
}

} // anon namespace

flush_scheduler::flush_scheduler(std::chrono::seconds tick,
        std::chrono::seconds flush_interval,
        std::chrono::seconds clear_interval)
    : _policy(make_policy(tick, flush_interval, clear_interval))
{
}

std::vector<snapshot> flush_scheduler::run(const meter_registry &reg, const snapshot &proto) const {
    std::vector<snapshot> batch;
    size_t visited = 0;
    reg.for_each([&](meter &m) {
        ++visited;
        const auto reading = m.cycle(_policy);
        if (reading)
            batch.push_back(proto.with(m.key(), *reading));
    });
    VLOG(vlog_cycle) << "flush cycle: " << visited << " meters, " << batch.size() << " snapshots";
    return batch;
}

} // end namespace metron
