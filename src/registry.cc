#include "metron/registry.hh"
#include "metron/logging.hh"

namespace metron {

constexpr size_t meter_registry::default_shards;

meter_registry::meter_registry(std::vector<unsigned> windows, std::chrono::seconds tick,
        size_t nshards)
    : _windows(std::move(windows)), _tick(tick), _shards(nshards)
{
}

auto meter_registry::get_or_create(const std::string &key) -> meter_ptr {
    shard &s = _shards.get(key);
    auto m = s.shared([&](const meter_map &mm) -> meter_ptr {
        const auto i = mm.find(key);
        return i == mm.end() ? meter_ptr() : i->second;
    });
    if (m)
        return m;

    // lost races land here too; only the first insert builds a meter.
    // the map never holds a null meter, even if construction throws
    return s([&](meter_map &mm) -> meter_ptr {
        const auto i = mm.find(key);
        if (i != mm.end())
            return i->second;
        auto created = std::make_shared<meter>(key, _windows, _tick);
        mm.emplace(key, created);
        VLOG(vlog_key) << "new meter: " << key;
        return created;
    });
}

auto meter_registry::find(const std::string &key) const -> meter_ptr {
    return _shards.get(key).shared([&](const meter_map &mm) -> meter_ptr {
        const auto i = mm.find(key);
        return i == mm.end() ? meter_ptr() : i->second;
    });
}

size_t meter_registry::size() const {
    size_t n = 0;
    for (size_t i = 0; i < _shards.size(); ++i) {
        n += _shards.at(i).shared([](const meter_map &mm) { return mm.size(); });
    }
    return n;
}

void meter_registry::for_each(const std::function<void (meter &)> &fn) const {
    for (size_t i = 0; i < _shards.size(); ++i) {
        const auto batch = _shards.at(i).shared([](const meter_map &mm) -> std::vector<meter_ptr> {
            std::vector<meter_ptr> v;
            v.reserve(mm.size());
            for (const auto &kv : mm)
                v.push_back(kv.second);
            return v;
        });
        for (const auto &m : batch)
            fn(*m);
    }
}

} // end namespace metron
