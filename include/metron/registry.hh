#ifndef LIBMETRON_REGISTRY_HH
#define LIBMETRON_REGISTRY_HH

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/thread/shared_mutex.hpp>

#include "metron/meter.hh"
#include "metron/striped.hh"
#include "metron/synchronized.hh"

namespace metron {

//! meters by key, created on first use and never removed
//
//! keys are spread over shards, each behind its own reader/writer lock.
//! a lookup of an existing key only takes a shard reader lock; a miss takes
//! the shard writer lock just long enough to insert.
class meter_registry {
public:
    using meter_ptr = std::shared_ptr<meter>;
    static constexpr size_t default_shards = 16;

private:
    using meter_map = std::unordered_map<std::string, meter_ptr>;
    using shard = synchronized<meter_map, boost::shared_mutex>;

    const std::vector<unsigned> _windows;
    const std::chrono::seconds _tick;
    striped<shard> _shards;

public:
    meter_registry(std::vector<unsigned> windows, std::chrono::seconds tick,
            size_t nshards = default_shards);

    meter_registry(const meter_registry &) = delete;
    meter_registry &operator = (const meter_registry &) = delete;

    //! the one meter for key, created if missing.
    //! \throw config_error if the registry's windows are invalid; nothing is inserted
    meter_ptr get_or_create(const std::string &key);

    //! the meter for key, or null
    meter_ptr find(const std::string &key) const;

    size_t size() const;

    //! call fn for every meter, one shard at a time.
    //
    //! each shard's key set is copied under its reader lock and fn runs with
    //! no registry lock held. meters created while this runs may be skipped.
    void for_each(const std::function<void (meter &)> &fn) const;
};

} // end namespace metron

#endif // LIBMETRON_REGISTRY_HH
