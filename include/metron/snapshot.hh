#ifndef LIBMETRON_SNAPSHOT_HH
#define LIBMETRON_SNAPSHOT_HH

#include <chrono>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>

#include "metron/json.hh"
#include "metron/meter.hh"

namespace metron {

//! value of the message field of every snapshot
extern const char snapshot_message[];

//! one meter as emitted by a flush cycle
struct snapshot {
    using time_point = std::chrono::system_clock::time_point;

    std::string name;
    uint64_t count = 0;
    boost::optional<double> rate_1m;
    boost::optional<double> rate_5m;
    boost::optional<double> rate_15m;
    std::string host;
    time_point timestamp;
    std::vector<std::string> tags;

    snapshot() {}

    //! fill name, count and rates from a meter reading; keep the rest
    snapshot with(const std::string &key, const meter_reading &r) const;
};

//! ISO-8601 UTC with milliseconds, e.g. 2026-10-19T08:00:05.000Z
std::string format_timestamp(snapshot::time_point t);

//! rates that were not tracked are left out of the object
json to_json(const snapshot &s);

//! where flushed snapshots go
class snapshot_sink {
public:
    virtual ~snapshot_sink() {}
    virtual void emit(const snapshot &s) = 0;
};

//! one JSON object per line
class stream_sink : public snapshot_sink {
    std::mutex _mutex;
    std::ostream &_os;

public:
    explicit stream_sink(std::ostream &os) : _os(os) {}
    ~stream_sink() override {}

    //! \throw errorx if the stream went bad
    void emit(const snapshot &s) override;
};

//! keeps everything it is given
class memory_sink : public snapshot_sink {
    std::mutex _mutex;
    std::vector<snapshot> _snapshots;

public:
    ~memory_sink() override {}

    void emit(const snapshot &s) override;

    std::vector<snapshot> snapshots();
};

} // end namespace metron

#endif // LIBMETRON_SNAPSHOT_HH
