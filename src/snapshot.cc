#include "metron/snapshot.hh"
#include "metron/error.hh"
#include <cstdio>
#include <time.h>

namespace metron {

const char snapshot_message[] = "metric";

snapshot snapshot::with(const std::string &key, const meter_reading &r) const {
    snapshot s(*this);
    s.name = key;
    s.count = r.count;
    s.rate_1m = r.rate(1);
    s.rate_5m = r.rate(5);
    s.rate_15m = r.rate(15);
    return s;
}

std::string format_timestamp(snapshot::time_point t) {
    using namespace std::chrono;
    const auto since = t.time_since_epoch();
    auto secs = duration_cast<seconds>(since);
    auto ms = duration_cast<milliseconds>(since - secs);
    if (ms.count() < 0) {
        secs -= seconds{1};
        ms += seconds{1};
    }
    const time_t tt = secs.count();
    struct tm tm;
    gmtime_r(&tt, &tm);
    char buf[64];
    const size_t n = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    snprintf(buf + n, sizeof(buf) - n, ".%03dZ", int(ms.count()));
    return buf;
}

json to_json(const snapshot &s) {
    json j = json::object();
    j.set("message", json(snapshot_message));
    j.set("name", json(s.name));
    j.set("count", json::integer(static_cast<json_int_t>(s.count)));
    if (s.rate_1m)  j.set("rate_1m",  json(*s.rate_1m));
    if (s.rate_5m)  j.set("rate_5m",  json(*s.rate_5m));
    if (s.rate_15m) j.set("rate_15m", json(*s.rate_15m));
    j.set("host", json(s.host));
    j.set("@timestamp", json(format_timestamp(s.timestamp)));
    if (!s.tags.empty()) {
        json tags = json::array();
        for (const auto &t : s.tags)
            tags.push(json(t));
        j.set("tags", tags);
    }
    return j;
}

void stream_sink::emit(const snapshot &s) {
    const std::string line = to_json(s).dump();
    std::lock_guard<std::mutex> lk(_mutex);
    _os << line << '\n';
    _os.flush();
    if (!_os)
        throw errorx("stream_sink: write failed for %s", s.name.c_str());
}

void memory_sink::emit(const snapshot &s) {
    std::lock_guard<std::mutex> lk(_mutex);
    _snapshots.push_back(s);
}

std::vector<snapshot> memory_sink::snapshots() {
    std::lock_guard<std::mutex> lk(_mutex);
    return _snapshots;
}

} // end namespace metron
