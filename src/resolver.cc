#include "metron/resolver.hh"
#include "metron/logging.hh"
#include <boost/algorithm/string/join.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace metron {

const char key_resolver::timestamp_field[] = "@timestamp";

//----------------------------------------------------------------
// field references
//

std::vector<std::string> parse_field_ref(const std::string &ref) {
    if (ref.empty() || ref[0] != '[')
        return {ref};

    std::vector<std::string> path;
    size_t pos = 0;
    while (pos < ref.size()) {
        if (ref[pos] != '[')
            return {ref};
        const auto close = ref.find(']', pos + 1);
        if (close == std::string::npos || close == pos + 1)
            return {ref};
        path.push_back(ref.substr(pos + 1, close - pos - 1));
        pos = close + 1;
    }
    return path;
}

json lookup_field(const json &record, const std::vector<std::string> &path) {
    json cur = record;
    for (const auto &name : path) {
        if (!cur.is_object())
            return json();
        cur = cur.get(name);
        if (!cur)
            return json();
    }
    return cur;
}

namespace {

std::string format_value(const json &v) {
    if (v.is_string())
        return v.str();
    if (v.is_integer())
        return std::to_string(v.integer());
    if (v.is_array()) {
        std::vector<std::string> parts;
        parts.reserve(v.asize());
        for (size_t i = 0; i < v.asize(); ++i)
            parts.push_back(format_value(v.at(i)));
        return boost::algorithm::join(parts, ",");
    }
    return v.dump();
}

} // anon namespace

//----------------------------------------------------------------
// key_template
//

key_template::key_template(std::string source) : _source(std::move(source)) {
    std::string literal;
    size_t pos = 0;
    while (pos < _source.size()) {
        const auto open = _source.find("%{", pos);
        const auto close = open == std::string::npos ? open : _source.find('}', open + 2);
        if (close == std::string::npos) {
            literal.append(_source, pos, std::string::npos);
            break;
        }
        literal.append(_source, pos, open - pos);
        if (!literal.empty()) {
            _segments.push_back(segment{literal, {}});
            literal.clear();
        }
        const std::string body = _source.substr(open + 2, close - open - 2);
        const std::string text = _source.substr(open, close - open + 1);
        if (body.empty())
            literal += text;
        else
            _segments.push_back(segment{text, parse_field_ref(body)});
        pos = close + 1;
    }
    if (!literal.empty())
        _segments.push_back(segment{literal, {}});
}

bool key_template::is_constant() const {
    for (const auto &s : _segments) {
        if (!s.path.empty())
            return false;
    }
    return true;
}

std::string key_template::render(const json &record) const {
    std::string out;
    for (const auto &s : _segments) {
        if (s.path.empty()) {
            out += s.text;
            continue;
        }
        const json v = lookup_field(record, s.path);
        if (!v || v.is_null())
            out += s.text;
        else
            out += format_value(v);
    }
    return out;
}

//----------------------------------------------------------------
// timestamps
//

namespace {

using time_point = clock_source::time_point;

// none if us is outside what time_point can hold
boost::optional<time_point> from_micros(int64_t us) {
    const int64_t limit = std::chrono::duration_cast<std::chrono::microseconds>(
            time_point::duration::max()).count();
    if (us > limit || us < -limit)
        return boost::none;
    return time_point(std::chrono::duration_cast<time_point::duration>(std::chrono::microseconds{us}));
}

// trailing Z, +hh:mm, -hh:mm or +hhmm; returns offset east of UTC in minutes
boost::optional<int> split_zone(std::string &s) {
    if (!s.empty() && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
        return 0;
    }
    const auto t = s.find('T');
    if (t == std::string::npos)
        return boost::none;
    const auto sign = s.find_last_of("+-");
    if (sign == std::string::npos || sign < t)
        return 0;  // no zone, taken as UTC
    std::string zone = s.substr(sign + 1);
    zone.erase(std::remove(zone.begin(), zone.end(), ':'), zone.end());
    if (zone.size() != 4)
        return boost::none;
    const int hh = boost::lexical_cast<int>(zone.substr(0, 2));
    const int mm = boost::lexical_cast<int>(zone.substr(2, 2));
    const int offset = (hh * 60 + mm) * (s[sign] == '-' ? -1 : 1);
    s.erase(sign);
    return offset;
}

} // anon namespace

boost::optional<time_point> parse_timestamp(const json &value) {
    if (value.is_number()) {
        const double secs = value.number();
        // past int64 microseconds
        if (!std::isfinite(secs) || std::fabs(secs) > 9.2e12)
            return boost::none;
        return from_micros(static_cast<int64_t>(std::llround(secs * 1e6)));
    }
    if (!value.is_string())
        return boost::none;

    using namespace boost::posix_time;
    std::string s = value.str();
    try {
        const auto offset = split_zone(s);
        if (!offset)
            return boost::none;
        const ptime pt = from_iso_extended_string(s);
        if (pt.is_special())
            return boost::none;
        const ptime epoch(boost::gregorian::date(1970, 1, 1));
        const int64_t us = (pt - epoch).total_microseconds() - int64_t(*offset) * 60 * 1000000;
        const auto t = from_micros(us);
        if (!t)
            VLOG(vlog_key) << "timestamp out of range " << value;
        return t;
    } catch (const std::exception &e) {
        VLOG(vlog_key) << "unparsable timestamp " << value << ": " << e.what();
        return boost::none;
    }
}

//----------------------------------------------------------------
// key_resolver
//

key_resolver::key_resolver(std::string meter_template, std::shared_ptr<clock_source> clock)
    : _meter(std::move(meter_template)), _clock(std::move(clock))
{
}

resolved_record key_resolver::resolve(const json &record) const {
    resolved_record r;
    r.key = _meter.render(record);
    const auto ts = parse_timestamp(record.get(timestamp_field));
    r.timestamp = ts ? *ts : _clock->now();
    return r;
}

} // end namespace metron
