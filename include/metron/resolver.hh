#ifndef LIBMETRON_RESOLVER_HH
#define LIBMETRON_RESOLVER_HH

#include <memory>
#include <string>
#include <vector>
#include <boost/optional.hpp>

#include "metron/clock.hh"
#include "metron/json.hh"

namespace metron {

//! a string with %{field} references into a record
//
//! %{name} reads a top level field, %{[a][b]} walks nested objects.
//! strings are copied as is, numbers and booleans as their JSON text,
//! arrays as their elements joined by ',' and objects as compact JSON.
//! a reference to a missing or null field stays in the output verbatim.
class key_template {
    struct segment {
        std::string text;               // literal, or the reference as written
        std::vector<std::string> path;  // empty for literals
    };
    std::string _source;
    std::vector<segment> _segments;

public:
    explicit key_template(std::string source);

    const std::string &source() const { return _source; }

    //! true if there are no references to resolve
    bool is_constant() const;

    std::string render(const json &record) const;
};

//! field path of a reference body, "[a][b]" -> {a, b}, "a" -> {a}
std::vector<std::string> parse_field_ref(const std::string &ref);

//! field value at path, or a null json
json lookup_field(const json &record, const std::vector<std::string> &path);

//! parse an ISO-8601 date-time string or a number of epoch seconds
boost::optional<clock_source::time_point> parse_timestamp(const json &value);

//! a record after key interpolation and timestamp extraction
struct resolved_record {
    std::string key;
    clock_source::time_point timestamp;
};

//! turns input records into (key, timestamp) for engine::mark
class key_resolver {
    const key_template _meter;
    const std::shared_ptr<clock_source> _clock;

public:
    static const char timestamp_field[];

    key_resolver(std::string meter_template, std::shared_ptr<clock_source> clock);

    //! records without a usable @timestamp are stamped with now
    resolved_record resolve(const json &record) const;
};

} // end namespace metron

#endif // LIBMETRON_RESOLVER_HH
