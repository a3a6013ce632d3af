#include "metron/json.hh"
#include "metron/error.hh"
#include <sstream>

namespace metron {

extern "C" {
static int ostream_json_dump_callback(const char *buffer, size_t size, void *osptr) {
    std::ostream *o = reinterpret_cast<std::ostream *>(osptr);
    o->write(buffer, size);
    return o->good() ? 0 : -1;
}
} // "C"

void dump(std::ostream &o, const json_t *j, unsigned flags) {
    if (j)
        json_dump_callback(j, ostream_json_dump_callback, &o, flags);
}

std::string json::dump(unsigned flags) const {
    std::ostringstream ss;
    if (_p)
        json_dump_callback(_p.get(), ostream_json_dump_callback, static_cast<std::ostream *>(&ss), flags);
    return ss.str();
}

json json::load(const char *s, size_t len, unsigned flags) {
    json_error_t err;
    json j(json_loadb(s, len, flags, &err), json_take);
    if (!j)
        throw errorx("json: %s at line %d column %d", err.text, err.line, err.column);
    return j;
}

} // end namespace metron
