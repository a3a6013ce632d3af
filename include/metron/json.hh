#ifndef LIBMETRON_JSON_HH
#define LIBMETRON_JSON_HH

#include <jansson.h>
#include <string.h>
#include <ostream>
#include <string>
#include <initializer_list>
#include <utility>

#include <limits.h>
#ifndef JSON_INTEGER_IS_LONG_LONG
# error Y2038
#endif

namespace metron {

void dump(std::ostream &o, const json_t *j, unsigned flags = JSON_ENCODE_ANY);

enum json_take_t { json_take };

namespace impl {

//! like shared_ptr but only for Jansson's json_t
class json_ptr {
private:
    json_t *p;

public:
    json_ptr()                          : p() {}
    explicit json_ptr(json_t *j)        : p(json_incref(j)) {}
    json_ptr(json_t *j, json_take_t)    : p(j) {}
    ~json_ptr()                         { json_decref(p); }

    json_ptr(              const json_ptr  &jp) : p(json_incref(jp.get())) {}
    json_ptr(                    json_ptr &&jp) : p(jp.release())          {}
    json_ptr & operator = (const json_ptr  &jp) { reset(jp.get());    return *this; }
    json_ptr & operator = (      json_ptr &&jp) { take(jp.release()); return *this; }

    explicit operator bool () const { return get(); }

    void reset(json_t *j)  { take(json_incref(j)); }
    void take(json_t *j)   { json_decref(p); p = j; }

    json_t *get() const    { return p; }
    json_t *release()      { auto j = p; p = nullptr; return j; }
};

} // impl

//! JSON value for input records and output snapshots
class json {
private:
    using json_ptr = impl::json_ptr;
    json_ptr _p;

    json_t *_o_get() {
        if (!_p)
            _p.take(json_object());
        return get();
    }
    json_t *_a_get() {
        if (!_p)
            _p.take(json_array());
        return get();
    }

public:
    json()                                     : _p()                 {}
    json(const json  &js)                      : _p(js._p)            {}
    json(      json &&js)                      : _p(std::move(js._p)) {}
    explicit json(json_t *j)                   : _p(j)                {}
             json(json_t *j, json_take_t t)    : _p(j, t)             {}
    json & operator = (const json  &js)        { _p = js._p;            return *this; }
    json & operator = (      json &&js)        { _p = std::move(js._p); return *this; }

    json(const char *s)                        : _p(json_string(s),                 json_take) {}
    json(const std::string &s)                 : _p(json_stringn(s.data(), s.size()), json_take) {}
    json(int i)                                : _p(json_integer(i),                json_take) {}
    json(long i)                               : _p(json_integer(i),                json_take) {}
    json(long long i)                          : _p(json_integer(i),                json_take) {}
    json(unsigned u)                           : _p(json_integer(u),                json_take) {}
    json(double r)                             : _p(json_real(r),                   json_take) {}
    json(bool b)                               : _p(json_boolean(b),                json_take) {}

    static json object()                   { return json(json_object(),   json_take); }
    static json array()                    { return json(json_array(),    json_take); }
    static json integer(json_int_t i)      { return json(json_integer(i), json_take); }

    static json array(std::initializer_list<json> init) {
        json a = array();
        for (const auto &j : init)
            a.push(j);
        return a;
    }

    json_t *get() const                        { return _p.get(); }

    explicit operator bool () const            { return get(); }

    friend bool operator == (const json &lhs, const json &rhs) {
        const auto jl = lhs.get();
        const auto jr = rhs.get();
        return (!jl && !jr) || json_equal(jl, jr);
    }
    friend bool operator != (const json &lhs, const json &rhs) {
        return !(lhs == rhs);
    }

    //! \throw errorx on malformed text
    static json load(const std::string &s, unsigned flags = JSON_DECODE_ANY)  { return load(s.data(), s.size(), flags); }
    static json load(const char *s, size_t len, unsigned flags);

    std::string dump(unsigned flags = JSON_ENCODE_ANY | JSON_COMPACT) const;

    friend std::ostream & operator << (std::ostream &o, const json &j) {
        metron::dump(o, j.get(), JSON_ENCODE_ANY | JSON_COMPACT);
        return o;
    }

    bool is_object()     const  { return json_is_object(get()); }
    bool is_array()      const  { return json_is_array(get()); }
    bool is_string()     const  { return json_is_string(get()); }
    bool is_integer()    const  { return json_is_integer(get()); }
    bool is_number()     const  { return json_is_number(get()); }
    bool is_null()       const  { return json_is_null(get()); }

    std::string str()    const  { return std::string(json_string_value(get()), json_string_length(get())); }
    json_int_t integer() const  { return json_integer_value(get()); }
    double real()        const  { return json_real_value(get()); }
    double number()      const  { return json_number_value(get()); }

    size_t osize() const                               { return      json_object_size(   get());                  }
    json get(   const char *key)        const          { return json(json_object_get(    get(), key));            }
    json get(   const std::string &key) const          { return json(json_object_get(    get(), key.c_str()));    }
    bool set(   const char *key,        const json &j) { return     !json_object_set( _o_get(), key,         j.get()); }
    bool set(   const std::string &key, const json &j) { return     !json_object_set( _o_get(), key.c_str(), j.get()); }

    size_t asize() const                               { return      json_array_size(   get());          }
    json at(size_t i) const                            { return json(json_array_get(    get(), i));      }
    bool push(const json &aj)                          { return     !json_array_append( _a_get(), aj.get()); }
};

} // end namespace metron

#endif // LIBMETRON_JSON_HH
