#ifndef LIBMETRON_STRIPED_HH
#define LIBMETRON_STRIPED_HH

#include <functional>
#include <vector>
#include <stdexcept>

namespace metron {

//! fixed set of stripes selected by key hash
//
//! used to split one big lock into many so unrelated keys do not contend.
//! the number of stripes never changes after construction.
template <class T> class striped {
public:
    typedef typename std::vector<T>::size_type size_type;
private:
    std::vector<T> _stripes;

public:
    explicit striped(size_type size) : _stripes(size) {
        if (!size)
            throw std::invalid_argument("striped: zero stripes");
    }

    template <class Key> size_type index(const Key &key) const {
        std::hash<Key> hasher;
        return hasher(key) % _stripes.size();
    }

    template <class Key> T &get(const Key &key) {
        return at(index(key));
    }

    template <class Key> const T &get(const Key &key) const {
        return at(index(key));
    }

    T &at(const size_type i)             { return _stripes.at(i); }
    const T &at(const size_type i) const { return _stripes.at(i); }

    size_type size() const {
        return _stripes.size();
    }
};

} // end namespace metron

#endif // LIBMETRON_STRIPED_HH
