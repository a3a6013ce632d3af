#ifndef LIBMETRON_SYNCHRONIZED_HH
#define LIBMETRON_SYNCHRONIZED_HH

#include <mutex>
#include <type_traits>
#include <boost/thread/shared_mutex.hpp>
#include <boost/thread/locks.hpp>

namespace metron {

//! a value that is only reachable while holding its mutex
//
//! with a shared mutex (boost::shared_mutex), shared() takes a reader lock
//! so lookups do not serialize against each other.
template <typename T, typename Mutex = std::mutex>
class synchronized {
    mutable Mutex _m;
    T _v;

public:
    using mutex_type  = Mutex;
    using guard_type  = std::lock_guard<Mutex>;
    using shared_type = boost::shared_lock<Mutex>;

    synchronized() : _v() {}

    template <typename ...Args>
        explicit synchronized(Args&&... args) : _v(std::forward<Args>(args)...) {}

    synchronized(const synchronized &other) = delete;
    synchronized(synchronized &&other)      = delete;
    synchronized & operator = (const synchronized &other) = delete;
    synchronized & operator = (synchronized &&other)      = delete;

    template <typename Func, typename Ret = typename std::result_of<Func(T&)>::type>
        auto operator () (Func &&f)       -> Ret
            { guard_type g(_m); return f(_v); }

    template <typename Func, typename Ret = typename std::result_of<Func(const T&)>::type>
        auto operator () (Func &&f) const -> Ret
            { guard_type g(_m); return f(_v); }

    //! run f with a reader lock; f only gets const access
    template <typename Func, typename Ret = typename std::result_of<Func(const T&)>::type>
        auto shared(Func &&f) const -> Ret
            { shared_type g(_m); return f(_v); }
};

} // end namespace metron

#endif // LIBMETRON_SYNCHRONIZED_HH
