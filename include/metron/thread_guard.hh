#ifndef LIBMETRON_THREAD_GUARD_HH
#define LIBMETRON_THREAD_GUARD_HH

#include <thread>
#include <system_error>
#include "metron/logging.hh"

namespace metron {

//! wrapper that calls join on joinable threads in the destructor
class thread_guard {
private:
    std::thread _thread;
public:
    thread_guard() {}
    explicit thread_guard(std::thread t) : _thread{std::move(t)} {}

    thread_guard(const thread_guard &) = delete;
    thread_guard &operator =(const thread_guard &) = delete;
    thread_guard(thread_guard &&other) {
        std::swap(_thread, other._thread);
    }
    thread_guard &operator=(thread_guard &&other) {
        if (this != &other) {
            join();
            std::swap(_thread, other._thread);
        }
        return *this;
    }

    bool joinable() const { return _thread.joinable(); }

    void join() {
        try {
            if (_thread.joinable()) {
                _thread.join();
            }
        } catch (std::system_error &e) {
            LOG(ERROR) << "thread join failed: " << e.what();
        }
    }

    ~thread_guard() {
        join();
    }
};

} // end namespace metron

#endif // LIBMETRON_THREAD_GUARD_HH
