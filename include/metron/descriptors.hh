#ifndef LIBMETRON_DESCRIPTORS_HH
#define LIBMETRON_DESCRIPTORS_HH

#include "metron/error.hh"
#include "metron/logging.hh"

#include <errno.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <sys/signalfd.h>
#include <signal.h>
#include <utility>

namespace metron {

inline bool io_not_ready(int e = errno) {
#if defined(EWOULDBLOCK) && (EWOULDBLOCK != EAGAIN)
    return (e == EAGAIN) || (e == EWOULDBLOCK);
#else
    return (e == EAGAIN);
#endif
}

//! owned file descriptor, closed in the destructor
struct fd_base {
    int fd;

    explicit fd_base(int fd_=-1) : fd(fd_) {}

    fd_base(const fd_base &) = delete;
    fd_base &operator =(const fd_base &) = delete;

    fd_base(fd_base &&other) : fd(other.fd) {
        other.fd = -1;
    }
    fd_base &operator = (fd_base &&other) {
        if (this != &other) {
            if (valid()) close();
            std::swap(fd, other.fd);
        }
        return *this;
    }

    bool valid() const { return fd != -1; }

    ssize_t read(void *buf, size_t count) noexcept __attribute__((warn_unused_result)) {
        return ::read(fd, buf, count);
    }

    void close() noexcept {
        if (::close(fd) == -1 && errno == EINTR) {
            saved_backtrace bt;
            LOG(DFATAL) << "close() failed with EINTR; This Should Never Happen\n" << bt.str();
        }
        fd = -1;
    }

    ~fd_base() {
        if (valid()) close();
    }
};

//! descriptor opened from a path
struct file_fd : fd_base {
    //! \throw errno_error if open fails
    file_fd(const char *pathname, int flags, mode_t mode = 0) {
        fd = ::open(pathname, flags | O_CLOEXEC, mode);
        throw_if(fd == -1, "open %s", pathname);
    }
};

//! a private copy of an inherited descriptor such as stdin
inline fd_base dup_fd(int fd) {
    const int nfd = ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
    throw_if(nfd == -1, "dup %d", fd);
    return fd_base(nfd);
}

struct signal_fd : fd_base {
    //! create fd with signalfd()
    //! also calls sigprocmask() to block the signals in mask, so threads
    //! started afterwards inherit the block
    signal_fd(const sigset_t &mask, int flags=0) {
        throw_if(::sigprocmask(SIG_BLOCK, &mask, NULL) == -1, "sigprocmask");
        fd = ::signalfd(-1, &mask, flags | SFD_CLOEXEC);
        throw_if(fd == -1, "signalfd");
    }

    void read(struct signalfd_siginfo &siginfo) {
        const ssize_t r = fd_base::read(&siginfo, sizeof(siginfo));
        throw_if(r == -1, "signalfd read");
    }
};

} // end namespace metron

#endif // LIBMETRON_DESCRIPTORS_HH
