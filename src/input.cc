#include "metron/input.hh"
#include <poll.h>

namespace metron {

constexpr size_t line_input::chunk_size;

line_input::line_input(fd_base fd, signal_fd &interrupt)
    : _fd(std::move(fd)), _interrupt(interrupt)
{
}

auto line_input::next(std::string &line) -> result {
    char chunk[chunk_size];
    for (;;) {
        const auto nl = _buf.find('\n');
        if (nl != std::string::npos) {
            line.assign(_buf, 0, nl);
            _buf.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return got_line;
        }
        if (_eof) {
            if (_buf.empty())
                return end_of_input;
            line.swap(_buf);
            _buf.clear();
            return got_line;
        }

        pollfd fds[2] = {
            { _fd.fd,        POLLIN, 0 },
            { _interrupt.fd, POLLIN, 0 },
        };
        if (::poll(fds, 2, -1) == -1) {
            if (errno == EINTR) continue;
            throw errno_error("poll");
        }
        if (fds[1].revents & POLLIN) {
            signalfd_siginfo si;
            _interrupt.read(si);
            _signo = si.ssi_signo;
            return interrupted;
        }
        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            const ssize_t nr = _fd.read(chunk, sizeof(chunk));
            if (nr == -1) {
                if (errno == EINTR || io_not_ready()) continue;
                throw errno_error("read");
            }
            if (nr == 0)
                _eof = true;
            else
                _buf.append(chunk, nr);
        }
    }
}

} // end namespace metron
