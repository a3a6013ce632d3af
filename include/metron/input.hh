#ifndef LIBMETRON_INPUT_HH
#define LIBMETRON_INPUT_HH

#include <string>
#include "metron/descriptors.hh"

namespace metron {

//! newline-delimited records from a descriptor, interruptible by signal
class line_input {
public:
    enum result { got_line, end_of_input, interrupted };

private:
    static constexpr size_t chunk_size = 64 * 1024;

    fd_base _fd;
    signal_fd &_interrupt;
    std::string _buf;
    bool _eof = false;
    int _signo = 0;

public:
    line_input(fd_base fd, signal_fd &interrupt);

    //! block until a full line, end of input, or a signal on the interrupt fd.
    //! a final line without a newline is still returned.
    //! \throw errno_error on read or poll failure
    result next(std::string &line);

    //! the signal that interrupted next()
    int signo() const { return _signo; }
};

} // end namespace metron

#endif // LIBMETRON_INPUT_HH
