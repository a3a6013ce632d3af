#ifndef LIBMETRON_LOGGING_HH
#define LIBMETRON_LOGGING_HH

#include <glog/logging.h>
#include <glog/stl_logging.h>

namespace metron {

//! verbosity levels passed to VLOG
enum vlog_level {
    vlog_cycle = 1,  //!< once per flush cycle
    vlog_key   = 2   //!< once per key or record
};

} // end namespace metron

#endif // LIBMETRON_LOGGING_HH
