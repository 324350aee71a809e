#ifndef __APPD_LOG_HPP
#define __APPD_LOG_HPP

#include "base.hpp"

#include <ostream>

namespace appd {

class logger {
private:
    std::ostream* err_out;
    std::ostream* info_out;

public:
    // info_out and err_out must be externally managed and ensured to outlive
    // the logger. They may be null, in which case messages are simply ignored.
    logger(std::ostream* err_out, std::ostream* info_out);

    // logs an exception raised by this library (as an error), including its
    // host error code if it has one
    void log_exception(const appd_exception& e);
    // an error goes to err_out and indicates a stoppage of control flow
    void log_error(const string& subsystem, const string& message);
    // a warning goes to err_out but is not considered fatal
    void log_warning(const string& subsystem, const string& message);
    // info messages are logged to info_out
    void log_info(const string& subsystem, const string& message);
};

}

#endif
