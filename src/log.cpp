#include "log.hpp"

namespace appd {

logger::logger(std::ostream* err_out, std::ostream* info_out)
    : err_out{err_out}
    , info_out{info_out} {
}

static void print_message(std::ostream* out,
        const char* level,
        const string& subsystem,
        const string& message) {
    if (out == nullptr) {
        return;
    }
    (*out) << "[" << level << "] " << subsystem << ":\n\t"
           << message << '\n';
}

void logger::log_exception(const appd_exception& e) {
    if (e.code == 0) {
        log_error(e.subsystem, e.message);
    } else {
        log_error(e.subsystem,
                "Error #" + std::to_string(e.code) + ": " + e.message);
    }
}

void logger::log_error(const string& subsystem, const string& message) {
    print_message(err_out, "ERROR", subsystem, message);
}

void logger::log_warning(const string& subsystem, const string& message) {
    print_message(err_out, "WARNING", subsystem, message);
}

void logger::log_info(const string& subsystem, const string& message) {
    print_message(info_out, "INFO", subsystem, message);
}

}
