// base.hpp -- common typedefs and error handling code for appd

#ifndef __APPD_BASE_HPP
#define __APPD_BASE_HPP

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace appd {

/// aliases imported from std
template<class T> using optional = std::optional<T>;
using string = std::string;

template<class T> using shared_ptr = std::shared_ptr<T>;
template<class T> using weak_ptr = std::weak_ptr<T>;

/// integer/float typedefs by bitwidth
typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;

typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;

// domain memory stores floats bit-for-bit, so the widths have to be exact
static_assert(sizeof(float) == 4);
typedef float f32;
static_assert(sizeof(double) == 8);
typedef double f64;

// this is implemented for std::string, u64, and qualified_name (in names.cpp)
template<typename T> u64 hash(const T& v);
template<> u64 hash<string>(const string& s);
template<> u64 hash<u64>(const u64& u);

// error codes shown to scripts. These match the numbering used by the host
// player so that error messages look familiar.
constexpr u32 ERR_COERCE_FAILED         = 1034;
constexpr u32 ERR_UNDEFINED_VAR         = 1065;
constexpr u32 ERR_NOT_PARAMETERIZED     = 1127;
constexpr u32 ERR_INVALID_RANGE         = 1506;

// Base class of every exception raised by this library. The interpreter is
// expected to catch these and rethrow them as script-level errors.
class appd_exception : public std::exception {
    string formatted;

public:
    const string subsystem;
    const string message;
    // host error code, or 0 if there is none
    const u32 code;

    appd_exception(const string& subsystem,
            const string& message,
            u32 code=0);

    const char* what() const noexcept override;
};

// a name could not be found anywhere in a domain chain
class reference_error : public appd_exception {
public:
    reference_error(const string& subsystem, const string& message)
        : appd_exception{subsystem, message, ERR_UNDEFINED_VAR} {
    }
};

// a multiname without a local name was used where one is required. This
// indicates a bug in the caller rather than a script error.
class malformed_name_error : public appd_exception {
public:
    malformed_name_error(const string& subsystem, const string& message)
        : appd_exception{subsystem, message} {
    }
};

// out-of-bounds domain memory access
class range_error : public appd_exception {
public:
    range_error(const string& subsystem, const string& message)
        : appd_exception{subsystem, message, ERR_INVALID_RANGE} {
    }
};

class type_error : public appd_exception {
public:
    type_error(const string& subsystem, const string& message, u32 code)
        : appd_exception{subsystem, message, code} {
    }
};

// Raised when internal state is inconsistent, e.g. a fully constructed domain
// without memory. These are construction-order bugs and should not be caught
// by script code.
class invariant_violation : public appd_exception {
public:
    invariant_violation(const string& subsystem, const string& message)
        : appd_exception{subsystem, message} {
    }
};

}

#endif
