#include "base.hpp"

#include <sstream>

namespace appd {

appd_exception::appd_exception(const string& subsystem,
        const string& message,
        u32 code)
    : subsystem{subsystem}
    , message{message}
    , code{code} {
    std::ostringstream ss;
    ss << "[" << subsystem << "] Error";
    if (code != 0) {
        ss << " #" << code;
    }
    ss << ": " << message;
    formatted = ss.str();
}

const char* appd_exception::what() const noexcept {
    return formatted.c_str();
}

// Hashes for std::string and integers use FNV-1a
template<> u64 hash<string>(const string& s) {
    static const u64 prime = 0x100000001b3;
    u64 res = 0xcbf29ce484222325;
    for (u32 i=0; i<s.length(); ++i) {
        res ^= (u8)s[i];
        res *= prime;
    }
    return res;
}

template<> u64 hash<u64>(const u64& u) {
    static const u64 prime = 0x100000001b3;
    u64 res = 0xcbf29ce484222325;
    auto bytes = u;
    for (int i = 0; i < 8; ++i) {
        res ^= (bytes & 0xff);
        res *= prime;
        bytes = bytes >> 8;
    }
    return res;
}

}
