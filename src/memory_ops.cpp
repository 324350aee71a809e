#include "memory_ops.hpp"

#include <cmath>
#include <limits>

namespace appd {

i32 to_int32(f64 num) {
    if (!std::isfinite(num)) {
        return 0;
    }
    auto t = std::trunc(num);
    auto m = std::fmod(t, 4294967296.0);
    if (m < 0) {
        m += 4294967296.0;
    }
    return (i32)(u32)m;
}

f32 to_float32(f64 num) {
    constexpr f64 max = std::numeric_limits<f32>::max();
    // halfway between FLT_MAX and 2^128. Rounding to nearest even goes up from
    // here, so this and anything larger becomes infinity.
    constexpr f64 overflow = 0x1p128 - 0x1p103;
    auto mag = std::fabs(num);
    if (mag >= overflow) {
        return std::copysign(std::numeric_limits<f32>::infinity(), num);
    } else if (mag > max) {
        return (f32)std::copysign(max, num);
    }
    return (f32)num;
}

static void bad_opcode(u8 op, const char* what) {
    throw invariant_violation{"memory", "Opcode " + std::to_string(op)
            + " is not a domain memory " + what + "."};
}

static u32 check_addr(i64 addr) {
    if (addr < 0 || addr > (i64)UINT32_MAX) {
        throw range_error{"memory", "The specified range is invalid. "
                "Address " + std::to_string(addr) + " is out of bounds."};
    }
    return (u32)addr;
}

f64 exec_load(const domain& d, u8 op, i64 addr) {
    if (!is_load_op(op)) {
        bad_opcode(op, "load");
    }
    auto mem = d.memory();
    auto a = check_addr(addr);
    switch (op) {
    case OP_LI8:
        return mem->read_u8(a);
    case OP_LI16:
        return mem->read_u16(a);
    case OP_LI32:
        return mem->read_i32(a);
    case OP_LF32:
        return mem->read_f32(a);
    default:
        return mem->read_f64(a);
    }
}

void exec_store(const domain& d, u8 op, i64 addr, f64 v) {
    if (!is_store_op(op)) {
        bad_opcode(op, "store");
    }
    auto mem = d.memory();
    auto a = check_addr(addr);
    switch (op) {
    case OP_SI8:
        mem->write_u8(a, (u8)to_int32(v));
        break;
    case OP_SI16:
        mem->write_u16(a, (u16)to_int32(v));
        break;
    case OP_SI32:
        mem->write_i32(a, to_int32(v));
        break;
    case OP_SF32:
        mem->write_f32(a, to_float32(v));
        break;
    default:
        mem->write_f64(a, v);
        break;
    }
}

i32 exec_sign_extend(u8 op, i32 v) {
    switch (op) {
    case OP_SXI1:
        return (v & 1) ? -1 : 0;
    case OP_SXI8:
        return (i32)(i8)(u8)v;
    case OP_SXI16:
        return (i32)(i16)(u16)v;
    default:
        bad_opcode(op, "sign extension");
        return 0;
    }
}

}
