// memory_ops.hpp -- domain memory instructions

#ifndef __APPD_MEMORY_OPS_HPP
#define __APPD_MEMORY_OPS_HPP

#include "base.hpp"
#include "domain.hpp"

namespace appd {

// Instructions which access the memory of the current domain. The interpreter
// decodes these and hands them to exec_load()/exec_store(), which pick the
// domain's memory region and do the bounds checking.
enum MEMORY_OPCODES : u8 {
    // li8, load an unsigned byte
    OP_LI8,
    // li16, load an unsigned 16-bit integer
    OP_LI16,
    // li32, load a signed 32-bit integer
    OP_LI32,
    // lf32, load a 32-bit float (widened to 64 bits)
    OP_LF32,
    // lf64, load a 64-bit float
    OP_LF64,

    // stores take the number operand through ToInt32 (integer stores) or
    // narrow it (float stores)
    OP_SI8,
    OP_SI16,
    OP_SI32,
    OP_SF32,
    OP_SF64,

    // sign extension ops don't touch memory. They extend the low 1, 8, or 16
    // bits of an integer to 32 bits.
    OP_SXI1,
    OP_SXI8,
    OP_SXI16
};

// gives the number of bytes of memory touched by an instruction. This is 0 for
// the sign extension ops.
inline u8 access_width(u8 op) {
    switch (op) {
    case OP_LI8:
    case OP_SI8:
        return 1;
    case OP_LI16:
    case OP_SI16:
        return 2;
    case OP_LI32:
    case OP_LF32:
    case OP_SI32:
    case OP_SF32:
        return 4;
    case OP_LF64:
    case OP_SF64:
        return 8;
    default:
        return 0;
    }
}

inline bool is_load_op(u8 op) {
    return op <= OP_LF64;
}

inline bool is_store_op(u8 op) {
    return op >= OP_SI8 && op <= OP_SF64;
}

// ECMAScript ToInt32: NaN and infinities become 0, other values are truncated
// and wrapped modulo 2^32
i32 to_int32(f64 num);
// narrow a number for sf32, rounding to nearest. Finite values too large for
// f32 become FLT_MAX or infinity as IEEE rounding would give.
f32 to_float32(f64 num);

// Execute a load in d's memory. addr comes straight off the interpreter stack,
// so negative addresses are possible; they raise range_error like any other
// out-of-bounds access.
f64 exec_load(const domain& d, u8 op, i64 addr);
void exec_store(const domain& d, u8 op, i64 addr, f64 v);
i32 exec_sign_extend(u8 op, i32 v);

}

#endif
