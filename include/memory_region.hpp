// memory_region.hpp -- linear byte buffers used as domain memory

#ifndef __APPD_MEMORY_REGION_HPP
#define __APPD_MEMORY_REGION_HPP

#include "array.hpp"
#include "base.hpp"

namespace appd {

// length of freshly created domain memory
constexpr u32 DEFAULT_MEMORY_LENGTH = 1024;
// domain memory may not be replaced by anything shorter than this
constexpr u32 MIN_MEMORY_LENGTH = 1024;

// A resizable, bounds-checked byte buffer. Multi-byte values are stored
// little-endian regardless of the host byte order. Every access outside of
// [0, length) raises range_error and leaves the buffer untouched.
class memory_region {
private:
    dyn_array<u8> bytes;

    void check_range(u64 addr, u64 width) const;

public:
    explicit memory_region(u32 length=DEFAULT_MEMORY_LENGTH);

    u32 length() const {
        return bytes.size;
    }
    // Grow or shrink the buffer. New bytes are zeroed. Bytes past a shrink are
    // discarded, so growing again afterwards yields zeros, not the old data.
    void set_length(u32 new_length);

    u8 read_u8(u32 addr) const;
    u16 read_u16(u32 addr) const;
    i32 read_i32(u32 addr) const;
    f32 read_f32(u32 addr) const;
    f64 read_f64(u32 addr) const;

    void write_u8(u32 addr, u8 v);
    void write_u16(u32 addr, u16 v);
    void write_i32(u32 addr, i32 v);
    void write_f32(u32 addr, f32 v);
    void write_f64(u32 addr, f64 v);

    // bulk copies. count bytes must lie within the buffer.
    void read_bytes(u32 addr, u8* dest, u32 count) const;
    void write_bytes(u32 addr, const u8* src, u32 count);
};

}

#endif
