#include "memory_region.hpp"

#include <cstring>

namespace appd {

memory_region::memory_region(u32 length) {
    bytes.resize(length);
}

void memory_region::check_range(u64 addr, u64 width) const {
    if (addr + width > bytes.size) {
        throw range_error{"memory", "The specified range is invalid. "
                "Access of " + std::to_string(width) + " bytes at "
                + std::to_string(addr) + " exceeds length "
                + std::to_string(bytes.size) + "."};
    }
}

void memory_region::set_length(u32 new_length) {
    // resize either completes or throws before touching the contents
    bytes.resize(new_length);
}

// little-endian helpers. These assume the range was already checked.
static u64 load_le(const u8* p, u32 width) {
    u64 res = 0;
    for (u32 i = 0; i < width; ++i) {
        res |= (u64)p[i] << (8*i);
    }
    return res;
}

static void store_le(u8* p, u64 v, u32 width) {
    for (u32 i = 0; i < width; ++i) {
        p[i] = (u8)(v >> (8*i));
    }
}

u8 memory_region::read_u8(u32 addr) const {
    check_range(addr, 1);
    return bytes[addr];
}

u16 memory_region::read_u16(u32 addr) const {
    check_range(addr, 2);
    return (u16)load_le(&bytes.data[addr], 2);
}

i32 memory_region::read_i32(u32 addr) const {
    check_range(addr, 4);
    return (i32)(u32)load_le(&bytes.data[addr], 4);
}

f32 memory_region::read_f32(u32 addr) const {
    check_range(addr, 4);
    auto bits = (u32)load_le(&bytes.data[addr], 4);
    f32 res;
    memcpy(&res, &bits, 4);
    return res;
}

f64 memory_region::read_f64(u32 addr) const {
    check_range(addr, 8);
    auto bits = load_le(&bytes.data[addr], 8);
    f64 res;
    memcpy(&res, &bits, 8);
    return res;
}

void memory_region::write_u8(u32 addr, u8 v) {
    check_range(addr, 1);
    bytes[addr] = v;
}

void memory_region::write_u16(u32 addr, u16 v) {
    check_range(addr, 2);
    store_le(&bytes.data[addr], v, 2);
}

void memory_region::write_i32(u32 addr, i32 v) {
    check_range(addr, 4);
    store_le(&bytes.data[addr], (u32)v, 4);
}

void memory_region::write_f32(u32 addr, f32 v) {
    check_range(addr, 4);
    u32 bits;
    memcpy(&bits, &v, 4);
    store_le(&bytes.data[addr], bits, 4);
}

void memory_region::write_f64(u32 addr, f64 v) {
    check_range(addr, 8);
    u64 bits;
    memcpy(&bits, &v, 8);
    store_le(&bytes.data[addr], bits, 8);
}

void memory_region::read_bytes(u32 addr, u8* dest, u32 count) const {
    check_range(addr, count);
    if (count > 0) {
        memcpy(dest, &bytes.data[addr], count);
    }
}

void memory_region::write_bytes(u32 addr, const u8* src, u32 count) {
    check_range(addr, count);
    if (count > 0) {
        memcpy(&bytes.data[addr], src, count);
    }
}

}
