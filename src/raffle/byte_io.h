#pragma once

#include "common/types.h"
#include <cstdint>
#include <algorithm>
#include <cstring>
#include <vector>

namespace solcino {
namespace raffle {
namespace byte_io {

// Little-endian fixed-width field access. Callers check bounds.

inline uint64_t read_u64(const uint8_t* p) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(p[i]) << (i * 8);
    }
    return value;
}

inline int64_t read_i64(const uint8_t* p) {
    return static_cast<int64_t>(read_u64(p));
}

inline uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline void write_u64(uint8_t* p, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
}

inline void write_i64(uint8_t* p, int64_t value) {
    write_u64(p, static_cast<uint64_t>(value));
}

inline void write_u16(uint8_t* p, uint16_t value) {
    p[0] = static_cast<uint8_t>(value & 0xFF);
    p[1] = static_cast<uint8_t>(value >> 8);
}

inline common::PublicKey read_key(const uint8_t* p) {
    return common::PublicKey(p, p + common::PUBKEY_BYTES);
}

// Keys shorter than 32 bytes are zero padded
inline void write_key(uint8_t* p, const common::PublicKey& key) {
    std::memset(p, 0, common::PUBKEY_BYTES);
    std::memcpy(p, key.data(), std::min(key.size(), common::PUBKEY_BYTES));
}

inline void append_u64(std::vector<uint8_t>& out, uint64_t value) {
    uint8_t buf[8];
    write_u64(buf, value);
    out.insert(out.end(), buf, buf + 8);
}

inline void append_u16(std::vector<uint8_t>& out, uint16_t value) {
    uint8_t buf[2];
    write_u16(buf, value);
    out.insert(out.end(), buf, buf + 2);
}

} // namespace byte_io
} // namespace raffle
} // namespace solcino
