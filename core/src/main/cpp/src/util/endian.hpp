/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <string>

namespace dfstate {
namespace util {

/**
 * Byte-order helpers for the on-disk and key formats.
 *
 * Log frames, snapshot headers and row payloads are little-endian.
 * Encoded index keys are big-endian so that bytewise comparison of the
 * encoding matches numeric order.
 */

inline void store_le16(uint8_t* buf, uint16_t val) {
    buf[0] = static_cast<uint8_t>(val);
    buf[1] = static_cast<uint8_t>(val >> 8);
}

inline void store_le32(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>(val);
    buf[1] = static_cast<uint8_t>(val >> 8);
    buf[2] = static_cast<uint8_t>(val >> 16);
    buf[3] = static_cast<uint8_t>(val >> 24);
}

inline void store_le64(uint8_t* buf, uint64_t val) {
    store_le32(buf, static_cast<uint32_t>(val));
    store_le32(buf + 4, static_cast<uint32_t>(val >> 32));
}

inline uint16_t load_le16(const uint8_t* buf) {
    return static_cast<uint16_t>(buf[0]) |
           (static_cast<uint16_t>(buf[1]) << 8);
}

inline uint32_t load_le32(const uint8_t* buf) {
    return static_cast<uint32_t>(buf[0]) |
           (static_cast<uint32_t>(buf[1]) << 8) |
           (static_cast<uint32_t>(buf[2]) << 16) |
           (static_cast<uint32_t>(buf[3]) << 24);
}

inline uint64_t load_le64(const uint8_t* buf) {
    return static_cast<uint64_t>(load_le32(buf)) |
           (static_cast<uint64_t>(load_le32(buf + 4)) << 32);
}

inline void store_be64(uint8_t* buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf[i] = static_cast<uint8_t>(val);
        val >>= 8;
    }
}

inline uint64_t load_be64(const uint8_t* buf) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | buf[i];
    }
    return val;
}

// Append helpers used by the string-backed encoders

inline void append_le32(std::string& out, uint32_t val) {
    uint8_t b[4];
    store_le32(b, val);
    out.append(reinterpret_cast<const char*>(b), 4);
}

inline void append_le64(std::string& out, uint64_t val) {
    uint8_t b[8];
    store_le64(b, val);
    out.append(reinterpret_cast<const char*>(b), 8);
}

inline void append_be64(std::string& out, uint64_t val) {
    uint8_t b[8];
    store_be64(b, val);
    out.append(reinterpret_cast<const char*>(b), 8);
}

inline uint64_t double_bits(double val) {
    uint64_t bits;
    std::memcpy(&bits, &val, sizeof(double));
    return bits;
}

inline double bits_double(uint64_t bits) {
    double val;
    std::memcpy(&val, &bits, sizeof(double));
    return val;
}

} // namespace util
} // namespace dfstate
