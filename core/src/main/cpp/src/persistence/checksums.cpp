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
#include "checksums.h"
#include <cstring>
#include <mutex>

#if defined(__x86_64__)
#include <immintrin.h>
#endif
#if defined(__aarch64__) && defined(__ARM_FEATURE_CRC32)
#include <arm_acle.h>
#endif

namespace dfstate {
namespace persist {

namespace {
    uint32_t g_table[8][256];
    std::once_flag g_table_once;

    void build_table() {
        // reflected Castagnoli polynomial
        constexpr uint32_t poly = 0x82F63B78u;
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t r = i;
            for (int k = 0; k < 8; ++k) {
                r = (r >> 1) ^ (-(int)(r & 1) & poly);
            }
            g_table[0][i] = r;
        }
        for (int t = 1; t < 8; ++t) {
            for (uint32_t i = 0; i < 256; ++i) {
                g_table[t][i] = (g_table[t-1][i] >> 8) ^ g_table[0][g_table[t-1][i] & 0xFF];
            }
        }
    }

    inline uint32_t step_byte(uint32_t crc, uint8_t b) {
        return (crc >> 8) ^ g_table[0][(crc ^ b) & 0xFF];
    }
}

namespace crc32c_impl {

    uint32_t extend_table(uint32_t crc, const uint8_t* p, size_t len) {
        std::call_once(g_table_once, build_table);

        while (len > 0 && ((uintptr_t)p & 7) != 0) {
            crc = step_byte(crc, *p++);
            len--;
        }
        // slicing-by-8
        while (len >= 8) {
            uint64_t v;
            memcpy(&v, p, 8);
            uint32_t lo = crc ^ (uint32_t)v;
            uint32_t hi = (uint32_t)(v >> 32);
            crc = g_table[7][lo & 0xFF] ^ g_table[6][(lo >> 8) & 0xFF] ^
                  g_table[5][(lo >> 16) & 0xFF] ^ g_table[4][lo >> 24] ^
                  g_table[3][hi & 0xFF] ^ g_table[2][(hi >> 8) & 0xFF] ^
                  g_table[1][(hi >> 16) & 0xFF] ^ g_table[0][hi >> 24];
            p += 8;
            len -= 8;
        }
        while (len--) {
            crc = step_byte(crc, *p++);
        }
        return crc;
    }

#if defined(__x86_64__)
    bool hardware_available() {
        static const bool supported = __builtin_cpu_supports("sse4.2");
        return supported;
    }

    __attribute__((target("sse4.2")))
    uint32_t extend_sse42(uint32_t crc, const uint8_t* p, size_t len) {
        uint64_t wide = crc;
        while (len >= 8) {
            uint64_t v;
            memcpy(&v, p, 8);
            wide = _mm_crc32_u64(wide, v);
            p += 8;
            len -= 8;
        }
        crc = static_cast<uint32_t>(wide);
        while (len--) {
            crc = _mm_crc32_u8(crc, *p++);
        }
        return crc;
    }
#elif defined(__aarch64__)
    bool hardware_available() {
#ifdef __ARM_FEATURE_CRC32
        return true;
#else
        return false;
#endif
    }

    uint32_t extend_armv8(uint32_t crc, const uint8_t* p, size_t len) {
#ifdef __ARM_FEATURE_CRC32
        while (len >= 8) {
            uint64_t v;
            memcpy(&v, p, 8);
            crc = __crc32cd(crc, v);
            p += 8;
            len -= 8;
        }
        while (len--) {
            crc = __crc32cb(crc, *p++);
        }
        return crc;
#else
        return extend_table(crc, p, len);
#endif
    }
#else
    bool hardware_available() {
        return false;
    }
#endif

} // namespace crc32c_impl

uint32_t crc32c(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint32_t crc = ~0u;
#if defined(__x86_64__)
    if (crc32c_impl::hardware_available()) {
        return crc32c_impl::extend_sse42(crc, p, len) ^ ~0u;
    }
#elif defined(__aarch64__)
    if (crc32c_impl::hardware_available()) {
        return crc32c_impl::extend_armv8(crc, p, len) ^ ~0u;
    }
#endif
    return crc32c_impl::extend_table(crc, p, len) ^ ~0u;
}

} // namespace persist
} // namespace dfstate
