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
#include <cstddef>
#include <string>

namespace dfstate {
namespace persist {

// CRC32C (Castagnoli) of a whole buffer, used for batch-log frames and
// snapshot headers and bodies. Hardware instructions when the CPU has them.
uint32_t crc32c(const void* data, size_t len);

inline uint32_t crc32c(const std::string& data) {
    return crc32c(data.data(), data.size());
}

// Running (unfinalized) sums of each code path
namespace crc32c_impl {
    uint32_t extend_table(uint32_t crc, const uint8_t* data, size_t len);

    bool hardware_available();
#if defined(__x86_64__)
    uint32_t extend_sse42(uint32_t crc, const uint8_t* data, size_t len);
#elif defined(__aarch64__)
    uint32_t extend_armv8(uint32_t crc, const uint8_t* data, size_t len);
#endif
} // namespace crc32c_impl

} // namespace persist
} // namespace dfstate
