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

#include "value.h"
#include "util/endian.hpp"
#include <cmath>
#include <cstring>
#include <iomanip>

namespace dfstate {

const char* to_string(DataType t) {
    switch (t) {
        case DataType::None:        return "None";
        case DataType::Int:         return "Int";
        case DataType::UnsignedInt: return "UnsignedInt";
        case DataType::Double:      return "Double";
        case DataType::Text:        return "Text";
        case DataType::ByteArray:   return "ByteArray";
        default:                    return "INVALID";
    }
}

static constexpr uint64_t kCanonicalNaN = 0x7FF8000000000000ULL;
static constexpr uint64_t kSignBit = 0x8000000000000000ULL;

uint64_t ordered_double_bits(double d) {
    uint64_t bits = std::isnan(d) ? kCanonicalNaN : util::double_bits(d);
    // negative: flip everything so larger magnitudes sort first
    // positive: flip the sign bit so positives sort above negatives
    return (bits & kSignBit) ? ~bits : (bits | kSignBit);
}

double double_from_ordered_bits(uint64_t bits) {
    uint64_t raw = (bits & kSignBit) ? (bits & ~kSignBit) : ~bits;
    return util::bits_double(raw);
}

int Value::compare(const Value& other) const {
    if (v_.index() != other.v_.index()) {
        return v_.index() < other.v_.index() ? -1 : 1;
    }
    switch (type()) {
        case DataType::None:
            return 0;
        case DataType::Int: {
            int64_t a = as_int(), b = other.as_int();
            return a < b ? -1 : (a > b ? 1 : 0);
        }
        case DataType::UnsignedInt: {
            uint64_t a = as_uint(), b = other.as_uint();
            return a < b ? -1 : (a > b ? 1 : 0);
        }
        case DataType::Double: {
            uint64_t a = ordered_double_bits(as_double());
            uint64_t b = ordered_double_bits(other.as_double());
            return a < b ? -1 : (a > b ? 1 : 0);
        }
        case DataType::Text: {
            int c = as_text().compare(other.as_text());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        case DataType::ByteArray: {
            int c = as_bytes().compare(other.as_bytes());
            return c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
    }
    return 0;
}

size_t Value::hash() const {
    size_t seed = v_.index() * 0x9E3779B97F4A7C15ULL;
    size_t h = 0;
    switch (type()) {
        case DataType::None:        h = 0; break;
        case DataType::Int:         h = std::hash<int64_t>()(as_int()); break;
        case DataType::UnsignedInt: h = std::hash<uint64_t>()(as_uint()); break;
        case DataType::Double:      h = std::hash<uint64_t>()(ordered_double_bits(as_double())); break;
        case DataType::Text:        h = std::hash<std::string>()(as_text()); break;
        case DataType::ByteArray:   h = std::hash<std::string>()(as_bytes()); break;
    }
    return seed ^ (h + 0x9E3779B9 + (seed << 6) + (seed >> 2));
}

size_t Value::deep_size() const {
    size_t size = sizeof(Value);
    if (type() == DataType::Text) {
        size += as_text().capacity();
    } else if (type() == DataType::ByteArray) {
        size += as_bytes().capacity();
    }
    return size;
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    switch (v.type()) {
        case DataType::None:        return os << "NULL";
        case DataType::Int:         return os << v.as_int();
        case DataType::UnsignedInt: return os << v.as_uint();
        case DataType::Double:      return os << v.as_double();
        case DataType::Text:        return os << '"' << v.as_text() << '"';
        case DataType::ByteArray: {
            os << "0x";
            std::ios_base::fmtflags flags(os.flags());
            for (unsigned char c : v.as_bytes()) {
                os << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
            }
            os.flags(flags);
            return os;
        }
    }
    return os;
}

} // namespace dfstate
