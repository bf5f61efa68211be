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

#include "key.h"
#include "util/endian.hpp"
#include <stdexcept>

namespace dfstate {

using namespace dfstate::util;

static constexpr uint64_t kSignFlip = 0x8000000000000000ULL;

static void encode_escaped(std::string& out, const std::string& s) {
    for (char c : s) {
        out.push_back(c);
        if (c == '\0') {
            out.push_back(static_cast<char>(0xFF));
        }
    }
    out.push_back('\0');
    out.push_back('\x01');
}

void KeyCodec::encode_value(std::string& out, const Value& v) {
    out.push_back(static_cast<char>(v.type()));
    switch (v.type()) {
        case DataType::None:
            break;
        case DataType::Int:
            append_be64(out, static_cast<uint64_t>(v.as_int()) ^ kSignFlip);
            break;
        case DataType::UnsignedInt:
            append_be64(out, v.as_uint());
            break;
        case DataType::Double:
            append_be64(out, ordered_double_bits(v.as_double()));
            break;
        case DataType::Text:
            encode_escaped(out, v.as_text());
            break;
        case DataType::ByteArray:
            encode_escaped(out, v.as_bytes());
            break;
    }
}

std::string KeyCodec::encode(const Key& key) {
    std::string out;
    out.reserve(key.size() * 9);
    for (const auto& v : key) {
        encode_value(out, v);
    }
    return out;
}

std::string KeyCodec::encode_columns(const Row& row, const std::vector<size_t>& columns) {
    std::string out;
    out.reserve(columns.size() * 9);
    for (size_t c : columns) {
        encode_value(out, row.at(c));
    }
    return out;
}

static std::string decode_escaped(const std::string& bytes, size_t& pos) {
    std::string s;
    while (pos < bytes.size()) {
        char c = bytes[pos++];
        if (c != '\0') {
            s.push_back(c);
            continue;
        }
        if (pos >= bytes.size()) break;
        auto next = static_cast<uint8_t>(bytes[pos++]);
        if (next == 0xFF) {
            s.push_back('\0');
        } else if (next == 0x01) {
            return s;
        } else {
            throw std::invalid_argument("key encoding has a bad escape sequence");
        }
    }
    throw std::invalid_argument("key encoding has an unterminated string");
}

Value KeyCodec::decode_value(const std::string& bytes, size_t& pos) {
    if (pos >= bytes.size()) {
        throw std::invalid_argument("key encoding truncated");
    }
    auto tag = static_cast<DataType>(bytes[pos++]);
    auto fixed = [&]() {
        if (bytes.size() - pos < 8) {
            throw std::invalid_argument("key encoding truncated");
        }
        uint64_t v = load_be64(reinterpret_cast<const uint8_t*>(bytes.data() + pos));
        pos += 8;
        return v;
    };
    switch (tag) {
        case DataType::None:
            return Value();
        case DataType::Int:
            return Value(static_cast<long long>(fixed() ^ kSignFlip));
        case DataType::UnsignedInt:
            return Value(static_cast<unsigned long long>(fixed()));
        case DataType::Double:
            return Value(double_from_ordered_bits(fixed()));
        case DataType::Text:
            return Value(decode_escaped(bytes, pos));
        case DataType::ByteArray:
            return Value::bytes(decode_escaped(bytes, pos));
    }
    throw std::invalid_argument("key encoding has unknown tag " +
                                std::to_string(static_cast<int>(tag)));
}

Key KeyCodec::decode(const std::string& bytes) {
    Key key;
    size_t pos = 0;
    while (pos < bytes.size()) {
        key.push_back(decode_value(bytes, pos));
    }
    return key;
}

// ---------------------------------------------------------------------------
// Ranges
// ---------------------------------------------------------------------------

bool EncodedRange::above_lower(const std::string& key) const {
    switch (lower.kind) {
        case Bound::Kind::Unbounded: return true;
        case Bound::Kind::Included:  return key >= lower.bytes;
        case Bound::Kind::Excluded:  return key > lower.bytes;
    }
    return false;
}

bool EncodedRange::below_upper(const std::string& key) const {
    switch (upper.kind) {
        case Bound::Kind::Unbounded: return true;
        case Bound::Kind::Included:  return key <= upper.bytes;
        case Bound::Kind::Excluded:  return key < upper.bytes;
    }
    return false;
}

bool EncodedRange::contains(const std::string& key) const {
    return above_lower(key) && below_upper(key);
}

bool EncodedRange::is_empty() const {
    if (lower.is_unbounded() || upper.is_unbounded()) return false;
    if (lower.bytes < upper.bytes) return false;
    if (lower.bytes > upper.bytes) return true;
    return lower.kind == Bound::Kind::Excluded || upper.kind == Bound::Kind::Excluded;
}

bool lower_le(const EncodedBound& a, const EncodedBound& b) {
    if (a.is_unbounded()) return true;
    if (b.is_unbounded()) return false;
    if (a.bytes != b.bytes) return a.bytes < b.bytes;
    // Included(x) starts before Excluded(x)
    return a.kind == Bound::Kind::Included || b.kind == Bound::Kind::Excluded;
}

bool upper_le(const EncodedBound& a, const EncodedBound& b) {
    if (b.is_unbounded()) return true;
    if (a.is_unbounded()) return false;
    if (a.bytes != b.bytes) return a.bytes < b.bytes;
    // Excluded(x) ends before Included(x)
    return a.kind == Bound::Kind::Excluded || b.kind == Bound::Kind::Included;
}

bool touches(const EncodedBound& upper, const EncodedBound& lower) {
    if (upper.is_unbounded() || lower.is_unbounded()) return true;
    if (lower.bytes < upper.bytes) return true;
    if (lower.bytes > upper.bytes) return false;
    // [.. x) followed by (x ..] leaves x uncovered
    return !(upper.kind == Bound::Kind::Excluded && lower.kind == Bound::Kind::Excluded);
}

static void print_bytes(std::ostream& os, const std::string& bytes) {
    static const char* hex = "0123456789abcdef";
    for (unsigned char c : bytes) {
        os << hex[c >> 4] << hex[c & 0xF];
    }
}

std::ostream& operator<<(std::ostream& os, const EncodedRange& r) {
    switch (r.lower.kind) {
        case Bound::Kind::Unbounded: os << "(-inf"; break;
        case Bound::Kind::Included:  os << '['; print_bytes(os, r.lower.bytes); break;
        case Bound::Kind::Excluded:  os << '('; print_bytes(os, r.lower.bytes); break;
    }
    os << ", ";
    switch (r.upper.kind) {
        case Bound::Kind::Unbounded: os << "+inf)"; break;
        case Bound::Kind::Included:  print_bytes(os, r.upper.bytes); os << ']'; break;
        case Bound::Kind::Excluded:  print_bytes(os, r.upper.bytes); os << ')'; break;
    }
    return os;
}

static EncodedBound encode_bound(const Bound& b) {
    switch (b.kind) {
        case Bound::Kind::Included: return EncodedBound::included(KeyCodec::encode(b.key));
        case Bound::Kind::Excluded: return EncodedBound::excluded(KeyCodec::encode(b.key));
        default:                    return EncodedBound::unbounded();
    }
}

EncodedRange KeyRange::encode() const {
    return EncodedRange{encode_bound(lower), encode_bound(upper)};
}

} // namespace dfstate
