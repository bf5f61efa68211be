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

#include "row.h"
#include "util/endian.hpp"
#include <stdexcept>

namespace dfstate {

using namespace dfstate::util;

size_t row_deep_size(const Row& row) {
    size_t size = sizeof(Row);
    for (const auto& v : row) {
        size += v.deep_size();
    }
    return size;
}

std::ostream& operator<<(std::ostream& os, const Row& row) {
    os << '[';
    for (size_t i = 0; i < row.size(); ++i) {
        if (i) os << ", ";
        os << row[i];
    }
    return os << ']';
}

void RowCodec::encode_into(std::string& out, const Row& row) {
    append_le32(out, static_cast<uint32_t>(row.size()));
    for (const auto& v : row) {
        out.push_back(static_cast<char>(v.type()));
        switch (v.type()) {
            case DataType::None:
                break;
            case DataType::Int:
                append_le64(out, static_cast<uint64_t>(v.as_int()));
                break;
            case DataType::UnsignedInt:
                append_le64(out, v.as_uint());
                break;
            case DataType::Double:
                append_le64(out, double_bits(v.as_double()));
                break;
            case DataType::Text:
                append_le32(out, static_cast<uint32_t>(v.as_text().size()));
                out.append(v.as_text());
                break;
            case DataType::ByteArray:
                append_le32(out, static_cast<uint32_t>(v.as_bytes().size()));
                out.append(v.as_bytes());
                break;
        }
    }
}

std::string RowCodec::encode(const Row& row) {
    std::string out;
    encode_into(out, row);
    return out;
}

Row RowCodec::decode(const std::string& bytes) {
    return decode(bytes.data(), bytes.size());
}

Row RowCodec::decode(const char* data, size_t len) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(data);
    const uint8_t* end = p + len;

    auto need = [&](size_t n) {
        if (static_cast<size_t>(end - p) < n) {
            throw std::invalid_argument("row encoding truncated");
        }
    };

    need(4);
    uint32_t arity = load_le32(p);
    p += 4;

    Row row;
    row.reserve(arity);
    for (uint32_t i = 0; i < arity; ++i) {
        need(1);
        auto tag = static_cast<DataType>(*p++);
        switch (tag) {
            case DataType::None:
                row.emplace_back();
                break;
            case DataType::Int:
                need(8);
                row.emplace_back(static_cast<long long>(load_le64(p)));
                p += 8;
                break;
            case DataType::UnsignedInt:
                need(8);
                row.emplace_back(static_cast<unsigned long long>(load_le64(p)));
                p += 8;
                break;
            case DataType::Double:
                need(8);
                row.emplace_back(bits_double(load_le64(p)));
                p += 8;
                break;
            case DataType::Text:
            case DataType::ByteArray: {
                need(4);
                uint32_t n = load_le32(p);
                p += 4;
                need(n);
                std::string s(reinterpret_cast<const char*>(p), n);
                p += n;
                if (tag == DataType::Text) {
                    row.emplace_back(std::move(s));
                } else {
                    row.push_back(Value::bytes(std::move(s)));
                }
                break;
            }
            default:
                throw std::invalid_argument("row encoding has unknown tag " +
                                            std::to_string(static_cast<int>(tag)));
        }
    }
    if (p != end) {
        throw std::invalid_argument("row encoding has trailing bytes");
    }
    return row;
}

} // namespace dfstate
