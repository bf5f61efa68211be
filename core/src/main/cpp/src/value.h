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
#include <functional>
#include <ostream>
#include <string>
#include <variant>

namespace dfstate {

    /**
     * Tag of a cell value. The numeric value is the tag byte written by the key
     * encoding and also the cross-type sort rank.
     */
    enum class DataType : uint8_t {
        None        = 0x01,
        Int         = 0x02,
        UnsignedInt = 0x03,
        Double      = 0x04,
        Text        = 0x05,
        ByteArray   = 0x06
    };

    const char* to_string(DataType t);

    struct Bytes {
        std::string data;
        bool operator==(const Bytes& o) const { return data == o.data; }
    };

    /**
     * A single cell: a sum type over the supported scalar kinds.
     *
     * Values are totally ordered, first by DataType rank and then by value.
     * Doubles use IEEE total order with every NaN collapsed to one canonical NaN
     * that sorts after +inf.
     */
    class Value {
    public:
        Value() : v_(std::monostate{}) {}
        Value(int v) : v_(static_cast<int64_t>(v)) {}
        Value(long v) : v_(static_cast<int64_t>(v)) {}
        Value(long long v) : v_(static_cast<int64_t>(v)) {}
        Value(unsigned v) : v_(static_cast<uint64_t>(v)) {}
        Value(unsigned long v) : v_(static_cast<uint64_t>(v)) {}
        Value(unsigned long long v) : v_(static_cast<uint64_t>(v)) {}
        Value(double v) : v_(v) {}
        Value(const char* v) : v_(std::string(v)) {}
        Value(std::string v) : v_(std::move(v)) {}
        Value(Bytes v) : v_(std::move(v)) {}

        static Value none() { return Value(); }
        static Value bytes(std::string raw) { return Value(Bytes{std::move(raw)}); }

        DataType type() const { return static_cast<DataType>(v_.index() + 1); }
        bool is_none() const { return std::holds_alternative<std::monostate>(v_); }

        int64_t as_int() const { return std::get<int64_t>(v_); }
        uint64_t as_uint() const { return std::get<uint64_t>(v_); }
        double as_double() const { return std::get<double>(v_); }
        const std::string& as_text() const { return std::get<std::string>(v_); }
        const std::string& as_bytes() const { return std::get<Bytes>(v_).data; }

        // <0, 0, >0
        int compare(const Value& other) const;

        bool operator==(const Value& o) const { return compare(o) == 0; }
        bool operator!=(const Value& o) const { return compare(o) != 0; }
        bool operator<(const Value& o) const { return compare(o) < 0; }

        size_t hash() const;

        // Approximate heap + inline footprint, used for memory accounting
        size_t deep_size() const;

    private:
        std::variant<std::monostate, int64_t, uint64_t, double, std::string, Bytes> v_;
    };

    std::ostream& operator<<(std::ostream& os, const Value& v);

    // Order-preserving image of a double: unsigned comparison of the result
    // matches Value ordering of doubles.
    uint64_t ordered_double_bits(double d);
    double double_from_ordered_bits(uint64_t bits);

} // namespace dfstate

namespace std {
    template<>
    struct hash<dfstate::Value> {
        size_t operator()(const dfstate::Value& v) const { return v.hash(); }
    };
}
