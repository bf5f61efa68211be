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

#include "value.h"
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace dfstate {

    // An immutable tuple of cells. Updates are remove-old + insert-new.
    using Row = std::vector<Value>;

    // Shared ownership keeps lookup results valid after the row leaves the store.
    using RowPtr = std::shared_ptr<const Row>;

    // Result of a lookup. A fresh lookup re-scans; holding one pins its rows.
    using Rows = std::vector<RowPtr>;

    inline RowPtr make_row(Row row) { return std::make_shared<const Row>(std::move(row)); }

    size_t row_deep_size(const Row& row);

    std::ostream& operator<<(std::ostream& os, const Row& row);

    /**
     * A row plus a sign. Positive records insert, negative records remove.
     */
    struct Record {
        RowPtr row;
        bool positive = true;

        static Record insert(Row r) { return Record{make_row(std::move(r)), true}; }
        static Record remove(Row r) { return Record{make_row(std::move(r)), false}; }

        bool operator==(const Record& o) const {
            return positive == o.positive && *row == *o.row;
        }
    };

    using Records = std::vector<Record>;

    /**
     * Compact, non-ordered row serialization used for durable row bytes and
     * snapshots. Layout: arity(u32 LE) then per cell a tag byte and payload
     * (fixed 8 bytes LE for numerics, u32 LE length + bytes for Text/ByteArray).
     */
    class RowCodec {
    public:
        static std::string encode(const Row& row);
        static void encode_into(std::string& out, const Row& row);

        // Throws std::invalid_argument on malformed input
        static Row decode(const std::string& bytes);
        static Row decode(const char* data, size_t len);
    };

} // namespace dfstate
