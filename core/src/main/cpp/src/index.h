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

#include "key.h"
#include "row.h"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace dfstate {

    enum class IndexType : uint8_t {
        Hash,   // point lookups only
        BTree   // ordered, supports range lookups
    };

    enum class Materialization : uint8_t {
        Full,
        Partial
    };

    const char* to_string(IndexType t);
    const char* to_string(Materialization m);

    /**
     * Declaration of one lookup structure over a node's rows. Immutable for the
     * life of the node.
     */
    struct Index {
        uint32_t id = 0;
        std::vector<size_t> columns;
        bool unique = false;
        Materialization mode = Materialization::Full;
        IndexType type = IndexType::Hash;
        bool primary = false;

        Index() = default;
        Index(uint32_t id_, std::vector<size_t> cols, bool unique_ = false,
              Materialization mode_ = Materialization::Full,
              IndexType type_ = IndexType::Hash, bool primary_ = false)
            : id(id_), columns(std::move(cols)), unique(unique_),
              mode(mode_), type(type_), primary(primary_) {}

        bool is_partial() const { return mode == Materialization::Partial; }
        bool supports_ranges() const { return type == IndexType::BTree; }

        Key key_of(const Row& row) const;
        std::string encode_key(const Row& row) const {
            return KeyCodec::encode_columns(row, columns);
        }

        // Same columns, uniqueness, mode and type. Used to check a reopened schema.
        bool same_shape(const Index& o) const {
            return id == o.id && columns == o.columns && unique == o.unique &&
                   mode == o.mode && type == o.type && primary == o.primary;
        }
    };

    std::ostream& operator<<(std::ostream& os, const Index& idx);

    /**
     * Validates a node's index list against the row arity: at least one index,
     * unique ids, non-empty in-bounds column lists, at most one primary. When
     * persistent and no index is flagged primary, index 0 becomes primary.
     * Throws std::invalid_argument.
     */
    void validate_indices(std::vector<Index>& indices, size_t arity, bool persistent);

} // namespace dfstate
