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

#include "index.h"
#include <set>
#include <sstream>
#include <stdexcept>

namespace dfstate {

const char* to_string(IndexType t) {
    return t == IndexType::BTree ? "btree" : "hash";
}

const char* to_string(Materialization m) {
    return m == Materialization::Partial ? "partial" : "full";
}

Key Index::key_of(const Row& row) const {
    Key key;
    key.reserve(columns.size());
    for (size_t c : columns) {
        key.push_back(row.at(c));
    }
    return key;
}

std::ostream& operator<<(std::ostream& os, const Index& idx) {
    os << "index " << idx.id << " (";
    for (size_t i = 0; i < idx.columns.size(); ++i) {
        if (i) os << ',';
        os << idx.columns[i];
    }
    os << ") " << to_string(idx.type) << ' ' << to_string(idx.mode);
    if (idx.unique) os << " unique";
    if (idx.primary) os << " primary";
    return os;
}

void validate_indices(std::vector<Index>& indices, size_t arity, bool persistent) {
    if (indices.empty()) {
        throw std::invalid_argument("a node needs at least one index");
    }
    if (arity == 0) {
        throw std::invalid_argument("a node needs at least one column");
    }

    std::set<uint32_t> ids;
    size_t primaries = 0;
    for (const auto& idx : indices) {
        if (!ids.insert(idx.id).second) {
            std::ostringstream msg;
            msg << "duplicate index id " << idx.id;
            throw std::invalid_argument(msg.str());
        }
        if (idx.columns.empty()) {
            std::ostringstream msg;
            msg << idx << " has no key columns";
            throw std::invalid_argument(msg.str());
        }
        for (size_t c : idx.columns) {
            if (c >= arity) {
                std::ostringstream msg;
                msg << idx << " references column " << c << " but rows have " << arity;
                throw std::invalid_argument(msg.str());
            }
        }
        if (idx.primary) ++primaries;
    }
    if (primaries > 1) {
        throw std::invalid_argument("at most one index may be primary");
    }
    if (persistent && primaries == 0) {
        indices.front().primary = true;
    }
}

} // namespace dfstate
