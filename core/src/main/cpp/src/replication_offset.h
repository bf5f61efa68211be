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
#include <ostream>
#include <string>
#include <tuple>

namespace dfstate {

    /**
     * Position in an upstream replication log. A durable node records exactly one
     * of these, advanced atomically with the data it covers.
     */
    struct ReplicationOffset {
        std::string log_name;
        uint64_t offset = 0;

        ReplicationOffset() = default;
        ReplicationOffset(std::string name, uint64_t off)
            : log_name(std::move(name)), offset(off) {}

        bool operator==(const ReplicationOffset& o) const {
            return log_name == o.log_name && offset == o.offset;
        }
        bool operator!=(const ReplicationOffset& o) const { return !(*this == o); }
        bool operator<(const ReplicationOffset& o) const {
            return std::tie(log_name, offset) < std::tie(o.log_name, o.offset);
        }

        std::string to_string() const { return log_name + ":" + std::to_string(offset); }
    };

    inline std::ostream& operator<<(std::ostream& os, const ReplicationOffset& off) {
        return os << off.to_string();
    }

} // namespace dfstate
