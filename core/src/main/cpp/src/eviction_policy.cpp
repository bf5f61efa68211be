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

#include "eviction_policy.h"
#include "state_handle.h"
#include <limits>
#include <stdexcept>

namespace dfstate {

    bool EvictionPolicy::evictable(const StateHandle& node) {
        return node.is_partial() && node.oldest_tick() != std::numeric_limits<uint64_t>::max();
    }

    std::shared_ptr<StateHandle> LargestNodeFirst::choose(const std::vector<std::shared_ptr<StateHandle>>& nodes) {
        std::shared_ptr<StateHandle> victim;
        int64_t largest = -1;
        for (const auto& node : nodes) {
            if (!evictable(*node)) continue;
            int64_t size = node->deep_size_of();
            if (size > largest) {
                largest = size;
                victim = node;
            }
        }
        return victim;
    }

    std::shared_ptr<StateHandle> OldestKeyFirst::choose(const std::vector<std::shared_ptr<StateHandle>>& nodes) {
        std::shared_ptr<StateHandle> victim;
        uint64_t oldest = std::numeric_limits<uint64_t>::max();
        for (const auto& node : nodes) {
            if (!node->is_partial()) continue;
            uint64_t tick = node->oldest_tick();
            if (tick < oldest) {
                oldest = tick;
                victim = node;
            }
        }
        return victim;
    }

    std::unique_ptr<EvictionPolicy> make_eviction_policy(const std::string& name) {
        if (name == "largest_node" || name.empty()) {
            return std::make_unique<LargestNodeFirst>();
        } else if (name == "oldest_key") {
            return std::make_unique<OldestKeyFirst>();
        }
        throw std::invalid_argument("unknown eviction policy: " + name);
    }

} // namespace dfstate
