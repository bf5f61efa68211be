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

#include <memory>
#include <string>
#include <vector>

namespace dfstate {

    class StateHandle;

    /**
     * Chooses which node the eviction controller takes the next batch of keys
     * from. Only nodes with filled partial keys are candidates.
     */
    class EvictionPolicy {
    public:
        virtual ~EvictionPolicy() = default;

        virtual const char* name() const = 0;

        /**
         * @param nodes live registered nodes
         * @return the next victim, or nullptr when no node has anything to evict
         */
        virtual std::shared_ptr<StateHandle> choose(const std::vector<std::shared_ptr<StateHandle>>& nodes) = 0;

    protected:
        static bool evictable(const StateHandle& node);
    };

    // The node with the most resident bytes gives up its oldest keys first
    class LargestNodeFirst : public EvictionPolicy {
    public:
        const char* name() const override { return "largest_node"; }
        std::shared_ptr<StateHandle> choose(const std::vector<std::shared_ptr<StateHandle>>& nodes) override;
    };

    // Strict LRU across every partial index of every node
    class OldestKeyFirst : public EvictionPolicy {
    public:
        const char* name() const override { return "oldest_key"; }
        std::shared_ptr<StateHandle> choose(const std::vector<std::shared_ptr<StateHandle>>& nodes) override;
    };

    // "largest_node" or "oldest_key"; throws std::invalid_argument otherwise
    std::unique_ptr<EvictionPolicy> make_eviction_policy(const std::string& name);

} // namespace dfstate
