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

#include "index.h"
#include "key.h"
#include "replication_offset.h"
#include "row.h"
#include "row_table.h"
#include "persistence/durability_policy.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dfstate {

    namespace persist {
        class DurableTable;
    }

    /**
     * Per-node state store: the single surface the dataflow engine talks to.
     *
     * A memory-only node keeps every index in one RowTable. A persistent node
     * serves full indices from its DurableTable and keeps a RowTable shadow
     * holding only the partial indices; a point Miss on a partial index first
     * consults the disk and turns rows found there into a fill.
     *
     * Lookups take the node lock shared; writes, fills, holes and evictions
     * take it exclusive.
     */
    class StateHandle {
    public:
        StateHandle(std::string name, size_t arity, std::vector<Index> indices);
        StateHandle(std::string name, size_t arity, std::vector<Index> indices,
                    const persist::PersistenceParameters& params);
        ~StateHandle();

        StateHandle(const StateHandle&) = delete;
        StateHandle& operator=(const StateHandle&) = delete;

        /**
         * Apply a batch atomically across every index.
         * @param records rows to insert or remove, in order
         * @param checkpoint the upstream position this batch brings the node to.
         *        Required for persistent nodes.
         */
        void apply_deltas(const Records& records,
                          const std::optional<ReplicationOffset>& checkpoint = std::nullopt);

        LookupResult lookup(uint32_t index_id, const Key& key);
        LookupResult range_lookup(uint32_t index_id, const KeyRange& range);

        // Install replayed rows for a hole and mark it filled
        void mark_filled(uint32_t index_id, const Key& key, const Rows& rows);
        void mark_filled(uint32_t index_id, const KeyRange& range, const Rows& rows);

        // Upstream invalidation: drop the key (or range) and make it a hole
        void mark_hole(uint32_t index_id, const Key& key);
        void mark_hole(uint32_t index_id, const KeyRange& range);

        /**
         * Evict least recently used partial keys until the node's resident
         * bytes are at or below target_bytes or nothing is left to evict.
         * @return bytes released
         */
        size_t evict(size_t target_bytes);

        RowTable::EvictionResult evict_keys(uint32_t index_id, const std::vector<Key>& keys);

        // One bounded eviction step from the partial index holding the oldest key
        RowTable::EvictionResult evict_lru(size_t max_keys);

        // Recency tick of the least recently used filled key; UINT64_MAX if none
        uint64_t oldest_tick() const;

        std::optional<ReplicationOffset> last_checkpoint() const;

        Rows rows() const;
        Records cloned_records() const;
        size_t row_count() const;
        int64_t deep_size_of() const;
        bool is_partial() const;
        bool is_persistent() const { return durable_ != nullptr; }

        // Drop in-memory state and close the durable table
        void clear();

        const std::string& name() const { return name_; }
        size_t arity() const { return arity_; }
        const std::vector<Index>& indices() const { return indices_; }

    private:
        const Index& index_of(uint32_t index_id) const;
        std::string encode_key(const Index& idx, const Key& key) const;
        LookupResult miss_locked(uint32_t index_id, const std::string& key);
        LookupResult range_miss_locked(uint32_t index_id, const EncodedRange& range,
                                       std::vector<EncodedRange> missing);
        RowTable::EvictionResult evict_lru_locked(size_t max_keys);
        void publish_size(int64_t before);

        std::string name_;
        size_t arity_;
        std::vector<Index> indices_;

        mutable std::shared_mutex mutex_;
        std::unique_ptr<RowTable> table_;                  // all indices, or the partial shadow
        std::unique_ptr<persist::DurableTable> durable_;
        std::optional<ReplicationOffset> checkpoint_;      // memory-only nodes
        bool cleared_ = false;
    };

} // namespace dfstate
