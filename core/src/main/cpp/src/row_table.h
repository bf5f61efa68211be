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
#include "partial_tracker.h"
#include "row.h"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace dfstate {

    using RowId = uint64_t;

    /**
     * Outcome of a lookup. Miss means "unknown, needs replay" and is distinct
     * from a Hit with no rows.
     */
    struct LookupResult {
        bool hit = false;
        Rows rows;
        bool replay_requested = false;
        std::vector<EncodedRange> missing;  // hole sub-ranges of a range Miss

        static LookupResult Hit(Rows rows) {
            LookupResult r;
            r.hit = true;
            r.rows = std::move(rows);
            return r;
        }
        static LookupResult Miss(bool replay_requested, std::vector<EncodedRange> missing = {}) {
            LookupResult r;
            r.replay_requested = replay_requested;
            r.missing = std::move(missing);
            return r;
        }

        bool is_hit() const { return hit; }
        bool is_miss() const { return !hit; }
    };

    /**
     * Key -> row ids for one index. Hash indices use an unordered map, BTree
     * indices an ordered map so ranges can be walked.
     */
    class IndexMap {
    public:
        explicit IndexMap(IndexType type) : type_(type) {}

        const std::vector<RowId>* find(const std::string& key) const;
        std::vector<RowId>* find(const std::string& key);
        std::vector<RowId>& get_or_create(const std::string& key, bool* created);
        void erase(const std::string& key);

        // Calls f(key, ids) for each key in range, in order. BTree only.
        template<typename F>
        void for_range(const EncodedRange& range, F&& f) const {
            auto it = ordered_.begin();
            if (range.lower.kind == Bound::Kind::Included) {
                it = ordered_.lower_bound(range.lower.bytes);
            } else if (range.lower.kind == Bound::Kind::Excluded) {
                it = ordered_.upper_bound(range.lower.bytes);
            }
            for (; it != ordered_.end() && range.below_upper(it->first); ++it) {
                f(it->first, it->second);
            }
        }

        size_t key_count() const { return type_ == IndexType::BTree ? ordered_.size() : hash_.size(); }
        void clear() { hash_.clear(); ordered_.clear(); }

    private:
        IndexType type_;
        std::unordered_map<std::string, std::vector<RowId>> hash_;
        std::map<std::string, std::vector<RowId>> ordered_;
    };

    /**
     * In-memory rows of one node.
     *
     * Rows live once in an arena under a stable RowId; each index maps an
     * encoded key to the ids stored under it. A row unlinked from every index
     * leaves the arena. Partial indices consult their PartialTracker: a row is
     * only linked where its key is filled, except that an insert into a hole of
     * a unique partial index fills the key with that row.
     *
     * Mutators require external exclusion; lookups may run concurrently with
     * each other.
     */
    class RowTable {
    public:
        struct EvictionResult {
            size_t keys = 0;
            size_t bytes = 0;
        };

        RowTable(size_t arity, std::vector<Index> indices);

        RowTable(const RowTable&) = delete;
        RowTable& operator=(const RowTable&) = delete;

        /**
         * Apply a batch to every index. Keys for every index are encoded before
         * anything changes; a ConstraintViolation rolls every index and the
         * arena back to the pre-batch state before propagating.
         */
        void apply(const Records& records);
        void insert(Row row) { apply({Record::insert(std::move(row))}); }
        void remove(Row row) { apply({Record::remove(std::move(row))}); }

        // nullopt is a Miss. Hits on partial indices touch the key's recency.
        std::optional<Rows> lookup(uint32_t index_id, const std::string& key) const;
        std::optional<Rows> range_lookup(uint32_t index_id, const EncodedRange& range,
                                         std::vector<EncodedRange>* missing) const;

        // Replace the contents of a key (or range) with replayed rows and mark it filled
        void fill(uint32_t index_id, const std::string& key, const Rows& rows);
        void fill_range(uint32_t index_id, const EncodedRange& range, const Rows& rows);

        // Returns bytes released
        size_t make_hole(uint32_t index_id, const std::string& key);
        size_t make_hole_range(uint32_t index_id, const EncodedRange& range);

        EvictionResult evict_keys(uint32_t index_id, const std::vector<std::string>& keys);
        EvictionResult evict_lru(uint32_t index_id, size_t max_keys);

        // One entry per arena row
        Rows rows() const;
        size_t row_count() const { return arena_.size(); }
        int64_t deep_size() const { return bytes_.load(std::memory_order_relaxed); }
        void clear();

        bool is_partial() const;
        bool has_index(uint32_t id) const;
        size_t position_of(uint32_t id) const;
        const Index& index(uint32_t id) const { return indices_[position_of(id)]; }
        const std::vector<Index>& indices() const { return indices_; }
        size_t arity() const { return arity_; }

        // nullptr for full indices
        PartialTracker* tracker(uint32_t id) const { return trackers_[position_of(id)].get(); }

    private:
        struct ArenaEntry {
            RowPtr row;
            size_t bytes;
            uint32_t refs;
        };

        enum class UndoKind : uint8_t { Linked, Unlinked, FilledByInsert };

        struct UndoEntry {
            UndoKind kind;
            size_t pos;
            std::string key;
            RowId id;
            RowPtr row;
            // Linked: key entered recency. FilledByInsert: a replay was in flight.
            bool flag = false;
        };

        RowId new_entry(const RowPtr& row);
        void link(size_t pos, const std::string& key, RowId id);
        void unlink(size_t pos, const std::string& key, RowId id);
        size_t unlink_key(size_t pos, const std::string& key);
        std::optional<RowId> find_matching(size_t pos, const std::string& key, const Row& row) const;
        // Arena entry of an equal row already linked in another materialized index
        std::optional<RowId> shared_entry(size_t target, const Row& row, const std::set<RowId>& taken) const;
        RowId entry_for_fill(size_t target, const RowPtr& row, std::set<RowId>& taken);
        bool materialized(size_t pos, const std::string& key) const;
        void rollback(std::vector<UndoEntry>& undo);
        void check_row(const Row& row) const;
        Rows collect(const std::vector<RowId>& ids) const;

        static constexpr size_t kKeyOverhead = 64;
        static constexpr size_t kLinkBytes = sizeof(RowId);

        size_t arity_;
        std::vector<Index> indices_;
        std::vector<IndexMap> maps_;
        std::vector<std::unique_ptr<PartialTracker>> trackers_;
        std::unordered_map<RowId, ArenaEntry> arena_;
        RowId next_id_ = 1;
        std::atomic<int64_t> bytes_{0};
    };

} // namespace dfstate
