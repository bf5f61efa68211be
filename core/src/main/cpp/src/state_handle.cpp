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

#include "state_handle.h"
#include "errors.h"
#include "metrics.h"
#include "persistence/durable_table.h"
#include "util/log.h"
#include <algorithm>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace dfstate {

    namespace {
        const size_t kEvictBatchKeys = 64;

        std::vector<Index> partial_only(const std::vector<Index>& indices) {
            std::vector<Index> out;
            for (const auto& idx : indices) {
                if (idx.is_partial()) out.push_back(idx);
            }
            return out;
        }
    }

    StateHandle::StateHandle(std::string name, size_t arity, std::vector<Index> indices)
        : name_(std::move(name)), arity_(arity), indices_(std::move(indices)) {
        metrics::initialize();
        validate_indices(indices_, arity_, false);
        table_ = std::make_unique<RowTable>(arity_, indices_);
        debug() << "opened memory node " << name_ << " with " << indices_.size() << " indices";
    }

    StateHandle::StateHandle(std::string name, size_t arity, std::vector<Index> indices,
                             const persist::PersistenceParameters& params)
        : name_(std::move(name)), arity_(arity), indices_(std::move(indices)) {
        metrics::initialize();
        validate_indices(indices_, arity_, true);
        durable_ = std::make_unique<persist::DurableTable>(params, arity_, indices_);
        // Recovered partial keys start as holes; the first lookup fills from disk
        table_ = std::make_unique<RowTable>(arity_, partial_only(indices_));
        info() << "opened persistent node " << name_ << " at " << durable_->dir()
               << " (" << durable_->row_count() << " rows"
               << (durable_->recovered() ? ", recovered" : "") << ")";
    }

    StateHandle::~StateHandle() {
        METRIC_GAUGE_SUB(bytes_resident, table_->deep_size());
        // DurableTable's destructor closes and reports its own failures
    }

    const Index& StateHandle::index_of(uint32_t index_id) const {
        for (const auto& idx : indices_) {
            if (idx.id == index_id) return idx;
        }
        throw std::invalid_argument("node " + name_ + " has no index " + std::to_string(index_id));
    }

    std::string StateHandle::encode_key(const Index& idx, const Key& key) const {
        if (key.size() != idx.columns.size()) {
            throw std::invalid_argument("key of " + std::to_string(key.size()) + " values for index " +
                                        std::to_string(idx.id) + " over " +
                                        std::to_string(idx.columns.size()) + " columns");
        }
        return KeyCodec::encode(key);
    }

    void StateHandle::publish_size(int64_t before) {
        int64_t delta = table_->deep_size() - before;
        if (delta != 0) {
            METRIC_GAUGE_ADD(bytes_resident, delta);
        }
    }

    void StateHandle::apply_deltas(const Records& records,
                                   const std::optional<ReplicationOffset>& checkpoint) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t before = table_->deep_size();

        if (durable_) {
            if (!checkpoint) {
                throw std::invalid_argument("persistent node " + name_ +
                                            " requires a checkpoint with every batch");
            }
            // Disk first: a rejected batch never reaches the shadow
            durable_->apply_batch(records, *checkpoint);
            try {
                table_->apply(records);
            } catch (const ConstraintViolation& e) {
                // The disk is authoritative; drop the shadow and reload on demand
                error() << "node " << name_ << ": partial shadow diverged from disk, resetting: "
                        << e.what();
                table_->clear();
            }
        } else {
            try {
                table_->apply(records);
            } catch (const ConstraintViolation& e) {
                error() << "node " << name_ << ": " << e.what();
                throw;
            }
            if (checkpoint) {
                checkpoint_ = *checkpoint;
            }
        }
        publish_size(before);
    }

    LookupResult StateHandle::miss_locked(uint32_t index_id, const std::string& key) {
        METRIC_COUNTER_INC(lookup_misses);
        bool requested = table_->tracker(index_id)->request_replay(key);
        if (requested) {
            METRIC_COUNTER_INC(replay_requests);
        }
        return LookupResult::Miss(requested);
    }

    LookupResult StateHandle::lookup(uint32_t index_id, const Key& key) {
        const Index& idx = index_of(index_id);
        std::string enc = encode_key(idx, key);

        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (durable_ && !idx.is_partial()) {
            Rows rows = durable_->lookup(index_id, enc);
            METRIC_COUNTER_INC(lookup_hits);
            return LookupResult::Hit(std::move(rows));
        }

        std::optional<Rows> rows = table_->lookup(index_id, enc);
        if (rows) {
            METRIC_COUNTER_INC(lookup_hits);
            return LookupResult::Hit(std::move(*rows));
        }
        if (!durable_ || !durable_->contains_key(index_id, enc)) {
            return miss_locked(index_id, enc);
        }

        // Disk holds the key: upgrade and re-check before filling
        lock.unlock();
        std::unique_lock<std::shared_mutex> excl(mutex_);
        rows = table_->lookup(index_id, enc);
        if (rows) {
            METRIC_COUNTER_INC(lookup_hits);
            return LookupResult::Hit(std::move(*rows));
        }
        Rows disk = durable_->lookup(index_id, enc);
        if (disk.empty()) {
            return miss_locked(index_id, enc);
        }
        int64_t before = table_->deep_size();
        table_->fill(index_id, enc, disk);
        publish_size(before);
        METRIC_COUNTER_INC(disk_fills);
        METRIC_COUNTER_INC(lookup_hits);
        trace() << "node " << name_ << ": filled index " << index_id << " from disk ("
                << disk.size() << " rows)";
        return LookupResult::Hit(std::move(disk));
    }

    LookupResult StateHandle::range_lookup(uint32_t index_id, const KeyRange& range) {
        const Index& idx = index_of(index_id);
        if (!idx.supports_ranges()) {
            throw std::invalid_argument("range lookup on hash index " + std::to_string(index_id) +
                                        " of node " + name_);
        }
        EncodedRange enc = range.encode();

        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (durable_ && !idx.is_partial()) {
            Rows rows = durable_->range_lookup(index_id, enc);
            METRIC_COUNTER_INC(lookup_hits);
            return LookupResult::Hit(std::move(rows));
        }

        std::vector<EncodedRange> missing;
        std::optional<Rows> rows = table_->range_lookup(index_id, enc, &missing);
        if (rows) {
            METRIC_COUNTER_INC(lookup_hits);
            return LookupResult::Hit(std::move(*rows));
        }
        if (!durable_) {
            return range_miss_locked(index_id, enc, std::move(missing));
        }

        // Fill the missing sub-ranges the disk holds rows for, then re-check
        lock.unlock();
        std::unique_lock<std::shared_mutex> excl(mutex_);
        missing.clear();
        rows = table_->range_lookup(index_id, enc, &missing);
        if (rows) {
            METRIC_COUNTER_INC(lookup_hits);
            return LookupResult::Hit(std::move(*rows));
        }
        int64_t before = table_->deep_size();
        size_t filled = 0;
        for (const auto& sub : missing) {
            Rows disk = durable_->range_lookup(index_id, sub);
            if (disk.empty()) {
                continue;
            }
            table_->fill_range(index_id, sub, disk);
            METRIC_COUNTER_INC(disk_fills);
            ++filled;
        }
        publish_size(before);
        if (filled == 0) {
            return range_miss_locked(index_id, enc, std::move(missing));
        }
        trace() << "node " << name_ << ": filled " << filled << " ranges of index " << index_id
                << " from disk";

        missing.clear();
        rows = table_->range_lookup(index_id, enc, &missing);
        if (rows) {
            METRIC_COUNTER_INC(lookup_hits);
            return LookupResult::Hit(std::move(*rows));
        }
        return range_miss_locked(index_id, enc, std::move(missing));
    }

    LookupResult StateHandle::range_miss_locked(uint32_t index_id, const EncodedRange& range,
                                                std::vector<EncodedRange> missing) {
        METRIC_COUNTER_INC(lookup_misses);
        bool requested = table_->tracker(index_id)->request_replay_range(range);
        if (requested) {
            METRIC_COUNTER_INC(replay_requests);
        }
        return LookupResult::Miss(requested, std::move(missing));
    }

    void StateHandle::mark_filled(uint32_t index_id, const Key& key, const Rows& rows) {
        const Index& idx = index_of(index_id);
        std::string enc = encode_key(idx, key);
        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t before = table_->deep_size();
        if (!idx.is_partial()) {
            throw std::invalid_argument("mark_filled on full index " + std::to_string(index_id));
        }
        table_->fill(index_id, enc, rows);
        publish_size(before);
    }

    void StateHandle::mark_filled(uint32_t index_id, const KeyRange& range, const Rows& rows) {
        const Index& idx = index_of(index_id);
        if (!idx.is_partial()) {
            throw std::invalid_argument("mark_filled on full index " + std::to_string(index_id));
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t before = table_->deep_size();
        table_->fill_range(index_id, range.encode(), rows);
        publish_size(before);
    }

    void StateHandle::mark_hole(uint32_t index_id, const Key& key) {
        const Index& idx = index_of(index_id);
        std::string enc = encode_key(idx, key);
        if (!idx.is_partial()) {
            throw std::invalid_argument("mark_hole on full index " + std::to_string(index_id));
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t before = table_->deep_size();
        table_->make_hole(index_id, enc);
        publish_size(before);
    }

    void StateHandle::mark_hole(uint32_t index_id, const KeyRange& range) {
        const Index& idx = index_of(index_id);
        if (!idx.is_partial()) {
            throw std::invalid_argument("mark_hole on full index " + std::to_string(index_id));
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t before = table_->deep_size();
        table_->make_hole_range(index_id, range.encode());
        publish_size(before);
    }

    RowTable::EvictionResult StateHandle::evict_lru_locked(size_t max_keys) {
        // Pick the partial index whose least recently used key is oldest
        const PartialTracker* best = nullptr;
        uint32_t best_id = 0;
        uint64_t best_tick = std::numeric_limits<uint64_t>::max();
        for (const auto& idx : table_->indices()) {
            const PartialTracker* t = table_->tracker(idx.id);
            if (!t) {
                continue;
            }
            uint64_t tick = t->oldest_tick();
            if (tick < best_tick) {
                best = t;
                best_id = idx.id;
                best_tick = tick;
            }
        }
        if (!best) {
            return {};
        }

        int64_t before = table_->deep_size();
        RowTable::EvictionResult r = table_->evict_lru(best_id, max_keys);
        publish_size(before);
        METRIC_COUNTER_ADD(keys_evicted, r.keys);
        METRIC_COUNTER_ADD(bytes_evicted, r.bytes);
        return r;
    }

    RowTable::EvictionResult StateHandle::evict_lru(size_t max_keys) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return evict_lru_locked(max_keys);
    }

    size_t StateHandle::evict(size_t target_bytes) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        size_t freed = 0;
        size_t keys = 0;
        while (table_->deep_size() > static_cast<int64_t>(target_bytes)) {
            RowTable::EvictionResult r = evict_lru_locked(kEvictBatchKeys);
            if (r.keys == 0) {
                break;
            }
            freed += r.bytes;
            keys += r.keys;
        }
        if (keys > 0) {
            debug() << "node " << name_ << ": evicted " << keys << " keys, " << freed
                    << " bytes, " << table_->deep_size() << " resident";
        }
        return freed;
    }

    RowTable::EvictionResult StateHandle::evict_keys(uint32_t index_id, const std::vector<Key>& keys) {
        const Index& idx = index_of(index_id);
        if (!idx.is_partial()) {
            throw std::invalid_argument("cannot evict from full index " + std::to_string(index_id) +
                                        " of node " + name_);
        }
        std::vector<std::string> encoded;
        encoded.reserve(keys.size());
        for (const auto& k : keys) {
            encoded.push_back(encode_key(idx, k));
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t before = table_->deep_size();
        RowTable::EvictionResult r = table_->evict_keys(index_id, encoded);
        publish_size(before);
        METRIC_COUNTER_ADD(keys_evicted, r.keys);
        METRIC_COUNTER_ADD(bytes_evicted, r.bytes);
        return r;
    }

    uint64_t StateHandle::oldest_tick() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        uint64_t oldest = std::numeric_limits<uint64_t>::max();
        for (const auto& idx : table_->indices()) {
            if (const PartialTracker* t = table_->tracker(idx.id)) {
                oldest = std::min(oldest, t->oldest_tick());
            }
        }
        return oldest;
    }

    std::optional<ReplicationOffset> StateHandle::last_checkpoint() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return durable_ ? durable_->last_checkpoint() : checkpoint_;
    }

    Rows StateHandle::rows() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (durable_) {
            return durable_->snapshot_for_recovery().first;
        }
        return table_->rows();
    }

    Records StateHandle::cloned_records() const {
        Rows all = rows();
        Records out;
        out.reserve(all.size());
        for (auto& r : all) {
            out.push_back(Record{std::move(r), true});
        }
        return out;
    }

    size_t StateHandle::row_count() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return durable_ ? durable_->row_count() : table_->row_count();
    }

    int64_t StateHandle::deep_size_of() const {
        return table_->deep_size();
    }

    bool StateHandle::is_partial() const {
        for (const auto& idx : indices_) {
            if (idx.is_partial()) return true;
        }
        return false;
    }

    void StateHandle::clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        int64_t before = table_->deep_size();
        table_->clear();
        checkpoint_.reset();
        publish_size(before);
        if (durable_ && !cleared_) {
            cleared_ = true;
            durable_->close();
        }
        debug() << "cleared node " << name_;
    }

} // namespace dfstate
