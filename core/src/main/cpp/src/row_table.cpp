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

#include "row_table.h"
#include "errors.h"
#include "util/log.h"
#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

namespace dfstate {

// ---------------------------------------------------------------------------
// IndexMap
// ---------------------------------------------------------------------------

const std::vector<RowId>* IndexMap::find(const std::string& key) const {
    if (type_ == IndexType::BTree) {
        auto it = ordered_.find(key);
        return it == ordered_.end() ? nullptr : &it->second;
    }
    auto it = hash_.find(key);
    return it == hash_.end() ? nullptr : &it->second;
}

std::vector<RowId>* IndexMap::find(const std::string& key) {
    return const_cast<std::vector<RowId>*>(static_cast<const IndexMap*>(this)->find(key));
}

std::vector<RowId>& IndexMap::get_or_create(const std::string& key, bool* created) {
    if (type_ == IndexType::BTree) {
        auto res = ordered_.try_emplace(key);
        *created = res.second;
        return res.first->second;
    }
    auto res = hash_.try_emplace(key);
    *created = res.second;
    return res.first->second;
}

void IndexMap::erase(const std::string& key) {
    if (type_ == IndexType::BTree) {
        ordered_.erase(key);
    } else {
        hash_.erase(key);
    }
}

// ---------------------------------------------------------------------------
// RowTable
// ---------------------------------------------------------------------------

RowTable::RowTable(size_t arity, std::vector<Index> indices)
    : arity_(arity), indices_(std::move(indices)) {
    maps_.reserve(indices_.size());
    trackers_.reserve(indices_.size());
    for (const auto& idx : indices_) {
        maps_.emplace_back(idx.type);
        if (idx.is_partial()) {
            trackers_.push_back(std::make_unique<PartialTracker>(idx.supports_ranges()));
        } else {
            trackers_.push_back(nullptr);
        }
    }
}

size_t RowTable::position_of(uint32_t id) const {
    for (size_t i = 0; i < indices_.size(); ++i) {
        if (indices_[i].id == id) return i;
    }
    throw std::invalid_argument("unknown index id " + std::to_string(id));
}

bool RowTable::has_index(uint32_t id) const {
    for (const auto& idx : indices_) {
        if (idx.id == id) return true;
    }
    return false;
}

bool RowTable::is_partial() const {
    for (const auto& idx : indices_) {
        if (idx.is_partial()) return true;
    }
    return false;
}

void RowTable::check_row(const Row& row) const {
    if (row.size() != arity_) {
        throw std::invalid_argument("record arity " + std::to_string(row.size()) +
                                    " does not match node arity " + std::to_string(arity_));
    }
}

bool RowTable::materialized(size_t pos, const std::string& key) const {
    return !trackers_[pos] || trackers_[pos]->is_filled(key);
}

RowId RowTable::new_entry(const RowPtr& row) {
    RowId id = next_id_++;
    arena_.emplace(id, ArenaEntry{row, row_deep_size(*row), 0});
    return id;
}

void RowTable::link(size_t pos, const std::string& key, RowId id) {
    bool created = false;
    auto& ids = maps_[pos].get_or_create(key, &created);
    ids.push_back(id);
    int64_t delta = kLinkBytes;
    if (created) delta += key.size() + kKeyOverhead;
    auto& entry = arena_.at(id);
    if (entry.refs++ == 0) delta += entry.bytes;
    bytes_.fetch_add(delta, std::memory_order_relaxed);
}

void RowTable::unlink(size_t pos, const std::string& key, RowId id) {
    auto* ids = maps_[pos].find(key);
    if (!ids) return;
    auto it = std::find(ids->rbegin(), ids->rend(), id);
    if (it == ids->rend()) return;
    ids->erase(std::next(it).base());

    int64_t delta = kLinkBytes;
    if (ids->empty()) {
        maps_[pos].erase(key);
        delta += key.size() + kKeyOverhead;
    }
    auto entry = arena_.find(id);
    if (--entry->second.refs == 0) {
        delta += entry->second.bytes;
        arena_.erase(entry);
    }
    bytes_.fetch_sub(delta, std::memory_order_relaxed);
}

size_t RowTable::unlink_key(size_t pos, const std::string& key) {
    const auto* ids = maps_[pos].find(key);
    if (!ids) return 0;
    int64_t before = bytes_.load(std::memory_order_relaxed);
    std::vector<RowId> copy = *ids;
    for (RowId id : copy) {
        unlink(pos, key, id);
    }
    return static_cast<size_t>(before - bytes_.load(std::memory_order_relaxed));
}

std::optional<RowId> RowTable::find_matching(size_t pos, const std::string& key, const Row& row) const {
    const auto* ids = maps_[pos].find(key);
    if (!ids) return std::nullopt;
    for (RowId id : *ids) {
        if (*arena_.at(id).row == row) return id;
    }
    return std::nullopt;
}

std::optional<RowId> RowTable::shared_entry(size_t target, const Row& row,
                                            const std::set<RowId>& taken) const {
    for (size_t pos = 0; pos < indices_.size(); ++pos) {
        if (pos == target) continue;
        std::string key = indices_[pos].encode_key(row);
        if (!materialized(pos, key)) continue;
        // One materialized index holds every row the node has; look no further
        const auto* ids = maps_[pos].find(key);
        if (ids) {
            for (RowId id : *ids) {
                if (!taken.count(id) && *arena_.at(id).row == row) return id;
            }
        }
        return std::nullopt;
    }
    return std::nullopt;
}

RowId RowTable::entry_for_fill(size_t target, const RowPtr& row, std::set<RowId>& taken) {
    auto id = shared_entry(target, *row, taken);
    RowId chosen = id ? *id : new_entry(row);
    taken.insert(chosen);
    return chosen;
}

void RowTable::rollback(std::vector<UndoEntry>& undo) {
    for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
        switch (it->kind) {
            case UndoKind::Linked:
                unlink(it->pos, it->key, it->id);
                if (it->flag) {
                    trackers_[it->pos]->forget(it->key);
                }
                break;
            case UndoKind::Unlinked:
                if (arena_.find(it->id) == arena_.end()) {
                    arena_.emplace(it->id, ArenaEntry{it->row, row_deep_size(*it->row), 0});
                }
                link(it->pos, it->key, it->id);
                break;
            case UndoKind::FilledByInsert:
                trackers_[it->pos]->mark_hole(it->key);
                if (it->flag) {
                    // The replay asked for before the batch is still outstanding
                    trackers_[it->pos]->request_replay(it->key);
                }
                break;
        }
    }
    undo.clear();
}

void RowTable::apply(const Records& records) {
    // Prepare: validate and encode every key for every index up front
    std::vector<std::vector<std::string>> keys;
    keys.reserve(records.size());
    for (const auto& rec : records) {
        check_row(*rec.row);
        std::vector<std::string> row_keys;
        row_keys.reserve(indices_.size());
        for (const auto& idx : indices_) {
            row_keys.push_back(idx.encode_key(*rec.row));
        }
        keys.push_back(std::move(row_keys));
    }

    std::vector<UndoEntry> undo;
    RowId pending = 0;
    try {
        for (size_t r = 0; r < records.size(); ++r) {
            const Record& rec = records[r];
            const Row& row = *rec.row;

            if (rec.positive) {
                RowId id = new_entry(rec.row);
                pending = id;
                for (size_t pos = 0; pos < indices_.size(); ++pos) {
                    const Index& idx = indices_[pos];
                    const std::string& key = keys[r][pos];
                    bool filled = materialized(pos, key);

                    if (!filled && !idx.unique) {
                        // Hole in a non-unique partial index: the replay delivers it
                        continue;
                    }
                    if (filled && idx.unique) {
                        const auto* ids = maps_[pos].find(key);
                        if (ids && !ids->empty()) {
                            std::ostringstream msg;
                            msg << "duplicate key " << idx.key_of(row) << " on unique " << idx;
                            throw ConstraintViolation(msg.str());
                        }
                    }
                    if (!filled) {
                        // Unique key whose whole content is now known
                        bool in_flight = trackers_[pos]->replay_in_flight(key);
                        trackers_[pos]->mark_filled(key);
                        undo.push_back(UndoEntry{UndoKind::FilledByInsert, pos, key, 0, nullptr, in_flight});
                    }
                    link(pos, key, id);
                    // Keys populated by writes must be evictable too
                    bool tracked = trackers_[pos] && trackers_[pos]->touch(key);
                    undo.push_back(UndoEntry{UndoKind::Linked, pos, key, id, nullptr, tracked});
                }
                auto entry = arena_.find(id);
                if (entry != arena_.end() && entry->second.refs == 0) {
                    arena_.erase(entry);
                }
                pending = 0;
            } else {
                for (size_t pos = 0; pos < indices_.size(); ++pos) {
                    const std::string& key = keys[r][pos];
                    if (!materialized(pos, key)) continue;

                    auto id = find_matching(pos, key, row);
                    if (!id) {
                        std::ostringstream msg;
                        msg << "remove of absent row " << row << " from " << indices_[pos];
                        throw ConstraintViolation(msg.str());
                    }
                    RowPtr held = arena_.at(*id).row;
                    unlink(pos, key, *id);
                    undo.push_back(UndoEntry{UndoKind::Unlinked, pos, key, *id, std::move(held)});
                }
            }
        }
    } catch (const ConstraintViolation& e) {
        rollback(undo);
        auto entry = arena_.find(pending);
        if (entry != arena_.end() && entry->second.refs == 0) {
            arena_.erase(entry);
        }
        debug() << "row table batch rolled back: " << e.what();
        throw;
    }
}

Rows RowTable::collect(const std::vector<RowId>& ids) const {
    Rows out;
    out.reserve(ids.size());
    for (RowId id : ids) {
        out.push_back(arena_.at(id).row);
    }
    return out;
}

std::optional<Rows> RowTable::lookup(uint32_t index_id, const std::string& key) const {
    size_t pos = position_of(index_id);
    PartialTracker* tracker = trackers_[pos].get();
    if (tracker) {
        if (!tracker->is_filled(key)) {
            return std::nullopt;
        }
        tracker->touch(key);
    }
    const auto* ids = maps_[pos].find(key);
    return ids ? collect(*ids) : Rows{};
}

std::optional<Rows> RowTable::range_lookup(uint32_t index_id, const EncodedRange& range,
                                           std::vector<EncodedRange>* missing) const {
    size_t pos = position_of(index_id);
    if (!indices_[pos].supports_ranges()) {
        throw std::invalid_argument("range lookup on hash index " + std::to_string(index_id));
    }
    PartialTracker* tracker = trackers_[pos].get();
    if (tracker) {
        std::vector<EncodedRange> holes = tracker->missing_ranges(range);
        if (!holes.empty()) {
            if (missing) *missing = std::move(holes);
            return std::nullopt;
        }
    }

    Rows out;
    if (range.is_empty()) return out;
    maps_[pos].for_range(range, [&](const std::string& key, const std::vector<RowId>& ids) {
        if (tracker) tracker->touch(key);
        for (RowId id : ids) {
            out.push_back(arena_.at(id).row);
        }
    });
    return out;
}

void RowTable::fill(uint32_t index_id, const std::string& key, const Rows& rows) {
    size_t pos = position_of(index_id);
    const Index& idx = indices_[pos];
    if (!trackers_[pos]) {
        throw std::invalid_argument("fill on full index " + std::to_string(index_id));
    }
    for (const auto& row : rows) {
        check_row(*row);
        if (idx.encode_key(*row) != key) {
            std::ostringstream msg;
            msg << "replayed row " << *row << " does not belong to the filled key of " << idx;
            throw std::invalid_argument(msg.str());
        }
    }
    if (idx.unique && rows.size() > 1) {
        std::ostringstream msg;
        msg << "replay delivered " << rows.size() << " rows for one key of unique " << idx;
        throw ConstraintViolation(msg.str());
    }

    unlink_key(pos, key);
    std::set<RowId> taken;
    for (const auto& row : rows) {
        link(pos, key, entry_for_fill(pos, row, taken));
    }
    trackers_[pos]->mark_filled(key);
}

void RowTable::fill_range(uint32_t index_id, const EncodedRange& range, const Rows& rows) {
    size_t pos = position_of(index_id);
    const Index& idx = indices_[pos];
    if (!trackers_[pos]) {
        throw std::invalid_argument("fill on full index " + std::to_string(index_id));
    }
    if (!idx.supports_ranges()) {
        throw std::invalid_argument("range fill on hash index " + std::to_string(index_id));
    }

    std::vector<std::string> row_keys;
    row_keys.reserve(rows.size());
    std::set<std::string> distinct;
    for (const auto& row : rows) {
        check_row(*row);
        row_keys.push_back(idx.encode_key(*row));
        if (!range.contains(row_keys.back())) {
            std::ostringstream msg;
            msg << "replayed row " << *row << " lies outside the filled range " << range;
            throw std::invalid_argument(msg.str());
        }
        if (!distinct.insert(row_keys.back()).second && idx.unique) {
            std::ostringstream msg;
            msg << "replay delivered duplicate key " << idx.key_of(*row) << " for unique " << idx;
            throw ConstraintViolation(msg.str());
        }
    }

    // Drop what the range held so the replay is not double counted
    std::vector<std::string> existing;
    maps_[pos].for_range(range, [&](const std::string& key, const std::vector<RowId>&) {
        existing.push_back(key);
    });
    for (const auto& key : existing) {
        unlink_key(pos, key);
    }

    std::set<RowId> taken;
    for (size_t i = 0; i < rows.size(); ++i) {
        link(pos, row_keys[i], entry_for_fill(pos, rows[i], taken));
    }
    trackers_[pos]->mark_filled_range(range);
    for (const auto& key : distinct) {
        trackers_[pos]->touch(key);
    }
}

size_t RowTable::make_hole(uint32_t index_id, const std::string& key) {
    size_t pos = position_of(index_id);
    if (!trackers_[pos]) {
        throw std::invalid_argument("index " + std::to_string(index_id) + " is not partial");
    }
    size_t freed = unlink_key(pos, key);
    trackers_[pos]->mark_hole(key);
    return freed;
}

size_t RowTable::make_hole_range(uint32_t index_id, const EncodedRange& range) {
    size_t pos = position_of(index_id);
    if (!trackers_[pos]) {
        throw std::invalid_argument("index " + std::to_string(index_id) + " is not partial");
    }
    if (!indices_[pos].supports_ranges()) {
        throw std::invalid_argument("range invalidation on hash index " + std::to_string(index_id));
    }
    std::vector<std::string> keys;
    maps_[pos].for_range(range, [&](const std::string& key, const std::vector<RowId>&) {
        keys.push_back(key);
    });
    size_t freed = 0;
    for (const auto& key : keys) {
        freed += unlink_key(pos, key);
    }
    trackers_[pos]->mark_hole_range(range);
    return freed;
}

RowTable::EvictionResult RowTable::evict_keys(uint32_t index_id, const std::vector<std::string>& keys) {
    size_t pos = position_of(index_id);
    if (!trackers_[pos]) {
        throw std::invalid_argument("cannot evict from full index " + std::to_string(index_id));
    }
    EvictionResult result;
    for (const auto& key : keys) {
        if (!trackers_[pos]->is_filled(key)) continue;
        result.bytes += unlink_key(pos, key);
        trackers_[pos]->mark_hole(key);
        ++result.keys;
    }
    return result;
}

RowTable::EvictionResult RowTable::evict_lru(uint32_t index_id, size_t max_keys) {
    size_t pos = position_of(index_id);
    if (!trackers_[pos]) {
        return {};
    }
    return evict_keys(index_id, trackers_[pos]->lru_keys(max_keys));
}

Rows RowTable::rows() const {
    Rows out;
    out.reserve(arena_.size());
    for (const auto& kv : arena_) {
        out.push_back(kv.second.row);
    }
    return out;
}

void RowTable::clear() {
    for (auto& m : maps_) m.clear();
    for (auto& t : trackers_) {
        if (t) t->clear();
    }
    arena_.clear();
    bytes_.store(0, std::memory_order_relaxed);
}

} // namespace dfstate
