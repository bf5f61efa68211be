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

#include "durable_table.h"
#include "config.h"
#include "platform_fs.h"
#include "recovery.h"
#include "table_snapshot.h"
#include "../metrics.h"
#include "../util/endian.hpp"
#include "../util/log.h"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace dfstate {
    namespace persist {

        static std::string join(const std::string& dir, const std::string& file) {
            return (std::filesystem::path(dir) / file).string();
        }

        static std::string log_file_name(uint64_t seq) {
            char buf[64];
            snprintf(buf, sizeof(buf), "%s%020llu%s", files::kLogPrefix,
                     static_cast<unsigned long long>(seq), files::kLogExtension);
            return buf;
        }

        DurableTable::DurableTable(const PersistenceParameters& params, size_t arity, std::vector<Index> indices)
            : params_(params), dir_(params.node_dir()), arity_(arity),
              indices_(std::move(indices)), manifest_(dir_) {
            if (params_.db_name.empty()) {
                throw std::invalid_argument("persistent node needs a db_name");
            }
            validate_indices(indices_, arity_, true);
            for (size_t i = 0; i < indices_.size(); ++i) {
                if (indices_[i].primary) primary_pos_ = i;
            }
            namespaces_.resize(indices_.size());

            try {
                if (params_.mode == DurabilityMode::DeleteOnExit) {
                    FSResult r = PlatformFS::remove_all(dir_);
                    if (!r.ok) {
                        throw StorageIOError("failed to clear delete-on-exit directory", dir_, r.err);
                    }
                }
                FSResult r = PlatformFS::ensure_directory(dir_);
                if (!r.ok) {
                    throw StorageIOError("failed to create node directory", dir_, r.err);
                }

                Recovery recovery(manifest_, arity_, indices_);
                RecoveredState state = recovery.cold_start();

                if (state.fresh) {
                    start_fresh();
                } else {
                    const Index& primary = indices_[primary_pos_];
                    for (auto& [record_key, bytes] : state.primary) {
                        Row row;
                        try {
                            row = RowCodec::decode(bytes);
                        } catch (const std::invalid_argument& e) {
                            throw RecoveryInconsistency(std::string("undecodable row: ") + e.what(), dir_);
                        }
                        if (row.size() != arity_) {
                            throw RecoveryInconsistency("recovered row has arity " +
                                                        std::to_string(row.size()), dir_);
                        }
                        std::string pk = primary.encode_key(row);
                        if (primary.unique) {
                            if (record_key != pk) {
                                throw RecoveryInconsistency("record key does not match its row", dir_);
                            }
                        } else {
                            if (record_key.size() != pk.size() + 8 ||
                                record_key.compare(0, pk.size(), pk) != 0) {
                                throw RecoveryInconsistency("record key does not match its row", dir_);
                            }
                            uint64_t seq = util::load_be64(
                                reinterpret_cast<const uint8_t*>(record_key.data() + pk.size()));
                            next_row_seq_ = std::max(next_row_seq_, seq + 1);
                        }
                        records_.emplace(record_key, make_row(std::move(row)));
                    }

                    checkpoint_ = state.checkpoint;
                    frame_seq_ = state.last_frame_seq;
                    active_log_ = state.active_log;
                    if (manifest_.has_snapshot()) {
                        snapshot_ = manifest_.get_snapshot();
                    }
                    log_ = std::make_unique<BatchLog>(join(dir_, active_log_.path), active_log_.seq,
                                                      params_.sync_on_commit);
                    recovered_ = true;
                }

                rebuild_namespaces();
                if (params_.verify_on_open) {
                    verify_namespaces();
                }
            } catch (const StateError& e) {
                error() << "opening durable node " << dir_ << " failed: " << e.what();
                throw;
            }

            info() << "opened durable node " << dir_ << " (" << to_string(params_.mode) << ", "
                   << records_.size() << " records, checkpoint "
                   << (checkpoint_ ? checkpoint_->to_string() : std::string("<none>")) << ")";
        }

        DurableTable::~DurableTable() {
            try {
                close();
            } catch (const StateError& e) {
                error() << "closing durable node " << dir_ << " failed: " << e.what();
            }
        }

        void DurableTable::start_fresh() {
            active_log_ = Manifest::LogInfo{log_file_name(1), 1};
            log_ = std::make_unique<BatchLog>(join(dir_, active_log_.path), active_log_.seq,
                                              params_.sync_on_commit);
            store_manifest(std::nullopt, active_log_);
        }

        void DurableTable::store_manifest(const std::optional<Manifest::SnapshotInfo>& snapshot,
                                          const Manifest::LogInfo& log) {
            manifest_.set_schema(arity_, indices_);
            manifest_.set_snapshot(snapshot ? *snapshot : Manifest::SnapshotInfo{});
            manifest_.set_logs({log});
            manifest_.store();
        }

        size_t DurableTable::position_of(uint32_t index_id) const {
            for (size_t i = 0; i < indices_.size(); ++i) {
                if (indices_[i].id == index_id) return i;
            }
            throw std::invalid_argument("unknown index id " + std::to_string(index_id));
        }

        void DurableTable::check_poisoned() const {
            if (poison_err_ != 0) {
                throw StorageIOError("durable node is unusable after an earlier storage failure",
                                     poison_path_, poison_err_);
            }
        }

        void DurableTable::poison(const StorageIOError& e) {
            poison_err_ = e.error_code() != 0 ? e.error_code() : EIO;
            poison_path_ = e.path();
            error() << "durable node " << dir_ << " poisoned: " << e.what();
            throw e;
        }

        std::string DurableTable::primary_key_of(const Row& row) const {
            return indices_[primary_pos_].encode_key(row);
        }

        std::string DurableTable::make_record_key(const std::string& pk) {
            if (indices_[primary_pos_].unique) {
                return pk;
            }
            std::string rk = pk;
            util::append_be64(rk, next_row_seq_++);
            return rk;
        }

        template<typename F>
        void DurableTable::scan_primary(const std::string& pk, F&& f) const {
            if (indices_[primary_pos_].unique) {
                auto it = records_.find(pk);
                if (it != records_.end()) f(it);
                return;
            }
            for (auto it = records_.lower_bound(pk);
                 it != records_.end() && it->first.size() == pk.size() + 8 &&
                 it->first.compare(0, pk.size(), pk) == 0;
                 ++it) {
                f(it);
            }
        }

        DurableTable::RecordMap::const_iterator DurableTable::find_record(const Row& row) const {
            RecordMap::const_iterator found = records_.end();
            scan_primary(primary_key_of(row), [&](RecordMap::const_iterator it) {
                if (found == records_.end() && *it->second == row) found = it;
            });
            return found;
        }

        void DurableTable::link(const std::string& record_key, const RowPtr& row) {
            for (size_t i = 0; i < indices_.size(); ++i) {
                if (i == primary_pos_) continue;
                namespaces_[i][indices_[i].encode_key(*row)].insert(record_key);
            }
        }

        void DurableTable::unlink(const std::string& record_key, const Row& row) {
            for (size_t i = 0; i < indices_.size(); ++i) {
                if (i == primary_pos_) continue;
                auto it = namespaces_[i].find(indices_[i].encode_key(row));
                if (it == namespaces_[i].end()) continue;
                it->second.erase(record_key);
                if (it->second.empty()) namespaces_[i].erase(it);
            }
        }

        void DurableTable::rollback(std::vector<UndoEntry>& undo) {
            for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
                if (it->inserted) {
                    unlink(it->record_key, *it->row);
                    records_.erase(it->record_key);
                } else {
                    records_.emplace(it->record_key, it->row);
                    link(it->record_key, it->row);
                }
            }
            undo.clear();
        }

        void DurableTable::rebuild_namespaces() {
            for (auto& ns : namespaces_) ns.clear();
            for (const auto& [record_key, row] : records_) {
                link(record_key, row);
            }
        }

        void DurableTable::verify_namespaces() const {
            for (size_t i = 0; i < indices_.size(); ++i) {
                if (i == primary_pos_) continue;
                for (const auto& [key, record_keys] : namespaces_[i]) {
                    if (indices_[i].unique && record_keys.size() > 1) {
                        throw RecoveryInconsistency("unique index " + std::to_string(indices_[i].id) +
                                                    " holds a duplicate key", dir_);
                    }
                    for (const auto& rk : record_keys) {
                        auto rec = records_.find(rk);
                        if (rec == records_.end()) {
                            throw RecoveryInconsistency("secondary reference without primary record in index " +
                                                        std::to_string(indices_[i].id), dir_);
                        }
                        if (indices_[i].encode_key(*rec->second) != key) {
                            throw RecoveryInconsistency("secondary key does not match its record in index " +
                                                        std::to_string(indices_[i].id), dir_);
                        }
                    }
                }
            }
        }

        void DurableTable::apply_batch(const Records& records, const ReplicationOffset& new_checkpoint) {
            check_poisoned();
            if (closed_) {
                throw std::invalid_argument("durable node " + dir_ + " is closed");
            }
            for (const auto& rec : records) {
                if (rec.row->size() != arity_) {
                    throw std::invalid_argument("record arity " + std::to_string(rec.row->size()) +
                                                " does not match node arity " + std::to_string(arity_));
                }
            }

            Stopwatch timer;
            std::vector<UndoEntry> undo;
            BatchFrame frame;
            frame.ops.reserve(records.size());

            try {
                for (const auto& rec : records) {
                    const Row& row = *rec.row;
                    if (rec.positive) {
                        std::string pk = primary_key_of(row);
                        for (size_t i = 0; i < indices_.size(); ++i) {
                            if (!indices_[i].unique) continue;
                            bool taken = (i == primary_pos_)
                                ? records_.count(pk) != 0
                                : namespaces_[i].count(indices_[i].encode_key(row)) != 0;
                            if (taken) {
                                std::ostringstream msg;
                                msg << "duplicate key " << indices_[i].key_of(row) << " on unique "
                                    << indices_[i];
                                throw ConstraintViolation(msg.str());
                            }
                        }
                        std::string rk = make_record_key(pk);
                        records_.emplace(rk, rec.row);
                        link(rk, rec.row);
                        frame.ops.push_back(LogOp::put(rk, RowCodec::encode(row)));
                        undo.push_back(UndoEntry{true, std::move(rk), rec.row});
                    } else {
                        auto it = find_record(row);
                        if (it == records_.end()) {
                            std::ostringstream msg;
                            msg << "remove of absent row " << row;
                            throw ConstraintViolation(msg.str());
                        }
                        std::string rk = it->first;
                        RowPtr old = it->second;
                        unlink(rk, *old);
                        records_.erase(it);
                        frame.ops.push_back(LogOp::del(rk));
                        undo.push_back(UndoEntry{false, std::move(rk), std::move(old)});
                    }
                }
            } catch (const ConstraintViolation& e) {
                rollback(undo);
                error() << "durable node " << dir_ << ": " << e.what();
                throw;
            }

            frame.seq = frame_seq_ + 1;
            frame.checkpoint = new_checkpoint;

            uint64_t bytes = 0;
            try {
                bytes = log_->append(frame);
            } catch (const StorageIOError& e) {
                rollback(undo);
                poison(e);
            }

            frame_seq_ = frame.seq;
            if (checkpoint_ && new_checkpoint < *checkpoint_) {
                warning() << "durable node " << dir_ << ": checkpoint moved backwards from "
                          << *checkpoint_ << " to " << new_checkpoint;
            }
            checkpoint_ = new_checkpoint;

            METRIC_COUNTER_INC(durable_commits);
            METRIC_COUNTER_ADD(log_bytes_written, bytes);
            METRIC_HISTOGRAM_RECORD(commit_latency_us, timer.elapsed_us());

            if (log_->end_offset() >= params_.wal_rotate_bytes) {
                compact();
            }
        }

        Rows DurableTable::lookup(uint32_t index_id, const std::string& encoded_key) const {
            check_poisoned();
            size_t pos = position_of(index_id);
            Rows out;
            if (pos == primary_pos_) {
                scan_primary(encoded_key, [&](RecordMap::const_iterator it) {
                    out.push_back(it->second);
                });
                return out;
            }
            auto it = namespaces_[pos].find(encoded_key);
            if (it != namespaces_[pos].end()) {
                for (const auto& rk : it->second) {
                    out.push_back(records_.at(rk));
                }
            }
            return out;
        }

        bool DurableTable::contains_key(uint32_t index_id, const std::string& encoded_key) const {
            check_poisoned();
            size_t pos = position_of(index_id);
            if (pos != primary_pos_) {
                return namespaces_[pos].count(encoded_key) != 0;
            }
            bool found = false;
            scan_primary(encoded_key, [&](RecordMap::const_iterator) { found = true; });
            return found;
        }

        template<typename Map>
        static typename Map::const_iterator range_start(const Map& m, const EncodedBound& lower) {
            switch (lower.kind) {
                case Bound::Kind::Included: return m.lower_bound(lower.bytes);
                case Bound::Kind::Excluded: return m.upper_bound(lower.bytes);
                default:                    return m.begin();
            }
        }

        Rows DurableTable::range_lookup(uint32_t index_id, const EncodedRange& range) const {
            check_poisoned();
            size_t pos = position_of(index_id);
            if (!indices_[pos].supports_ranges()) {
                throw std::invalid_argument("range lookup on hash index " + std::to_string(index_id));
            }

            Rows out;
            if (range.is_empty()) {
                return out;
            }

            if (pos != primary_pos_) {
                const auto& ns = namespaces_[pos];
                for (auto it = range_start(ns, range.lower);
                     it != ns.end() && range.below_upper(it->first); ++it) {
                    for (const auto& rk : it->second) {
                        out.push_back(records_.at(rk));
                    }
                }
                return out;
            }

            const bool unique = indices_[primary_pos_].unique;
            for (auto it = range_start(records_, range.lower); it != records_.end(); ++it) {
                std::string pk = unique ? it->first : it->first.substr(0, it->first.size() - 8);
                if (!range.below_upper(pk)) break;
                if (range.above_lower(pk)) out.push_back(it->second);
            }
            return out;
        }

        std::pair<Rows, std::optional<ReplicationOffset>> DurableTable::snapshot_for_recovery() const {
            check_poisoned();
            Rows rows;
            rows.reserve(records_.size());
            for (const auto& kv : records_) {
                rows.push_back(kv.second);
            }
            return {std::move(rows), checkpoint_};
        }

        void DurableTable::compact() {
            check_poisoned();
            try {
                std::map<std::string, std::string> encoded;
                for (const auto& [rk, row] : records_) {
                    encoded.emplace(rk, RowCodec::encode(*row));
                }

                std::string snap_name = TableSnapshot::file_name(frame_seq_);
                auto res = TableSnapshot::write(join(dir_, snap_name), frame_seq_, checkpoint_, encoded);
                Manifest::SnapshotInfo snap_info;
                snap_info.path = snap_name;
                snap_info.covered_seq = frame_seq_;
                snap_info.records = res.records;
                snap_info.size = res.bytes;
                snap_info.crc32c = res.body_crc;

                Manifest::LogInfo next{log_file_name(active_log_.seq + 1), active_log_.seq + 1};
                auto next_log = std::make_unique<BatchLog>(join(dir_, next.path), next.seq,
                                                           params_.sync_on_commit);

                store_manifest(snap_info, next);

                Manifest::LogInfo old_log = active_log_;
                std::optional<Manifest::SnapshotInfo> old_snapshot = snapshot_;
                log_->close();
                log_ = std::move(next_log);
                active_log_ = next;
                snapshot_ = snap_info;

                FSResult r = PlatformFS::remove_file(join(dir_, old_log.path));
                if (!r.ok) {
                    throw StorageIOError("failed to remove superseded batch log",
                                         join(dir_, old_log.path), r.err);
                }
                if (old_snapshot && old_snapshot->path != snap_info.path) {
                    r = PlatformFS::remove_file(join(dir_, old_snapshot->path));
                    if (!r.ok) {
                        throw StorageIOError("failed to remove superseded snapshot",
                                             join(dir_, old_snapshot->path), r.err);
                    }
                }

                METRIC_COUNTER_INC(compactions);
                info() << "compacted " << dir_ << " into " << snap_name << " ("
                       << res.records << " records, " << res.bytes << " bytes)";
            } catch (const StorageIOError& e) {
                poison(e);
            }
        }

        void DurableTable::close() {
            if (closed_) {
                return;
            }
            closed_ = true;

            if (log_) {
                try {
                    log_->close();
                } catch (const StorageIOError& e) {
                    poison_err_ = e.error_code();
                    poison_path_ = e.path();
                    if (params_.mode != DurabilityMode::DeleteOnExit) {
                        throw;
                    }
                    warning() << "ignoring close failure of delete-on-exit node " << dir_
                              << ": " << e.what();
                }
            }

            if (params_.mode == DurabilityMode::DeleteOnExit) {
                FSResult r = PlatformFS::remove_all(dir_);
                if (!r.ok) {
                    throw StorageIOError("failed to remove delete-on-exit directory", dir_, r.err);
                }
            }
            info() << "closed durable node " << dir_;
        }

    } // namespace persist
} // namespace dfstate
