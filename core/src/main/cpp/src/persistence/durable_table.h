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
#include "batch_log.h"
#include "durability_policy.h"
#include "manifest.h"
#include "../errors.h"
#include "../index.h"
#include "../key.h"
#include "../replication_offset.h"
#include "../row.h"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace dfstate {
    namespace persist {

        /**
         * Crash-safe row store for one dataflow node.
         *
         * The primary namespace maps record key -> row. With a unique primary
         * index the record key is the encoded primary key; otherwise it is the
         * encoded primary key followed by an 8-byte big-endian row sequence so
         * duplicate keys (and duplicate rows) stay distinct. Every other index
         * has a namespace of index key -> record keys, rebuilt from the primary
         * namespace on open and never written to disk.
         *
         * Not internally synchronized; the owning StateHandle serializes writers
         * against readers. Any StorageIOError poisons the table.
         */
        class DurableTable {
        public:
            DurableTable(const PersistenceParameters& params, size_t arity, std::vector<Index> indices);
            ~DurableTable();

            DurableTable(const DurableTable&) = delete;
            DurableTable& operator=(const DurableTable&) = delete;

            /**
             * Validate every record against committed state, append one frame with
             * all ops and new_checkpoint, then publish. ConstraintViolation leaves
             * disk and memory untouched.
             */
            void apply_batch(const Records& records, const ReplicationOffset& new_checkpoint);

            Rows lookup(uint32_t index_id, const std::string& encoded_key) const;
            Rows range_lookup(uint32_t index_id, const EncodedRange& range) const;
            bool contains_key(uint32_t index_id, const std::string& encoded_key) const;

            // Every committed row, in record-key order, and the checkpoint covering them
            std::pair<Rows, std::optional<ReplicationOffset>> snapshot_for_recovery() const;

            std::optional<ReplicationOffset> last_checkpoint() const { return checkpoint_; }
            size_t row_count() const { return records_.size(); }
            uint64_t active_log_bytes() const { return log_ ? log_->end_offset() : 0; }
            uint64_t last_frame_seq() const { return frame_seq_; }
            bool recovered() const { return recovered_; }
            const std::string& dir() const { return dir_; }
            const std::vector<Index>& indices() const { return indices_; }

            bool poisoned() const { return poison_err_ != 0; }

            // Fold the log into a fresh snapshot and start a new segment
            void compact();

            // Seal the log. DeleteOnExit removes the directory.
            void close();

        private:
            using RecordMap = std::map<std::string, RowPtr>;
            using Namespace = std::map<std::string, std::set<std::string>>;

            struct UndoEntry {
                bool inserted;          // true: undo by erasing; false: undo by restoring
                std::string record_key;
                RowPtr row;
            };

            size_t position_of(uint32_t index_id) const;
            void check_poisoned() const;
            [[noreturn]] void poison(const StorageIOError& e);

            std::string primary_key_of(const Row& row) const;
            std::string make_record_key(const std::string& pk);
            RecordMap::const_iterator find_record(const Row& row) const;

            void link(const std::string& record_key, const RowPtr& row);
            void unlink(const std::string& record_key, const Row& row);
            void rollback(std::vector<UndoEntry>& undo);

            void rebuild_namespaces();
            void verify_namespaces() const;
            void start_fresh();
            void store_manifest(const std::optional<Manifest::SnapshotInfo>& snapshot,
                                const Manifest::LogInfo& log);

            template<typename F>
            void scan_primary(const std::string& pk, F&& f) const;

            PersistenceParameters params_;
            std::string dir_;
            size_t arity_;
            std::vector<Index> indices_;
            size_t primary_pos_ = 0;

            RecordMap records_;
            std::vector<Namespace> namespaces_;      // one per index, empty for the primary

            std::unique_ptr<BatchLog> log_;
            Manifest manifest_;
            Manifest::LogInfo active_log_;
            std::optional<Manifest::SnapshotInfo> snapshot_;
            std::optional<ReplicationOffset> checkpoint_;
            uint64_t frame_seq_ = 0;
            uint64_t next_row_seq_ = 1;
            bool recovered_ = false;
            bool closed_ = false;

            int poison_err_ = 0;
            std::string poison_path_;
        };

    } // namespace persist
} // namespace dfstate
