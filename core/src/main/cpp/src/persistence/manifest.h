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
#include <string>
#include <vector>
#include <cstdint>
#include <ctime>
#include "../index.h"

namespace dfstate {
namespace persist {

/**
 * Manifest - JSON file describing a durable node's directory
 *
 * Contains:
 * - Row arity and the index schema the data was written with
 * - The current snapshot (if any) and the last frame it covers
 * - The live batch-log segments, in replay order
 *
 * Written atomically via temp + rename pattern
 */
class Manifest {
public:
    struct SnapshotInfo {
        std::string path;           // relative to the node directory
        uint64_t covered_seq = 0;   // last frame folded into the snapshot
        uint64_t records = 0;
        uint64_t size = 0;
        uint32_t crc32c = 0;        // body checksum
    };

    struct LogInfo {
        std::string path;           // relative to the node directory
        uint64_t seq = 0;           // segment sequence number
    };

    explicit Manifest(const std::string& data_dir);
    ~Manifest() = default;

    // Load manifest from disk. Returns false if it does not exist;
    // throws RecoveryInconsistency if it exists but cannot be parsed.
    bool load();

    // Store manifest to disk (atomic write via temp + rename). Throws StorageIOError.
    void store();

    const std::string& get_data_dir() const { return data_dir_; }
    size_t get_arity() const { return arity_; }
    const std::vector<Index>& get_indices() const { return indices_; }
    const SnapshotInfo& get_snapshot() const { return snapshot_; }
    bool has_snapshot() const { return !snapshot_.path.empty(); }
    const std::vector<LogInfo>& get_logs() const { return logs_; }

    void set_schema(size_t arity, const std::vector<Index>& indices) {
        arity_ = arity;
        indices_ = indices;
    }
    void set_snapshot(const SnapshotInfo& info) { snapshot_ = info; }
    void set_logs(const std::vector<LogInfo>& logs) { logs_ = logs; }
    void add_log(const LogInfo& info) { logs_.push_back(info); }

    std::string get_manifest_path() const;

    std::string to_json() const;
    void from_json(const std::string& json_str);

private:
    std::string data_dir_;

    uint32_t version_;
    time_t created_unix_ = 0;
    size_t arity_ = 0;
    std::vector<Index> indices_;
    SnapshotInfo snapshot_;
    std::vector<LogInfo> logs_;
};

} // namespace persist
} // namespace dfstate
