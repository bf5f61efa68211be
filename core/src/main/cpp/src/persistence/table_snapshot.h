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
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../replication_offset.h"

namespace dfstate {
namespace persist {

/**
 * Table snapshot - compacted image of a node's primary namespace
 *
 * File layout (little-endian):
 * +------------------------------------------+
 * | magic "DFSNAP01" | version              |
 * | has_checkpoint | name_len | log_name    |
 * | offset | covered_seq | record_count      |
 * | body_len | body_crc32c | header_crc32c   |
 * +------------------------------------------+
 * | body: record_count x                     |
 * |   key_len | key | row_len | row           |
 * +------------------------------------------+
 *
 * covered_seq is the last batch-log frame folded into the image; replay
 * resumes at covered_seq + 1.
 */
class TableSnapshot {
public:
    struct Contents {
        uint64_t covered_seq = 0;
        std::optional<ReplicationOffset> checkpoint;
        std::vector<std::pair<std::string, std::string>> records;
    };

    struct WriteResult {
        size_t bytes = 0;
        uint64_t records = 0;
        uint32_t body_crc = 0;
    };

    // Atomic and durable: temp file, fsync, rename, directory fsync.
    // Throws StorageIOError.
    static WriteResult write(const std::string& path,
                             uint64_t covered_seq,
                             const std::optional<ReplicationOffset>& checkpoint,
                             const std::map<std::string, std::string>& records);

    // Throws RecoveryInconsistency on a missing or corrupt file and
    // StorageIOError when the read itself fails.
    static Contents read(const std::string& path);

    // snapshot-<seq>.snap
    static std::string file_name(uint64_t seq);
};

} // namespace persist
} // namespace dfstate
