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
#include <functional>
#include <string>
#include <vector>
#include "config.h"
#include "../replication_offset.h"

namespace dfstate {
    namespace persist {

        // One mutation of the primary namespace
        struct LogOp {
            uint8_t kind = op_kind::kPut;
            std::string key;    // encoded primary key
            std::string value;  // RowCodec bytes, empty for deletes

            static LogOp put(std::string k, std::string v) { return LogOp{op_kind::kPut, std::move(k), std::move(v)}; }
            static LogOp del(std::string k) { return LogOp{op_kind::kDelete, std::move(k), {}}; }
        };

        // One committed batch. The checkpoint it carries covers exactly its ops.
        struct BatchFrame {
            uint64_t seq = 0;
            ReplicationOffset checkpoint;
            std::vector<LogOp> ops;
        };

        // Frame header, little-endian on disk
        struct FrameHeader {
            uint32_t frame_type;    // batch_log::kFrameTypeBatch
            uint32_t payload_size;
            uint32_t payload_crc;   // CRC32C of payload
            uint32_t header_crc;    // CRC32C of the first 12 header bytes
        };

        struct ReplayResult {
            uint64_t frames = 0;
            uint64_t last_good_offset = 0;  // end of the last intact frame
            uint64_t file_size = 0;
            bool torn_tail = false;
        };

        /**
         * Append-only, CRC32C-framed write-ahead log of committed batches.
         *
         * Frame layout: header(16) | payload. Payload:
         *   seq(8) | name_len(4) | log_name | offset(8) | op_count(4) |
         *   op_count x [kind(1) | key_len(4) | key | value_len(4) | value]
         *
         * A frame is either wholly present or discarded on replay. Not thread safe;
         * the owning table serializes appends.
         */
        class BatchLog {
        public:
            BatchLog(const std::string& path, uint64_t sequence, bool sync_on_commit);
            ~BatchLog();

            BatchLog(const BatchLog&) = delete;
            BatchLog& operator=(const BatchLog&) = delete;

            // Writes one frame (and fdatasyncs when sync_on_commit). Returns bytes written.
            // Throws StorageIOError; a failed append is cut back off the file.
            uint64_t append(const BatchFrame& frame);
            void sync();
            void close();

            uint64_t end_offset() const { return end_offset_; }
            uint64_t sequence() const noexcept { return sequence_; }
            const std::string& path() const noexcept { return path_; }
            bool is_open() const { return fd_ >= 0; }

            static std::string encode_frame(const BatchFrame& frame);

            /**
             * Calls apply for every intact frame in file order. An incomplete final
             * frame, or a final frame failing its checksum, is a torn tail: replay
             * stops there and reports it. A bad frame followed by more data throws
             * RecoveryInconsistency. A missing file replays nothing.
             */
            static ReplayResult replay(const std::string& path,
                                       const std::function<void(BatchFrame&&)>& apply);

        private:
            std::string path_;
            uint64_t sequence_;
            bool sync_on_commit_;
            int fd_ = -1;
            uint64_t end_offset_ = 0;
        };

    } // namespace persist
} // namespace dfstate
