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

#include "batch_log.h"
#include "platform_fs.h"
#include "checksums.h"
#include "../errors.h"
#include "../util/endian.hpp"
#include "../util/log.h"
#include <cstring>
#include <stdexcept>
#include <unistd.h>

namespace dfstate {
    namespace persist {

        using namespace dfstate::util;

        static uint32_t header_crc(const uint8_t* header_buf) {
            return crc32c(header_buf, 12);
        }

        BatchLog::BatchLog(const std::string& path, uint64_t sequence, bool sync_on_commit)
            : path_(path), sequence_(sequence), sync_on_commit_(sync_on_commit) {
            FSResult r = PlatformFS::open_append(path_, &fd_, &end_offset_);
            if (!r.ok) {
                throw StorageIOError("failed to open batch log", path_, r.err);
            }
        }

        BatchLog::~BatchLog() {
            if (fd_ >= 0) {
                FSResult r = PlatformFS::close_file(fd_);
                if (!r.ok) {
                    error() << "closing batch log " << path_ << " failed: "
                            << errnoWithDescription(r.err);
                }
                fd_ = -1;
            }
        }

        std::string BatchLog::encode_frame(const BatchFrame& frame) {
            std::string payload;
            append_le64(payload, frame.seq);
            append_le32(payload, static_cast<uint32_t>(frame.checkpoint.log_name.size()));
            payload.append(frame.checkpoint.log_name);
            append_le64(payload, frame.checkpoint.offset);
            append_le32(payload, static_cast<uint32_t>(frame.ops.size()));
            for (const auto& op : frame.ops) {
                payload.push_back(static_cast<char>(op.kind));
                append_le32(payload, static_cast<uint32_t>(op.key.size()));
                payload.append(op.key);
                append_le32(payload, static_cast<uint32_t>(op.value.size()));
                payload.append(op.value);
            }

            uint8_t header_buf[batch_log::kFrameHeaderSize];
            store_le32(header_buf, batch_log::kFrameTypeBatch);
            store_le32(header_buf + 4, static_cast<uint32_t>(payload.size()));
            store_le32(header_buf + 8, crc32c(payload.data(), payload.size()));
            store_le32(header_buf + 12, header_crc(header_buf));

            std::string out(reinterpret_cast<const char*>(header_buf), sizeof(header_buf));
            out.append(payload);
            return out;
        }

        uint64_t BatchLog::append(const BatchFrame& frame) {
            if (fd_ < 0) {
                throw StorageIOError("append to closed batch log", path_, EBADF);
            }

            std::string buffer = encode_frame(frame);

            FSResult r = PlatformFS::write_all(fd_, buffer.data(), buffer.size());
            if (r.ok && sync_on_commit_) {
                r = PlatformFS::flush_file(fd_);
            }
            if (!r.ok) {
                // Cut the partial frame off so a retry after repair starts clean
                if (::ftruncate(fd_, static_cast<off_t>(end_offset_)) != 0) {
                    error() << "failed to cut partial frame from " << path_ << ": "
                            << errnoWithDescription();
                }
                ::lseek(fd_, static_cast<off_t>(end_offset_), SEEK_SET);
                throw StorageIOError("failed to append batch frame", path_, r.err);
            }

            end_offset_ += buffer.size();
            return buffer.size();
        }

        void BatchLog::sync() {
            if (fd_ < 0) {
                return;
            }
            FSResult r = PlatformFS::flush_file(fd_);
            if (!r.ok) {
                throw StorageIOError("failed to sync batch log", path_, r.err);
            }
        }

        void BatchLog::close() {
            if (fd_ < 0) {
                return;
            }
            int fd = fd_;
            fd_ = -1;
            FSResult r = PlatformFS::flush_file(fd);
            FSResult c = PlatformFS::close_file(fd);
            if (!r.ok) {
                throw StorageIOError("failed to sync batch log on close", path_, r.err);
            }
            if (!c.ok) {
                throw StorageIOError("failed to close batch log", path_, c.err);
            }
        }

        // Decodes a CRC-verified payload. Malformed content here is not a torn
        // write, so it is reported as an inconsistency.
        static BatchFrame decode_payload(const std::string& path, const uint8_t* p, size_t len) {
            const uint8_t* end = p + len;
            auto need = [&](size_t n) {
                if (static_cast<size_t>(end - p) < n) {
                    throw RecoveryInconsistency("batch frame payload is malformed", path);
                }
            };

            BatchFrame frame;
            need(12);
            frame.seq = load_le64(p); p += 8;
            uint32_t name_len = load_le32(p); p += 4;
            need(static_cast<size_t>(name_len) + 12);
            frame.checkpoint.log_name.assign(reinterpret_cast<const char*>(p), name_len); p += name_len;
            frame.checkpoint.offset = load_le64(p); p += 8;
            uint32_t op_count = load_le32(p); p += 4;

            frame.ops.reserve(op_count);
            for (uint32_t i = 0; i < op_count; ++i) {
                LogOp op;
                need(5);
                op.kind = *p++;
                if (op.kind != op_kind::kPut && op.kind != op_kind::kDelete) {
                    throw RecoveryInconsistency("batch frame has unknown op kind", path);
                }
                uint32_t klen = load_le32(p); p += 4;
                need(static_cast<size_t>(klen) + 4);
                op.key.assign(reinterpret_cast<const char*>(p), klen); p += klen;
                uint32_t vlen = load_le32(p); p += 4;
                need(vlen);
                op.value.assign(reinterpret_cast<const char*>(p), vlen); p += vlen;
                frame.ops.push_back(std::move(op));
            }
            if (p != end) {
                throw RecoveryInconsistency("batch frame payload has trailing bytes", path);
            }
            return frame;
        }

        ReplayResult BatchLog::replay(const std::string& path,
                                      const std::function<void(BatchFrame&&)>& apply) {
            ReplayResult result;
            if (!PlatformFS::exists(path)) {
                return result;
            }

            std::string data;
            FSResult r = PlatformFS::read_file(path, &data);
            if (!r.ok) {
                throw StorageIOError("failed to read batch log", path, r.err);
            }
            result.file_size = data.size();

            const uint8_t* base = reinterpret_cast<const uint8_t*>(data.data());
            uint64_t pos = 0;
            const uint64_t size = data.size();

            while (pos < size) {
                uint64_t frame_start = pos;

                if (size - pos < batch_log::kFrameHeaderSize) {
                    // Partial header at end - torn tail
                    result.torn_tail = true;
                    break;
                }

                const uint8_t* header_buf = base + pos;
                FrameHeader header;
                header.frame_type = load_le32(header_buf);
                header.payload_size = load_le32(header_buf + 4);
                header.payload_crc = load_le32(header_buf + 8);
                header.header_crc = load_le32(header_buf + 12);

                uint64_t declared_end = pos + batch_log::kFrameHeaderSize + header.payload_size;

                if (header_crc(header_buf) != header.header_crc ||
                    header.frame_type != batch_log::kFrameTypeBatch ||
                    header.payload_size > batch_log::kMaxPayloadSize) {
                    if (declared_end >= size) {
                        result.torn_tail = true;
                        break;
                    }
                    throw RecoveryInconsistency("corrupt batch frame header at offset " +
                                                std::to_string(frame_start), path);
                }

                if (declared_end > size) {
                    // Incomplete payload at end - torn tail
                    result.torn_tail = true;
                    break;
                }

                const uint8_t* payload = header_buf + batch_log::kFrameHeaderSize;
                if (crc32c(payload, header.payload_size) != header.payload_crc) {
                    if (declared_end == size) {
                        result.torn_tail = true;
                        break;
                    }
                    throw RecoveryInconsistency("batch frame checksum mismatch at offset " +
                                                std::to_string(frame_start), path);
                }

                apply(decode_payload(path, payload, header.payload_size));
                ++result.frames;
                pos = declared_end;
                result.last_good_offset = pos;
            }

            return result;
        }

    } // namespace persist
} // namespace dfstate
