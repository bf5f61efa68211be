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

#include "table_snapshot.h"
#include "config.h"
#include "platform_fs.h"
#include "checksums.h"
#include "../errors.h"
#include "../util/endian.hpp"
#include "../util/log.h"
#include <cerrno>
#include <cstring>
#include <cstdio>

namespace dfstate {
namespace persist {

using namespace dfstate::util;

std::string TableSnapshot::file_name(uint64_t seq) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%s%020llu%s", files::kSnapshotPrefix,
             static_cast<unsigned long long>(seq), files::kSnapshotExtension);
    return buf;
}

TableSnapshot::WriteResult TableSnapshot::write(const std::string& path,
                                                uint64_t covered_seq,
                                                const std::optional<ReplicationOffset>& checkpoint,
                                                const std::map<std::string, std::string>& records) {
    std::string body;
    for (const auto& [key, row] : records) {
        append_le32(body, static_cast<uint32_t>(key.size()));
        body.append(key);
        append_le32(body, static_cast<uint32_t>(row.size()));
        body.append(row);
    }

    std::string out(snapshot::kMagic, sizeof(snapshot::kMagic));
    append_le32(out, snapshot::kVersion);
    out.push_back(checkpoint ? 1 : 0);
    const std::string name = checkpoint ? checkpoint->log_name : std::string();
    append_le32(out, static_cast<uint32_t>(name.size()));
    out.append(name);
    append_le64(out, checkpoint ? checkpoint->offset : 0);
    append_le64(out, covered_seq);
    append_le64(out, records.size());
    append_le64(out, body.size());
    uint32_t body_crc = crc32c(body.data(), body.size());
    append_le32(out, body_crc);
    append_le32(out, crc32c(out.data(), out.size()));
    out.append(body);

    FSResult r = PlatformFS::write_file_durable(path, out);
    if (!r.ok) {
        throw StorageIOError("failed to write snapshot", path, r.err);
    }

    WriteResult result;
    result.bytes = out.size();
    result.records = records.size();
    result.body_crc = body_crc;
    return result;
}

TableSnapshot::Contents TableSnapshot::read(const std::string& path) {
    if (!PlatformFS::exists(path)) {
        throw RecoveryInconsistency("snapshot referenced by manifest is missing", path);
    }

    std::string data;
    FSResult r = PlatformFS::read_file(path, &data);
    if (!r.ok) {
        throw StorageIOError("failed to read snapshot", path, r.err);
    }

    const uint8_t* base = reinterpret_cast<const uint8_t*>(data.data());
    const uint8_t* p = base;
    const uint8_t* end = base + data.size();
    auto need = [&](size_t n) {
        if (static_cast<size_t>(end - p) < n) {
            throw RecoveryInconsistency("snapshot is truncated", path);
        }
    };

    need(sizeof(snapshot::kMagic) + 4 + 1 + 4);
    if (std::memcmp(p, snapshot::kMagic, sizeof(snapshot::kMagic)) != 0) {
        throw RecoveryInconsistency("snapshot has bad magic", path);
    }
    p += sizeof(snapshot::kMagic);
    uint32_t version = load_le32(p); p += 4;
    if (version != snapshot::kVersion) {
        throw RecoveryInconsistency("unsupported snapshot version " + std::to_string(version), path);
    }

    Contents contents;
    bool has_checkpoint = *p++ != 0;
    uint32_t name_len = load_le32(p); p += 4;
    need(name_len + 8 + 8 + 8 + 8 + 4 + 4);
    std::string name(reinterpret_cast<const char*>(p), name_len); p += name_len;
    uint64_t offset = load_le64(p); p += 8;
    if (has_checkpoint) {
        contents.checkpoint = ReplicationOffset(name, offset);
    }
    contents.covered_seq = load_le64(p); p += 8;
    uint64_t record_count = load_le64(p); p += 8;
    uint64_t body_len = load_le64(p); p += 8;
    uint32_t body_crc = load_le32(p); p += 4;

    size_t header_len = static_cast<size_t>(p - base);
    uint32_t header_crc = load_le32(p); p += 4;
    if (crc32c(base, header_len) != header_crc) {
        throw RecoveryInconsistency("snapshot header checksum mismatch", path);
    }

    if (static_cast<uint64_t>(end - p) != body_len) {
        throw RecoveryInconsistency("snapshot body length mismatch", path);
    }
    if (crc32c(p, body_len) != body_crc) {
        throw RecoveryInconsistency("snapshot body checksum mismatch", path);
    }

    contents.records.reserve(record_count);
    for (uint64_t i = 0; i < record_count; ++i) {
        need(4);
        uint32_t klen = load_le32(p); p += 4;
        need(klen + 4);
        std::string key(reinterpret_cast<const char*>(p), klen); p += klen;
        uint32_t vlen = load_le32(p); p += 4;
        need(vlen);
        std::string row(reinterpret_cast<const char*>(p), vlen); p += vlen;
        contents.records.emplace_back(std::move(key), std::move(row));
    }
    if (p != end) {
        throw RecoveryInconsistency("snapshot has trailing bytes", path);
    }

    debug() << "loaded snapshot " << path << " (" << record_count << " records, covers frame "
            << contents.covered_seq << ")";
    return contents;
}

} // namespace persist
} // namespace dfstate
