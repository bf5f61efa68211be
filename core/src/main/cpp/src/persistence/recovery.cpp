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

#include "recovery.h"
#include "batch_log.h"
#include "config.h"
#include "platform_fs.h"
#include "table_snapshot.h"
#include "../errors.h"
#include "../metrics.h"
#include "../util/log.h"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <sstream>

namespace dfstate {
namespace persist {

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

static std::string join(const std::string& dir, const std::string& file) {
    return (std::filesystem::path(dir) / file).string();
}

static bool is_data_file(const std::string& name) {
    return starts_with(name, files::kSnapshotPrefix) || starts_with(name, files::kLogPrefix);
}

void Recovery::verify_schema() const {
    const std::string path = mf_.get_manifest_path();
    if (mf_.get_arity() != arity_) {
        throw RecoveryInconsistency("schema mismatch: manifest arity " +
                                    std::to_string(mf_.get_arity()) + ", node arity " +
                                    std::to_string(arity_), path);
    }
    const auto& recorded = mf_.get_indices();
    if (recorded.size() != indices_.size()) {
        throw RecoveryInconsistency("schema mismatch: manifest has " +
                                    std::to_string(recorded.size()) + " indices, node has " +
                                    std::to_string(indices_.size()), path);
    }
    for (size_t i = 0; i < recorded.size(); ++i) {
        if (!recorded[i].same_shape(indices_[i])) {
            std::ostringstream msg;
            msg << "schema mismatch: manifest " << recorded[i] << ", node " << indices_[i];
            throw RecoveryInconsistency(msg.str(), path);
        }
    }
}

void Recovery::remove_orphans() const {
    std::set<std::string> referenced;
    if (mf_.has_snapshot()) {
        referenced.insert(mf_.get_snapshot().path);
    }
    for (const auto& log : mf_.get_logs()) {
        referenced.insert(log.path);
    }

    auto [res, names] = PlatformFS::list_directory(mf_.get_data_dir());
    if (!res.ok) {
        throw StorageIOError("failed to list node directory", mf_.get_data_dir(), res.err);
    }
    for (const auto& name : names) {
        bool temp = name.size() > 4 && name.compare(name.size() - 4, 4, files::kTempSuffix) == 0;
        if ((is_data_file(name) && !referenced.count(name)) || temp) {
            warning() << "removing unreferenced file " << name << " in " << mf_.get_data_dir();
            FSResult r = PlatformFS::remove_file(join(mf_.get_data_dir(), name));
            if (!r.ok) {
                throw StorageIOError("failed to remove unreferenced file",
                                     join(mf_.get_data_dir(), name), r.err);
            }
        }
    }
}

RecoveredState Recovery::cold_start() {
    auto start_time = std::chrono::steady_clock::now();
    RecoveredState state;
    const std::string& dir = mf_.get_data_dir();

    // Step 1: Load manifest
    if (!mf_.load()) {
        auto [res, names] = PlatformFS::list_directory(dir);
        if (res.ok) {
            for (const auto& name : names) {
                if (is_data_file(name)) {
                    throw RecoveryInconsistency("data file " + name +
                                                " present without a manifest", dir);
                }
            }
        }
        state.fresh = true;
        return state;
    }
    state.fresh = false;

    // Step 2: Schema must match what the data was written with
    verify_schema();

    if (mf_.get_logs().empty()) {
        throw RecoveryInconsistency("manifest lists no batch-log segment", mf_.get_manifest_path());
    }

    remove_orphans();

    // Step 3: Snapshot
    uint64_t covered_seq = 0;
    if (mf_.has_snapshot()) {
        const auto& snap_info = mf_.get_snapshot();
        std::string snap_path = join(dir, snap_info.path);
        TableSnapshot::Contents contents = TableSnapshot::read(snap_path);
        if (contents.covered_seq != snap_info.covered_seq || contents.records.size() != snap_info.records) {
            throw RecoveryInconsistency("snapshot does not match manifest", snap_path);
        }
        if (snap_info.covered_seq > 0 && !contents.checkpoint) {
            throw RecoveryInconsistency("snapshot covers committed frames but carries no checkpoint",
                                        snap_path);
        }
        covered_seq = contents.covered_seq;
        state.checkpoint = contents.checkpoint;
        for (auto& kv : contents.records) {
            state.primary.emplace(std::move(kv.first), std::move(kv.second));
        }
        info() << "Loaded " << snap_info.records << " records from snapshot " << snap_info.path;
    }
    state.last_frame_seq = covered_seq;

    // Step 4: Replay log segments in sequence order starting after the snapshot
    std::vector<Manifest::LogInfo> logs = mf_.get_logs();
    std::sort(logs.begin(), logs.end(),
              [](const Manifest::LogInfo& a, const Manifest::LogInfo& b) { return a.seq < b.seq; });

    for (size_t i = 0; i < logs.size(); ++i) {
        const auto& log_info = logs[i];
        std::string log_path = join(dir, log_info.path);
        if (!PlatformFS::exists(log_path)) {
            throw RecoveryInconsistency("batch-log segment referenced by manifest is missing", log_path);
        }

        ReplayResult result = BatchLog::replay(log_path, [&](BatchFrame&& frame) {
            if (frame.seq != state.last_frame_seq + 1) {
                throw RecoveryInconsistency("frame sequence gap: expected " +
                                            std::to_string(state.last_frame_seq + 1) + ", found " +
                                            std::to_string(frame.seq), log_path);
            }
            for (auto& op : frame.ops) {
                if (op.kind == op_kind::kPut) {
                    state.primary[op.key] = std::move(op.value);
                } else if (state.primary.erase(op.key) == 0) {
                    throw RecoveryInconsistency("committed frame " + std::to_string(frame.seq) +
                                                " removes a record missing from the data", log_path);
                }
            }
            state.checkpoint = std::move(frame.checkpoint);
            state.last_frame_seq = frame.seq;
        });

        state.frames_replayed += result.frames;
        uint64_t size = result.file_size;

        if (result.torn_tail) {
            if (i + 1 != logs.size()) {
                throw RecoveryInconsistency("corrupt frame in a sealed batch-log segment", log_path);
            }
            warning() << "discarding torn tail of " << log_path << " at offset "
                      << result.last_good_offset << " (" << (result.file_size - result.last_good_offset)
                      << " bytes)";
            FSResult r = PlatformFS::truncate(log_path, result.last_good_offset);
            if (!r.ok) {
                throw StorageIOError("failed to truncate torn batch-log tail", log_path, r.err);
            }
            size = result.last_good_offset;
        }

        if (i + 1 == logs.size()) {
            state.active_log = log_info;
            state.active_log_size = size;
        }
    }

    METRIC_COUNTER_INC(recoveries);
    METRIC_COUNTER_ADD(recovery_frames_replayed, state.frames_replayed);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    info() << "Recovered " << dir << ": " << state.primary.size() << " records, "
           << state.frames_replayed << " frames replayed, checkpoint "
           << (state.checkpoint ? state.checkpoint->to_string() : std::string("<none>"))
           << " in " << elapsed << "ms";
    return state;
}

} // namespace persist
} // namespace dfstate
