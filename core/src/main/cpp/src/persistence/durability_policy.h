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
#include "config.h"
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace dfstate {
namespace persist {

enum class DurabilityMode {
    DeleteOnExit,   // directory removed when the node closes
    Permanent       // directory kept for recovery
};

/**
 * Per-node persistence settings. A node constructed without these is
 * memory-only.
 */
struct PersistenceParameters {
    DurabilityMode mode = DurabilityMode::Permanent;
    std::string db_dir;
    std::string db_name;

    // fdatasync every committed frame before it becomes visible
    bool sync_on_commit = true;

    // Active log size that triggers compaction into a snapshot
    size_t wal_rotate_bytes = batch_log::kRotateSize;

    // Cross-check rebuilt secondary namespaces against the primary on open
    bool verify_on_open = false;

    // <db_dir>/<db_name>
    std::string node_dir() const {
        return (std::filesystem::path(db_dir) / db_name).string();
    }
};

// Helper to get a named durability mode ("permanent", "delete_on_exit")
inline DurabilityMode durability_mode_from_string(const std::string& name) {
    if (name == "delete_on_exit") {
        return DurabilityMode::DeleteOnExit;
    } else if (name == "permanent" || name.empty()) {
        return DurabilityMode::Permanent;
    }
    throw std::invalid_argument("unknown durability mode: " + name);
}

inline const char* to_string(DurabilityMode mode) {
    return mode == DurabilityMode::DeleteOnExit ? "delete_on_exit" : "permanent";
}

} // namespace persist
} // namespace dfstate
