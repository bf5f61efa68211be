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
#include "persistence/durability_policy.h"
#include <cstdint>
#include <memory>
#include <string>

namespace dfstate {

class LogManager;

/**
 * Process-wide store settings.
 *
 * Sources, lowest precedence first: built-in defaults, a JSON file, then the
 * environment (DFSTATE_MEMORY_BUDGET, DFSTATE_EVICTION_INTERVAL_MS,
 * DFSTATE_LOG_LEVEL).
 */
struct StoreConfig {
    // Eviction
    uint64_t memory_limit_bytes   = 0;             // 0 = unlimited
    uint64_t eviction_interval_ms = 1000;
    size_t eviction_batch_keys    = 256;
    std::string eviction_policy   = "largest_node";  // or "oldest_key"

    // Logging; empty leaves the current level / sink alone
    std::string log_level;
    std::string log_dir;

    // Defaults for persistent nodes
    bool sync_on_commit       = true;
    size_t wal_rotate_bytes   = persist::batch_log::kRotateSize;
    bool verify_on_open       = false;

    /**
     * Defaults overridden by the environment.
     */
    static StoreConfig defaults();

    /**
     * Defaults, then the JSON file at path, then the environment.
     * Throws StorageIOError when the file can't be read and
     * std::invalid_argument when it doesn't parse or holds bad values.
     */
    static StoreConfig load_file(const std::string& path);

    // Overlay the members present in a JSON object
    void merge_json(const std::string& json);
    void apply_env();

    // Throws std::invalid_argument
    void validate() const;

    // Set the log level from log_level (when given)
    void apply_logging() const;

    /**
     * apply_logging(), then redirect the log sink to log_dir when one is set.
     * @return the manager owning the file sink, or nullptr when logging stays on stderr
     */
    std::unique_ptr<LogManager> start_logging() const;

    persist::PersistenceParameters persistence(const std::string& db_dir, const std::string& db_name,
                                               persist::DurabilityMode mode =
                                                   persist::DurabilityMode::Permanent) const;

    bool operator==(const StoreConfig& o) const;
    bool operator!=(const StoreConfig& o) const { return !(*this == o); }
};

/**
 * Parse a byte count with an optional KB, MB or GB suffix (either case).
 * Throws std::invalid_argument.
 */
uint64_t parse_byte_size(const std::string& text);

} // namespace dfstate
