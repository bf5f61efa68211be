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
#include <vector>
#include "manifest.h"
#include "../index.h"
#include "../replication_offset.h"

namespace dfstate {
    namespace persist {

        // Primary namespace and bookkeeping rebuilt from disk
        struct RecoveredState {
            bool fresh = true;                              // no manifest existed
            std::map<std::string, std::string> primary;     // record key -> row bytes
            std::optional<ReplicationOffset> checkpoint;
            uint64_t last_frame_seq = 0;
            uint64_t frames_replayed = 0;
            Manifest::LogInfo active_log;                   // segment to keep appending to
            uint64_t active_log_size = 0;                   // bytes after torn-tail truncation
        };

        class Recovery {
        public:
            Recovery(Manifest& mf, size_t arity, const std::vector<Index>& indices)
                : mf_(mf), arity_(arity), indices_(indices) {}

            /**
             * Load manifest, verify schema, load snapshot, replay batch-log
             * segments in order and truncate a torn tail. Removes files left by an
             * interrupted compaction. Throws RecoveryInconsistency.
             */
            RecoveredState cold_start();

        private:
            void verify_schema() const;
            void remove_orphans() const;

            Manifest& mf_;
            size_t arity_;
            const std::vector<Index>& indices_;
        };

    } // namespace persist
} // namespace dfstate
