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
#include <cstddef>

namespace dfstate {
namespace persist {

// Batch log configuration
namespace batch_log {
    constexpr uint32_t kFrameTypeBatch = 1;
    constexpr size_t kFrameHeaderSize = 16;
    constexpr size_t kRotateSize = 64 * 1024 * 1024;         // Compact at 64MB by default
    constexpr uint32_t kMaxPayloadSize = 1u << 30;            // Larger frames are treated as corrupt
}

// Snapshot configuration
namespace snapshot {
    constexpr char kMagic[8] = {'D','F','S','N','A','P','0','1'};
    constexpr uint32_t kVersion = 1;
}

// Manifest configuration
namespace manifest {
    constexpr uint32_t kVersion = 1;
}

// Op kinds inside a batch frame
namespace op_kind {
    constexpr uint8_t kPut = 1;
    constexpr uint8_t kDelete = 2;
}

// File naming configuration
namespace files {
    constexpr const char* kManifestFile = "manifest.json";
    constexpr const char* kSnapshotPrefix = "snapshot-";
    constexpr const char* kSnapshotExtension = ".snap";
    constexpr const char* kLogPrefix = "batch-";
    constexpr const char* kLogExtension = ".log";
    constexpr const char* kTempSuffix = ".tmp";
}

} // namespace persist
} // namespace dfstate
