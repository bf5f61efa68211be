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
#include <string>
#include <utility>
#include <vector>

namespace dfstate {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        // Thin POSIX file layer for the batch log, snapshots and manifest.
        class PlatformFS {
        public:
            // Append handle: O_WRONLY|O_CREAT, positioned at end of file
            static FSResult open_append(const std::string& path, int* out_fd, uint64_t* out_size);
            static FSResult write_all(int fd, const void* data, size_t len);
            static FSResult flush_file(int fd);
            static FSResult close_file(int fd);

            static FSResult read_file(const std::string& path, std::string* out);

            // temp file + fsync + atomic_replace
            static FSResult write_file_durable(const std::string& path, const std::string& data);

            static FSResult fsync_directory(const std::string& dir_path);
            static FSResult atomic_replace(const std::string& tmp, const std::string& final);

            static std::pair<FSResult, size_t> file_size(const std::string& path);
            static bool exists(const std::string& path);
            static FSResult ensure_directory(const std::string& path);
            static FSResult truncate(const std::string& path, size_t size);
            static FSResult remove_file(const std::string& path);
            static FSResult remove_all(const std::string& path);
            static std::pair<FSResult, std::vector<std::string>> list_directory(const std::string& path);
        };

    }
} // namespace dfstate::persist
