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

/*
 * Common helpers for durable-node tests: temp directories and crash simulation
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <random>
#include <string>
#include <vector>
#include <unistd.h>

namespace dfstate::persist::test {

// Create a fresh temporary directory for one test
inline std::string create_temp_dir(const std::string& prefix) {
    std::filesystem::path temp_path = std::filesystem::temp_directory_path();

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(10000, 99999);

    std::string dir_name = prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(dis(gen));
    std::filesystem::path test_dir = temp_path / dir_name;

    std::filesystem::remove_all(test_dir);
    std::filesystem::create_directories(test_dir);
    return test_dir.string();
}

// Overwrite len bytes at offset with 0xFF
inline void corrupt_file(const std::string& path, size_t offset, size_t len) {
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) return;

    file.seekp(offset);
    std::vector<char> garbage(len, static_cast<char>(0xFF));
    file.write(garbage.data(), len);
}

// Truncate file to simulate torn write
inline void truncate_file(const std::string& path, size_t new_size) {
    std::filesystem::resize_file(path, new_size);
}

inline void append_bytes(const std::string& path, const std::string& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::app);
    file.write(bytes.data(), bytes.size());
}

inline uint64_t file_size(const std::string& path) {
    return std::filesystem::file_size(path);
}

// Names of directory entries starting with prefix, sorted
inline std::vector<std::string> list_files(const std::string& dir, const std::string& prefix) {
    std::vector<std::string> out;
    for (const auto& e : std::filesystem::directory_iterator(dir)) {
        std::string name = e.path().filename().string();
        if (name.rfind(prefix, 0) == 0) out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

inline void write_text(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << text;
}

} // namespace dfstate::persist::test
