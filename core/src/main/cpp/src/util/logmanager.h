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

#include "log.h"
#include <cstdio>
#include <stdexcept>
#include <string>

#include <boost/filesystem.hpp>

namespace dfstate {

    struct LogRotationConfig {
        size_t max_file_size = 64 * 1024 * 1024;  // rotate after 64MB
    };

    /**
     * Redirects the process log sink to <log_dir>/dfstate.log.
     * Rotation renames the live file to a timestamped name and reopens.
     */
    class LogManager {
    public:
        using RotationConfig = LogRotationConfig;

        explicit LogManager(const std::string& log_dir, RotationConfig rotation = RotationConfig())
            : _rotation(rotation), _file(nullptr) {
            boost::filesystem::path dir(log_dir);
            boost::system::error_code ec;
            boost::filesystem::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("can't create log directory [" + log_dir + "]: " + ec.message());
            }
            if (!boost::filesystem::is_directory(dir)) {
                throw std::runtime_error("log directory [" + log_dir + "] is not a directory");
            }
            _path = (dir / "dfstate.log").string();
            start();
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if (_file) {
                fclose(_file);
                _file = nullptr;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const std::string& path() const { return _path; }

        std::string terseCurrentTime() {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);
            char buf[32];
            strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &t);
            return buf;
        }

        /**
         * Rotate when the live file has grown past the configured size.
         * Returns true if a rotation happened.
         */
        bool rotateIfNeeded() {
            boost::system::error_code ec;
            auto size = boost::filesystem::file_size(_path, ec);
            if (ec || size < _rotation.max_file_size) {
                return false;
            }
            rotate();
            return true;
        }

        void rotate() {
            std::string rotated = _path + "." + terseCurrentTime();
            if (::rename(_path.c_str(), rotated.c_str()) != 0) {
                std::cerr << "can't rotate " << _path << ": " << errnoWithDescription() << std::endl;
                return;
            }
            FILE* old = _file;
            open();
            if (old) {
                fclose(old);
            }
        }

    private:
        void start() {
            bool exists = boost::filesystem::exists(_path);
            open();
            if (exists) {
                const std::string msg = "\n\n***** STATE STORE RESTARTED *****\n\n\n";
                fwrite(msg.data(), 1, msg.size(), _file);
                fflush(_file);
            }
        }

        void open() {
            FILE* f = fopen(_path.c_str(), "a");
            if (!f) {
                throw std::runtime_error("can't open [" + _path + "] for log file: " + errnoWithDescription());
            }
            Logger::setLogFile(f); // after this point no thread will be using the old file
            _file = f;
        }

        RotationConfig _rotation;
        std::string _path;
        FILE* _file;
    };
}
