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

#include "config_watcher.h"
#include "errors.h"
#include "persistence/platform_fs.h"
#include "util/log.h"
#include <stdexcept>

#include <boost/filesystem.hpp>

namespace dfstate {

    bool ConfigFileWatcher::stat_file(std::time_t* mtime, std::string* contents) const {
        boost::system::error_code ec;
        if (!boost::filesystem::exists(path_, ec) || ec) {
            return false;
        }
        *mtime = boost::filesystem::last_write_time(path_, ec);
        if (ec) {
            return false;
        }
        persist::FSResult r = persist::PlatformFS::read_file(path_, contents);
        return r.ok;
    }

    void ConfigFileWatcher::open() {
        if (!stat_file(&last_mtime_, &last_contents_)) {
            warning() << "config file " << path_ << " does not exist yet; watching for it";
            last_mtime_ = 0;
            last_contents_.clear();
        }
        open_ = true;
        debug() << "watching config file " << path_;
    }

    void ConfigFileWatcher::close() {
        open_ = false;
    }

    std::optional<StoreConfig> ConfigFileWatcher::poll() {
        if (!open_) {
            return std::nullopt;
        }
        std::time_t mtime = 0;
        std::string contents;
        if (!stat_file(&mtime, &contents)) {
            return std::nullopt;
        }
        if (mtime == last_mtime_ && contents == last_contents_) {
            return std::nullopt;
        }
        last_mtime_ = mtime;
        last_contents_ = contents;

        try {
            StoreConfig cfg;
            cfg.merge_json(contents);
            cfg.apply_env();
            cfg.validate();
            info() << "config file " << path_ << " changed";
            return cfg;
        } catch (const std::invalid_argument& e) {
            error() << "ignoring changed config file " << path_ << ": " << e.what();
            return std::nullopt;
        }
    }

} // namespace dfstate
