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

#include "store_config.h"
#include <ctime>
#include <mutex>
#include <optional>
#include <string>

namespace dfstate {

    /**
     * Source of configuration changes polled by the eviction controller.
     * open() and close() follow the controller's start() and stop().
     */
    class NotificationChannel {
    public:
        virtual ~NotificationChannel() = default;

        virtual void open() = 0;
        virtual void close() = 0;

        /**
         * Non-blocking.
         * @return a new configuration when one arrived since the last poll
         */
        virtual std::optional<StoreConfig> poll() = 0;
    };

    /**
     * Channel fed by the embedding process (and tests) through publish().
     */
    class ManualNotificationChannel : public NotificationChannel {
    public:
        void open() override {}
        void close() override {}

        void publish(const StoreConfig& config) {
            std::lock_guard<std::mutex> lock(mu_);
            pending_ = config;
        }

        std::optional<StoreConfig> poll() override {
            std::lock_guard<std::mutex> lock(mu_);
            std::optional<StoreConfig> out;
            out.swap(pending_);
            return out;
        }

    private:
        std::mutex mu_;
        std::optional<StoreConfig> pending_;
    };

    /**
     * Watches a JSON config file. A change of modification time or contents
     * reparses it with the same precedence as StoreConfig::load_file. A file
     * that can't be read or parsed is logged and skipped until it changes again.
     */
    class ConfigFileWatcher : public NotificationChannel {
    public:
        explicit ConfigFileWatcher(std::string path) : path_(std::move(path)) {}

        void open() override;
        void close() override;
        std::optional<StoreConfig> poll() override;

        const std::string& path() const { return path_; }

    private:
        // false when the file is currently missing
        bool stat_file(std::time_t* mtime, std::string* contents) const;

        std::string path_;
        bool open_ = false;
        std::time_t last_mtime_ = 0;
        std::string last_contents_;
    };

} // namespace dfstate
