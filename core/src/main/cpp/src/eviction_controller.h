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

#include "config_watcher.h"
#include "eviction_policy.h"
#include "store_config.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace dfstate {

    class StateHandle;

    struct EvictionStats {
        size_t keys = 0;
        size_t bytes = 0;
        int64_t resident_before = 0;
        int64_t resident_after = 0;
        bool under_budget = true;
    };

    /**
     * Keeps the resident bytes of every registered node under a process-wide
     * budget. Each pass sums node sizes, asks the policy for a victim, evicts
     * a bounded batch of its least recently used partial keys and repeats
     * until under budget or out of candidates. Ending a pass over budget is not
     * an error.
     *
     * Handles are held weakly; a dropped node leaves the controller on the
     * next pass. Runs on its own thread between start() and stop(), or
     * synchronously through run_once().
     */
    class EvictionController {
    public:
        explicit EvictionController(const StoreConfig& config = StoreConfig::defaults());
        ~EvictionController();

        EvictionController(const EvictionController&) = delete;
        EvictionController& operator=(const EvictionController&) = delete;

        void register_handle(const std::shared_ptr<StateHandle>& handle);
        size_t handle_count() const;

        void set_policy(std::unique_ptr<EvictionPolicy> policy);
        std::string policy_name() const;

        // Polled by the background thread; opened on start(), closed on stop()
        void set_notification_channel(std::shared_ptr<NotificationChannel> channel);

        void set_memory_limit(uint64_t bytes);
        uint64_t memory_limit() const;

        // Apply budget, interval, batch size, policy and log level
        void apply_config(const StoreConfig& config);
        StoreConfig config() const;

        // Check the channel once; returns true when a new config was applied
        bool poll_notifications();

        int64_t total_bytes() const;

        EvictionStats run_once();

        void start();
        void start(std::chrono::milliseconds interval);
        void stop();
        bool running() const { return running_.load(); }

    private:
        void loop();
        std::vector<std::shared_ptr<StateHandle>> live_handles() const;

        mutable std::mutex mu_;
        StoreConfig config_;
        std::shared_ptr<EvictionPolicy> policy_;
        std::shared_ptr<NotificationChannel> channel_;
        mutable std::vector<std::weak_ptr<StateHandle>> handles_;

        std::mutex pass_mu_;    // one pass at a time

        std::atomic<bool> running_{false};
        std::thread th_;
        std::mutex cv_mu_;
        std::condition_variable cv_;
    };

} // namespace dfstate
