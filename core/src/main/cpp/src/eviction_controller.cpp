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

#include "eviction_controller.h"
#include "errors.h"
#include "metrics.h"
#include "state_handle.h"
#include "util/log.h"
#include <algorithm>
#include <stdexcept>

namespace dfstate {

    EvictionController::EvictionController(const StoreConfig& config)
        : config_(config), policy_(make_eviction_policy(config.eviction_policy)) {
        metrics::initialize();
    }

    EvictionController::~EvictionController() {
        stop();
    }

    void EvictionController::register_handle(const std::shared_ptr<StateHandle>& handle) {
        if (!handle) {
            throw std::invalid_argument("null state handle");
        }
        std::lock_guard<std::mutex> lock(mu_);
        handles_.push_back(handle);
    }

    size_t EvictionController::handle_count() const {
        return live_handles().size();
    }

    std::vector<std::shared_ptr<StateHandle>> EvictionController::live_handles() const {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<std::shared_ptr<StateHandle>> out;
        out.reserve(handles_.size());
        auto it = handles_.begin();
        while (it != handles_.end()) {
            if (auto h = it->lock()) {
                out.push_back(std::move(h));
                ++it;
            } else {
                it = handles_.erase(it);
            }
        }
        return out;
    }

    void EvictionController::set_policy(std::unique_ptr<EvictionPolicy> policy) {
        if (!policy) {
            throw std::invalid_argument("null eviction policy");
        }
        std::lock_guard<std::mutex> lock(mu_);
        config_.eviction_policy = policy->name();
        policy_ = std::move(policy);
    }

    std::string EvictionController::policy_name() const {
        std::lock_guard<std::mutex> lock(mu_);
        return policy_->name();
    }

    void EvictionController::set_notification_channel(std::shared_ptr<NotificationChannel> channel) {
        std::lock_guard<std::mutex> lock(mu_);
        if (running_.load() && channel_) {
            channel_->close();
        }
        channel_ = std::move(channel);
        if (running_.load() && channel_) {
            channel_->open();
        }
    }

    void EvictionController::set_memory_limit(uint64_t bytes) {
        std::lock_guard<std::mutex> lock(mu_);
        config_.memory_limit_bytes = bytes;
    }

    uint64_t EvictionController::memory_limit() const {
        std::lock_guard<std::mutex> lock(mu_);
        return config_.memory_limit_bytes;
    }

    void EvictionController::apply_config(const StoreConfig& config) {
        config.validate();
        auto policy = make_eviction_policy(config.eviction_policy);
        {
            std::lock_guard<std::mutex> lock(mu_);
            config_ = config;
            policy_ = std::move(policy);
        }
        config.apply_logging();
        cv_.notify_all();
        info() << "eviction config applied: budget " << config.memory_limit_bytes
               << " bytes, interval " << config.eviction_interval_ms << "ms, batch "
               << config.eviction_batch_keys << " keys, policy " << config.eviction_policy;
    }

    StoreConfig EvictionController::config() const {
        std::lock_guard<std::mutex> lock(mu_);
        return config_;
    }

    bool EvictionController::poll_notifications() {
        std::shared_ptr<NotificationChannel> channel;
        {
            std::lock_guard<std::mutex> lock(mu_);
            channel = channel_;
        }
        if (!channel) {
            return false;
        }
        std::optional<StoreConfig> next = channel->poll();
        if (!next) {
            return false;
        }
        try {
            apply_config(*next);
        } catch (const std::invalid_argument& e) {
            error() << "rejected new store config: " << e.what();
            return false;
        }
        return true;
    }

    int64_t EvictionController::total_bytes() const {
        int64_t total = 0;
        for (const auto& h : live_handles()) {
            total += h->deep_size_of();
        }
        return total;
    }

    EvictionStats EvictionController::run_once() {
        std::lock_guard<std::mutex> pass(pass_mu_);

        uint64_t limit;
        size_t batch;
        std::shared_ptr<EvictionPolicy> policy;
        {
            std::lock_guard<std::mutex> lock(mu_);
            limit = config_.memory_limit_bytes;
            batch = config_.eviction_batch_keys;
            policy = policy_;
        }

        std::vector<std::shared_ptr<StateHandle>> nodes = live_handles();
        auto resident = [&nodes]() {
            int64_t total = 0;
            for (const auto& n : nodes) total += n->deep_size_of();
            return total;
        };

        EvictionStats stats;
        stats.resident_before = resident();
        stats.resident_after = stats.resident_before;
        if (limit == 0 || stats.resident_before <= static_cast<int64_t>(limit)) {
            return stats;
        }

        METRIC_COUNTER_INC(eviction_runs);
        while (stats.resident_after > static_cast<int64_t>(limit)) {
            std::shared_ptr<StateHandle> victim = policy->choose(nodes);
            if (!victim) {
                break;
            }
            RowTable::EvictionResult r = victim->evict_lru(batch);
            if (r.keys == 0) {
                // Nothing left in this node; stop offering it
                nodes.erase(std::remove(nodes.begin(), nodes.end(), victim), nodes.end());
                continue;
            }
            stats.keys += r.keys;
            stats.bytes += r.bytes;
            stats.resident_after = resident();
        }
        stats.resident_after = resident();
        stats.under_budget = stats.resident_after <= static_cast<int64_t>(limit);

        debug() << "eviction pass (" << policy->name() << "): " << stats.keys << " keys, "
                << stats.bytes << " bytes, resident " << stats.resident_before << " -> "
                << stats.resident_after << " of " << limit
                << (stats.under_budget ? "" : " (still over budget)");
        return stats;
    }

    void EvictionController::start() {
        uint64_t ms;
        {
            std::lock_guard<std::mutex> lock(mu_);
            ms = config_.eviction_interval_ms;
        }
        start(std::chrono::milliseconds(ms));
    }

    void EvictionController::start(std::chrono::milliseconds interval) {
        if (interval.count() <= 0) {
            throw std::invalid_argument("eviction interval must be positive");
        }
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) return;
        {
            std::lock_guard<std::mutex> lock(mu_);
            config_.eviction_interval_ms = static_cast<uint64_t>(interval.count());
            if (channel_) {
                channel_->open();
            }
        }
        th_ = std::thread([this]{ loop(); });
        debug() << "eviction controller started, interval " << interval.count() << "ms";
    }

    void EvictionController::stop() {
        if (!running_.exchange(false)) return;
        {
            std::lock_guard<std::mutex> lk(cv_mu_);
        }
        cv_.notify_all();
        if (th_.joinable()) {
            th_.join();
        }
        std::lock_guard<std::mutex> lock(mu_);
        if (channel_) {
            channel_->close();
        }
        debug() << "eviction controller stopped";
    }

    void EvictionController::loop() {
        while (running_.load()) {
            poll_notifications();
            try {
                run_once();
            } catch (const StateError& e) {
                error() << "eviction pass failed: " << e.what();
            }

            std::chrono::milliseconds interval;
            {
                std::lock_guard<std::mutex> lock(mu_);
                interval = std::chrono::milliseconds(config_.eviction_interval_ms);
            }
            std::unique_lock<std::mutex> lk(cv_mu_);
            cv_.wait_for(lk, interval, [&]{ return !running_.load(); });
        }
    }

} // namespace dfstate
