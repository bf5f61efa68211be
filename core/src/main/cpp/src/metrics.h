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
#include <string>
#include <functional>
#include <chrono>
#include <utility>
#include <atomic>
#include <mutex>
#include <vector>

namespace dfstate {

enum class MetricType {
    Counter,
    Gauge,
    Histogram
};

const char* to_string(MetricType t);

// Monotonically increasing count
class Counter {
public:
    explicit Counter(std::string name) : name_(std::move(name)), value_(0) {}

    const std::string& name() const { return name_; }
    void reset() { value_.store(0); }

    void increment(uint64_t delta = 1) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    uint64_t value() const {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::atomic<uint64_t> value_;
};

class Gauge {
public:
    explicit Gauge(std::string name) : name_(std::move(name)), value_(0) {}

    const std::string& name() const { return name_; }
    void reset() { value_.store(0); }

    void increment(int64_t delta = 1) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }

    void decrement(int64_t delta = 1) {
        value_.fetch_sub(delta, std::memory_order_relaxed);
    }

    int64_t value() const {
        return value_.load(std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::atomic<int64_t> value_;
};

// Percentiles come from a ring of the most recent kMaxSamples;
// count/sum/min/max cover every sample.
class Histogram {
public:
    static constexpr size_t kMaxSamples = 4096;

    explicit Histogram(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }
    void reset();

    void record(uint64_t value);

    struct Stats {
        uint64_t count;
        uint64_t sum;
        uint64_t min;
        uint64_t max;
        double mean;
        uint64_t p50;
        uint64_t p95;
        uint64_t p99;
    };

    Stats get_stats() const;

private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<uint64_t> samples_;
    size_t next_ = 0;
    uint64_t count_ = 0;
    uint64_t sum_ = 0;
    uint64_t min_ = 0;
    uint64_t max_ = 0;
};

class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}

    uint64_t elapsed_us() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Global metrics collector
class MetricsCollector {
public:
    static MetricsCollector& instance();

    void register_counter(Counter& counter);
    void register_gauge(Gauge& gauge);
    void register_histogram(Histogram& histogram);

    // Hands every registered metric to func; transport is the caller's concern
    using ExportFunc = std::function<void(const std::string& name,
                                          MetricType type,
                                          const std::string& value)>;
    void export_metrics(ExportFunc func) const;

    void reset_all();

private:
    MetricsCollector() = default;

    mutable std::mutex mutex_;
    std::vector<Counter*> counters_;
    std::vector<Gauge*> gauges_;
    std::vector<Histogram*> histograms_;
};

// Predefined store metrics
namespace metrics {

    // Lookups
    extern Counter lookup_hits;
    extern Counter lookup_misses;
    extern Counter replay_requests;
    extern Counter disk_fills;

    // Memory
    extern Gauge bytes_resident;
    extern Counter eviction_runs;
    extern Counter keys_evicted;
    extern Counter bytes_evicted;

    // Durability
    extern Counter durable_commits;
    extern Counter log_bytes_written;
    extern Histogram commit_latency_us;
    extern Counter compactions;

    // Recovery
    extern Counter recoveries;
    extern Counter recovery_frames_replayed;

    // Registers the predefined metrics with the collector (idempotent)
    void initialize();
}

// Convenience macros
#define METRIC_COUNTER_INC(name) dfstate::metrics::name.increment()
#define METRIC_COUNTER_ADD(name, delta) dfstate::metrics::name.increment(delta)
#define METRIC_GAUGE_ADD(name, delta) dfstate::metrics::name.increment(delta)
#define METRIC_GAUGE_SUB(name, delta) dfstate::metrics::name.decrement(delta)
#define METRIC_HISTOGRAM_RECORD(name, value) dfstate::metrics::name.record(value)

} // namespace dfstate
