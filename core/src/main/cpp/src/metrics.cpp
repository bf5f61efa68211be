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

#include "metrics.h"
#include <algorithm>
#include <sstream>

namespace dfstate {

const char* to_string(MetricType t) {
    switch (t) {
        case MetricType::Counter:   return "counter";
        case MetricType::Gauge:     return "gauge";
        case MetricType::Histogram: return "histogram";
    }
    return "unknown";
}

// Histogram implementation
void Histogram::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
    next_ = 0;
    count_ = sum_ = min_ = max_ = 0;
}

void Histogram::record(uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.size() < kMaxSamples) {
        samples_.push_back(value);
    } else {
        samples_[next_] = value;
        next_ = (next_ + 1) % kMaxSamples;
    }
    min_ = count_ == 0 ? value : std::min(min_, value);
    max_ = std::max(max_, value);
    ++count_;
    sum_ += value;
}

Histogram::Stats Histogram::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats{};
    if (count_ == 0) {
        return stats;
    }

    std::vector<uint64_t> sorted = samples_;
    std::sort(sorted.begin(), sorted.end());

    stats.count = count_;
    stats.sum = sum_;
    stats.min = min_;
    stats.max = max_;
    stats.mean = static_cast<double>(sum_) / count_;

    auto percentile = [&sorted](double p) -> uint64_t {
        size_t idx = static_cast<size_t>(p * (sorted.size() - 1));
        return sorted[idx];
    };

    stats.p50 = percentile(0.50);
    stats.p95 = percentile(0.95);
    stats.p99 = percentile(0.99);

    return stats;
}


// MetricsCollector implementation
MetricsCollector& MetricsCollector::instance() {
    static MetricsCollector* g_instance = new MetricsCollector();
    return *g_instance;
}

void MetricsCollector::register_counter(Counter& counter) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(counters_.begin(), counters_.end(), &counter) == counters_.end()) {
        counters_.push_back(&counter);
    }
}

void MetricsCollector::register_gauge(Gauge& gauge) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(gauges_.begin(), gauges_.end(), &gauge) == gauges_.end()) {
        gauges_.push_back(&gauge);
    }
}

void MetricsCollector::register_histogram(Histogram& histogram) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(histograms_.begin(), histograms_.end(), &histogram) == histograms_.end()) {
        histograms_.push_back(&histogram);
    }
}

void MetricsCollector::export_metrics(ExportFunc func) const {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto* counter : counters_) {
        func(counter->name(), MetricType::Counter, std::to_string(counter->value()));
    }

    for (const auto* gauge : gauges_) {
        func(gauge->name(), MetricType::Gauge, std::to_string(gauge->value()));
    }

    for (const auto* histogram : histograms_) {
        auto stats = histogram->get_stats();
        std::ostringstream oss;
        oss << "count=" << stats.count
            << ",sum=" << stats.sum
            << ",mean=" << stats.mean
            << ",p50=" << stats.p50
            << ",p95=" << stats.p95
            << ",p99=" << stats.p99;
        func(histogram->name(), MetricType::Histogram, oss.str());
    }
}

void MetricsCollector::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto* counter : counters_) {
        counter->reset();
    }
    for (auto* gauge : gauges_) {
        gauge->reset();
    }
    for (auto* histogram : histograms_) {
        histogram->reset();
    }
}

namespace metrics {

    Counter lookup_hits("dfstate.lookup_hits");
    Counter lookup_misses("dfstate.lookup_misses");
    Counter replay_requests("dfstate.replay_requests");
    Counter disk_fills("dfstate.disk_fills");

    Gauge bytes_resident("dfstate.bytes_resident");
    Counter eviction_runs("dfstate.eviction_runs");
    Counter keys_evicted("dfstate.keys_evicted");
    Counter bytes_evicted("dfstate.bytes_evicted");

    Counter durable_commits("dfstate.durable_commits");
    Counter log_bytes_written("dfstate.log_bytes_written");
    Histogram commit_latency_us("dfstate.commit_latency_us");
    Counter compactions("dfstate.compactions");

    Counter recoveries("dfstate.recoveries");
    Counter recovery_frames_replayed("dfstate.recovery_frames_replayed");

    void initialize() {
        auto& c = MetricsCollector::instance();
        c.register_counter(lookup_hits);
        c.register_counter(lookup_misses);
        c.register_counter(replay_requests);
        c.register_counter(disk_fills);
        c.register_gauge(bytes_resident);
        c.register_counter(eviction_runs);
        c.register_counter(keys_evicted);
        c.register_counter(bytes_evicted);
        c.register_counter(durable_commits);
        c.register_counter(log_bytes_written);
        c.register_histogram(commit_latency_us);
        c.register_counter(compactions);
        c.register_counter(recoveries);
        c.register_counter(recovery_frames_replayed);
    }

} // namespace metrics

} // namespace dfstate
