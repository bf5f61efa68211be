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

#include <gtest/gtest.h>
#include <map>
#include <thread>
#include <vector>
#include "../src/metrics.h"

using namespace dfstate;

class MetricsTest : public ::testing::Test {
};

TEST_F(MetricsTest, CounterBasics) {
    Counter counter("test_counter");
    EXPECT_EQ(counter.value(), 0u);
    EXPECT_EQ(counter.name(), "test_counter");

    counter.increment();
    counter.increment(10);
    EXPECT_EQ(counter.value(), 11u);

    counter.reset();
    EXPECT_EQ(counter.value(), 0u);
}

TEST_F(MetricsTest, GaugeBasics) {
    Gauge gauge("test_gauge");
    EXPECT_EQ(gauge.value(), 0);

    gauge.increment(50);
    EXPECT_EQ(gauge.value(), 50);
    gauge.decrement(60);
    EXPECT_EQ(gauge.value(), -10);

    gauge.reset();
    EXPECT_EQ(gauge.value(), 0);
}

TEST_F(MetricsTest, CounterConcurrency) {
    Counter counter("concurrent_counter");
    const int num_threads = 8;
    const int increments_per_thread = 10000;

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&counter]() {
            for (int j = 0; j < increments_per_thread; j++) {
                counter.increment();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(counter.value(), static_cast<uint64_t>(num_threads * increments_per_thread));
}

TEST_F(MetricsTest, GaugeConcurrency) {
    Gauge gauge("concurrent_gauge");
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&gauge, i]() {
            for (int j = 0; j < 10000; j++) {
                if (i % 2 == 0) gauge.increment(); else gauge.decrement();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(gauge.value(), 0);
}

TEST_F(MetricsTest, HistogramStats) {
    Histogram h("latency");
    EXPECT_EQ(h.get_stats().count, 0u);

    for (uint64_t v = 1; v <= 100; ++v) {
        h.record(v);
    }
    Histogram::Stats s = h.get_stats();
    EXPECT_EQ(s.count, 100u);
    EXPECT_EQ(s.sum, 5050u);
    EXPECT_EQ(s.min, 1u);
    EXPECT_EQ(s.max, 100u);
    EXPECT_DOUBLE_EQ(s.mean, 50.5);
    EXPECT_EQ(s.p50, 50u);
    EXPECT_EQ(s.p99, 99u);

    h.reset();
    EXPECT_EQ(h.get_stats().count, 0u);
}

TEST_F(MetricsTest, HistogramKeepsRecentSamples) {
    Histogram h("ring");
    for (size_t i = 0; i < Histogram::kMaxSamples; ++i) {
        h.record(1);
    }
    for (size_t i = 0; i < Histogram::kMaxSamples; ++i) {
        h.record(1000);
    }
    Histogram::Stats s = h.get_stats();
    // Totals cover everything; percentiles only the newest window
    EXPECT_EQ(s.count, 2 * Histogram::kMaxSamples);
    EXPECT_EQ(s.min, 1u);
    EXPECT_EQ(s.p50, 1000u);
}

TEST_F(MetricsTest, StopwatchMeasuresMicroseconds) {
    Stopwatch watch;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    EXPECT_GE(watch.elapsed_us(), 2000u);
}

TEST_F(MetricsTest, CollectorExportsStoreMetrics) {
    metrics::initialize();
    metrics::initialize();
    metrics::lookup_hits.increment(3);

    std::map<std::string, std::pair<MetricType, std::string>> seen;
    MetricsCollector::instance().export_metrics(
        [&](const std::string& name, MetricType type, const std::string& value) {
            EXPECT_EQ(seen.count(name), 0u) << name << " exported twice";
            seen[name] = {type, value};
        });

    ASSERT_EQ(seen.count("dfstate.lookup_hits"), 1u);
    EXPECT_EQ(seen["dfstate.lookup_hits"].first, MetricType::Counter);
    EXPECT_EQ(seen["dfstate.lookup_hits"].second, std::to_string(metrics::lookup_hits.value()));
    EXPECT_EQ(seen["dfstate.bytes_resident"].first, MetricType::Gauge);
    EXPECT_EQ(seen["dfstate.commit_latency_us"].first, MetricType::Histogram);
    EXPECT_EQ(seen.size(), 14u);

    MetricsCollector::instance().reset_all();
    EXPECT_EQ(metrics::lookup_hits.value(), 0u);
    EXPECT_STREQ(to_string(MetricType::Histogram), "histogram");
}
