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
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../src/key.h"
#include "../src/partial_tracker.h"

using namespace dfstate;

namespace {
    std::string k(int v) { return KeyCodec::encode({Value(v)}); }

    EncodedRange closed(int lo, int hi) {
        return KeyRange::between({Value(lo)}, {Value(hi)}).encode();
    }
}

class PartialTrackerTest : public ::testing::Test {
protected:
    PartialTracker hashed_{false};
    PartialTracker ordered_{true};
};

TEST_F(PartialTrackerTest, KeysStartAsHoles) {
    EXPECT_FALSE(hashed_.is_filled(k(1)));
    hashed_.mark_filled(k(1));
    EXPECT_TRUE(hashed_.is_filled(k(1)));
    EXPECT_FALSE(hashed_.is_filled(k(2)));
    hashed_.mark_hole(k(1));
    EXPECT_FALSE(hashed_.is_filled(k(1)));
    EXPECT_EQ(hashed_.filled_key_count(), 0u);
}

TEST_F(PartialTrackerTest, OnlyFirstMissRequestsReplay) {
    EXPECT_TRUE(hashed_.request_replay(k(1)));
    EXPECT_FALSE(hashed_.request_replay(k(1)));
    EXPECT_TRUE(hashed_.replay_in_flight(k(1)));
    EXPECT_TRUE(hashed_.request_replay(k(2)));

    hashed_.mark_filled(k(1));
    EXPECT_FALSE(hashed_.replay_in_flight(k(1)));

    // Evicted again: a new miss asks again
    hashed_.mark_hole(k(1));
    EXPECT_TRUE(hashed_.request_replay(k(1)));

    // An upstream invalidation also clears the in-flight flag
    hashed_.mark_hole(k(2));
    EXPECT_TRUE(hashed_.request_replay(k(2)));
}

TEST_F(PartialTrackerTest, RangeFillsRequireOrderedIndex) {
    EXPECT_THROW(hashed_.mark_filled_range(closed(1, 5)), std::invalid_argument);
    EXPECT_THROW(hashed_.mark_hole_range(closed(1, 5)), std::invalid_argument);
}

TEST_F(PartialTrackerTest, FilledRangeCoversItsKeys) {
    ordered_.mark_filled_range(closed(10, 20));
    EXPECT_TRUE(ordered_.is_filled(k(10)));
    EXPECT_TRUE(ordered_.is_filled(k(15)));
    EXPECT_TRUE(ordered_.is_filled(k(20)));
    EXPECT_FALSE(ordered_.is_filled(k(21)));
    EXPECT_TRUE(ordered_.missing_ranges(closed(12, 18)).empty());
}

TEST_F(PartialTrackerTest, MissingRangesReportExactHoles) {
    ordered_.mark_filled_range(closed(10, 20));
    ordered_.mark_filled_range(closed(30, 40));

    auto missing = ordered_.missing_ranges(closed(15, 35));
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_FALSE(missing[0].contains(k(20)));
    EXPECT_TRUE(missing[0].contains(k(21)));
    EXPECT_TRUE(missing[0].contains(k(29)));
    EXPECT_FALSE(missing[0].contains(k(30)));

    missing = ordered_.missing_ranges(KeyRange::all().encode());
    EXPECT_EQ(missing.size(), 3u);

    // Point ranges honour point fills too
    ordered_.mark_filled(k(50));
    EXPECT_TRUE(ordered_.missing_ranges(EncodedRange::point(k(50))).empty());
    EXPECT_EQ(ordered_.missing_ranges(EncodedRange::point(k(51))).size(), 1u);
}

TEST_F(PartialTrackerTest, AdjacentRangesMerge) {
    ordered_.mark_filled_range(closed(1, 5));
    ordered_.mark_filled_range(KeyRange{Bound::excluded({Value(5)}), Bound::included({Value(9)})}.encode());
    EXPECT_EQ(ordered_.filled_range_count(), 1u);
    ordered_.mark_filled_range(closed(3, 7));
    EXPECT_EQ(ordered_.filled_range_count(), 1u);
    ordered_.mark_filled_range(closed(20, 30));
    EXPECT_EQ(ordered_.filled_range_count(), 2u);
}

TEST_F(PartialTrackerTest, EvictingAKeySplitsItsRange) {
    ordered_.mark_filled_range(closed(1, 10));
    ordered_.mark_hole(k(5));
    EXPECT_FALSE(ordered_.is_filled(k(5)));
    EXPECT_TRUE(ordered_.is_filled(k(4)));
    EXPECT_TRUE(ordered_.is_filled(k(6)));
    EXPECT_EQ(ordered_.filled_range_count(), 2u);

    auto missing = ordered_.missing_ranges(closed(1, 10));
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_TRUE(missing[0].contains(k(5)));
    EXPECT_FALSE(missing[0].contains(k(4)));
    EXPECT_FALSE(missing[0].contains(k(6)));
}

TEST_F(PartialTrackerTest, HoleRangeDropsPointsAndRanges) {
    ordered_.mark_filled(k(3));
    ordered_.mark_filled(k(50));
    ordered_.mark_filled_range(closed(5, 15));
    ordered_.mark_hole_range(closed(0, 10));

    EXPECT_FALSE(ordered_.is_filled(k(3)));
    EXPECT_FALSE(ordered_.is_filled(k(7)));
    EXPECT_TRUE(ordered_.is_filled(k(11)));
    EXPECT_TRUE(ordered_.is_filled(k(50)));
}

TEST_F(PartialTrackerTest, RangeReplayRequestedOnce) {
    EXPECT_TRUE(ordered_.request_replay_range(closed(1, 5)));
    EXPECT_FALSE(ordered_.request_replay_range(closed(1, 5)));
    ordered_.mark_filled_range(closed(1, 5));
    EXPECT_TRUE(ordered_.request_replay_range(closed(1, 5)));
}

TEST_F(PartialTrackerTest, LruOrderFollowsTouches) {
    hashed_.mark_filled(k(1));
    hashed_.mark_filled(k(2));
    hashed_.mark_filled(k(3));
    hashed_.touch(k(1));

    auto keys = hashed_.lru_keys(10);
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], k(2));
    EXPECT_EQ(keys[1], k(3));
    EXPECT_EQ(keys[2], k(1));

    EXPECT_EQ(hashed_.lru_keys(1).size(), 1u);

    uint64_t before = hashed_.oldest_tick();
    hashed_.mark_hole(k(2));
    EXPECT_GT(hashed_.oldest_tick(), before);
    EXPECT_EQ(hashed_.lru_keys(10).size(), 2u);
}

TEST_F(PartialTrackerTest, EmptyTrackerHasNoOldestKey) {
    EXPECT_EQ(hashed_.oldest_tick(), std::numeric_limits<uint64_t>::max());
    EXPECT_TRUE(hashed_.lru_keys(5).empty());
}

TEST_F(PartialTrackerTest, ClearForgetsEverything) {
    ordered_.mark_filled(k(1));
    ordered_.mark_filled_range(closed(5, 9));
    ordered_.request_replay(k(2));
    ordered_.clear();
    EXPECT_FALSE(ordered_.is_filled(k(1)));
    EXPECT_FALSE(ordered_.is_filled(k(6)));
    EXPECT_FALSE(ordered_.replay_in_flight(k(2)));
    EXPECT_EQ(ordered_.filled_range_count(), 0u);
}

TEST_F(PartialTrackerTest, ConcurrentTouchesAndReplayRequests) {
    for (int i = 0; i < 100; ++i) hashed_.mark_filled(k(i));

    std::atomic<int> granted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 100; ++i) {
                hashed_.touch(k(i));
                if (hashed_.request_replay(k(1000))) granted++;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(granted.load(), 1);
    EXPECT_EQ(hashed_.lru_keys(1000).size(), 100u);
}
