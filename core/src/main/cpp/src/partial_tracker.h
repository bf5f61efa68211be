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

#include "key.h"
#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace dfstate {

/**
 * Sorted set of disjoint, non-adjacent ranges over encoded key bytes.
 */
class RangeSet {
public:
    void add(const EncodedRange& r);
    void subtract(const EncodedRange& r);
    bool contains(const std::string& key) const;

    // Parts of query not covered by the set, in key order
    std::vector<EncodedRange> uncovered(const EncodedRange& query) const;

    const std::vector<EncodedRange>& ranges() const { return ranges_; }
    bool empty() const { return ranges_.empty(); }
    void clear() { ranges_.clear(); }

    static bool intersects(const EncodedRange& a, const EncodedRange& b);
    // a minus b, appended to out
    static void difference(const EncodedRange& a, const EncodedRange& b, std::vector<EncodedRange>& out);

private:
    std::vector<EncodedRange> ranges_;
};

/**
 * Partial-state bookkeeping for one partial index.
 *
 * A key is wholly a hole or wholly filled. Filled keys come from point fills,
 * range fills (ordered indices only) or a unique-index insert. Misses put the
 * key in the replay-in-flight set so only the first Miss asks for a replay.
 * Hits and fills touch the key's recency; eviction takes the least recently
 * used keys first.
 *
 * All members lock an internal mutex, so readers holding only the node's
 * shared lock may touch recency and request replays.
 */
class PartialTracker {
public:
    explicit PartialTracker(bool ordered) : ordered_(ordered) {}

    PartialTracker(const PartialTracker&) = delete;
    PartialTracker& operator=(const PartialTracker&) = delete;

    bool is_filled(const std::string& key) const;

    void mark_filled(const std::string& key);
    void mark_filled_range(const EncodedRange& range);

    /**
     * Turn a key back into a hole. A key inside a filled range splits that
     * range around it.
     */
    void mark_hole(const std::string& key);
    void mark_hole_range(const EncodedRange& range);

    // Sub-ranges of range that are holes; empty when the whole range is filled
    std::vector<EncodedRange> missing_ranges(const EncodedRange& range) const;

    /**
     * Record a Miss on key.
     * @return true only for the first Miss while no replay of key is in flight
     */
    bool request_replay(const std::string& key);
    bool request_replay_range(const EncodedRange& range);
    bool replay_in_flight(const std::string& key) const;

    // @return true when key was not in the recency list before
    bool touch(const std::string& key);
    // Drop key from the recency list only
    void forget(const std::string& key);

    /**
     * @param max_keys Upper bound on returned keys
     * @return Least recently used filled keys, oldest first
     */
    std::vector<std::string> lru_keys(size_t max_keys) const;

    // Recency tick of the least recently used key, UINT64_MAX when none
    uint64_t oldest_tick() const;

    size_t filled_key_count() const;
    size_t filled_range_count() const;
    bool ordered() const { return ordered_; }

    void clear();

private:
    struct RecencyEntry {
        std::string key;
        uint64_t tick;
    };

    bool touch_locked(const std::string& key);
    void forget_locked(const std::string& key);
    bool is_filled_locked(const std::string& key) const;

    static std::atomic<uint64_t> clock_;

    const bool ordered_;
    mutable std::mutex mutex_;
    std::set<std::string> filled_keys_;
    RangeSet filled_ranges_;
    std::set<std::string> in_flight_keys_;
    std::vector<EncodedRange> in_flight_ranges_;

    // Front is most recently used
    std::list<RecencyEntry> recency_;
    std::unordered_map<std::string, std::list<RecencyEntry>::iterator> recency_index_;
};

} // namespace dfstate
