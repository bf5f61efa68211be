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

#include "partial_tracker.h"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace dfstate {

// ---------------------------------------------------------------------------
// RangeSet
// ---------------------------------------------------------------------------

static EncodedBound upper_before(const EncodedBound& lower) {
    // the upper bound that ends just before lower starts
    return lower.kind == Bound::Kind::Included
        ? EncodedBound::excluded(lower.bytes) : EncodedBound::included(lower.bytes);
}

static EncodedBound lower_after(const EncodedBound& upper) {
    return upper.kind == Bound::Kind::Included
        ? EncodedBound::excluded(upper.bytes) : EncodedBound::included(upper.bytes);
}

bool RangeSet::intersects(const EncodedRange& a, const EncodedRange& b) {
    EncodedRange overlap;
    overlap.lower = lower_le(a.lower, b.lower) ? b.lower : a.lower;
    overlap.upper = upper_le(a.upper, b.upper) ? a.upper : b.upper;
    return !overlap.is_empty();
}

void RangeSet::difference(const EncodedRange& a, const EncodedRange& b, std::vector<EncodedRange>& out) {
    if (!intersects(a, b)) {
        out.push_back(a);
        return;
    }
    if (!lower_le(b.lower, a.lower)) {
        EncodedRange left{a.lower, upper_before(b.lower)};
        if (!left.is_empty()) out.push_back(left);
    }
    if (!upper_le(a.upper, b.upper)) {
        EncodedRange right{lower_after(b.upper), a.upper};
        if (!right.is_empty()) out.push_back(right);
    }
}

void RangeSet::add(const EncodedRange& r) {
    if (r.is_empty()) return;

    EncodedRange merged = r;
    std::vector<EncodedRange> kept;
    kept.reserve(ranges_.size() + 1);
    for (const auto& s : ranges_) {
        // s and merged touch when neither ends strictly before the other starts
        bool s_first = lower_le(s.lower, merged.lower);
        bool joined = s_first ? touches(s.upper, merged.lower) : touches(merged.upper, s.lower);
        if (joined) {
            if (s_first) merged.lower = s.lower;
            if (!upper_le(s.upper, merged.upper)) merged.upper = s.upper;
        } else {
            kept.push_back(s);
        }
    }

    auto pos = std::find_if(kept.begin(), kept.end(), [&](const EncodedRange& s) {
        return !lower_le(s.lower, merged.lower);
    });
    kept.insert(pos, merged);
    ranges_.swap(kept);
}

void RangeSet::subtract(const EncodedRange& r) {
    if (r.is_empty()) return;
    std::vector<EncodedRange> out;
    out.reserve(ranges_.size() + 1);
    for (const auto& s : ranges_) {
        difference(s, r, out);
    }
    ranges_.swap(out);
}

bool RangeSet::contains(const std::string& key) const {
    for (const auto& s : ranges_) {
        if (s.contains(key)) return true;
    }
    return false;
}

std::vector<EncodedRange> RangeSet::uncovered(const EncodedRange& query) const {
    std::vector<EncodedRange> pieces;
    if (query.is_empty()) return pieces;
    pieces.push_back(query);
    for (const auto& s : ranges_) {
        std::vector<EncodedRange> next;
        for (const auto& p : pieces) {
            difference(p, s, next);
        }
        pieces.swap(next);
        if (pieces.empty()) break;
    }
    return pieces;
}

// ---------------------------------------------------------------------------
// PartialTracker
// ---------------------------------------------------------------------------

std::atomic<uint64_t> PartialTracker::clock_{0};

bool PartialTracker::is_filled_locked(const std::string& key) const {
    return filled_keys_.count(key) != 0 || filled_ranges_.contains(key);
}

bool PartialTracker::is_filled(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_filled_locked(key);
}

bool PartialTracker::touch_locked(const std::string& key) {
    uint64_t tick = clock_.fetch_add(1, std::memory_order_relaxed) + 1;
    auto it = recency_index_.find(key);
    if (it != recency_index_.end()) {
        it->second->tick = tick;
        recency_.splice(recency_.begin(), recency_, it->second);
        return false;
    }
    recency_.push_front(RecencyEntry{key, tick});
    recency_index_.emplace(key, recency_.begin());
    return true;
}

void PartialTracker::forget_locked(const std::string& key) {
    auto it = recency_index_.find(key);
    if (it != recency_index_.end()) {
        recency_.erase(it->second);
        recency_index_.erase(it);
    }
}

void PartialTracker::mark_filled(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    filled_keys_.insert(key);
    in_flight_keys_.erase(key);
    touch_locked(key);
}

void PartialTracker::mark_filled_range(const EncodedRange& range) {
    if (!ordered_) {
        throw std::invalid_argument("range fill on a hash index");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    filled_ranges_.add(range);
    in_flight_ranges_.erase(
        std::remove_if(in_flight_ranges_.begin(), in_flight_ranges_.end(),
                       [&](const EncodedRange& r) { return RangeSet::intersects(r, range); }),
        in_flight_ranges_.end());
    for (auto it = in_flight_keys_.begin(); it != in_flight_keys_.end();) {
        it = range.contains(*it) ? in_flight_keys_.erase(it) : std::next(it);
    }
}

void PartialTracker::mark_hole(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    filled_keys_.erase(key);
    if (ordered_ && filled_ranges_.contains(key)) {
        filled_ranges_.subtract(EncodedRange::point(key));
    }
    in_flight_keys_.erase(key);
    forget_locked(key);
}

void PartialTracker::mark_hole_range(const EncodedRange& range) {
    if (!ordered_) {
        throw std::invalid_argument("range invalidation on a hash index");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = filled_keys_.begin(); it != filled_keys_.end();) {
        it = range.contains(*it) ? filled_keys_.erase(it) : std::next(it);
    }
    filled_ranges_.subtract(range);
    for (auto it = in_flight_keys_.begin(); it != in_flight_keys_.end();) {
        it = range.contains(*it) ? in_flight_keys_.erase(it) : std::next(it);
    }
    in_flight_ranges_.erase(
        std::remove_if(in_flight_ranges_.begin(), in_flight_ranges_.end(),
                       [&](const EncodedRange& r) { return RangeSet::intersects(r, range); }),
        in_flight_ranges_.end());
    for (auto it = recency_.begin(); it != recency_.end();) {
        if (range.contains(it->key)) {
            recency_index_.erase(it->key);
            it = recency_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<EncodedRange> PartialTracker::missing_ranges(const EncodedRange& range) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (range.lower.kind == Bound::Kind::Included && range.upper.kind == Bound::Kind::Included &&
        range.lower.bytes == range.upper.bytes) {
        if (is_filled_locked(range.lower.bytes)) return {};
        return {range};
    }
    return filled_ranges_.uncovered(range);
}

bool PartialTracker::request_replay(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_keys_.insert(key).second;
}

bool PartialTracker::request_replay_range(const EncodedRange& range) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& r : in_flight_ranges_) {
        if (r == range) return false;
    }
    in_flight_ranges_.push_back(range);
    return true;
}

bool PartialTracker::replay_in_flight(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_keys_.count(key) != 0;
}

bool PartialTracker::touch(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return touch_locked(key);
}

void PartialTracker::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    forget_locked(key);
}

std::vector<std::string> PartialTracker::lru_keys(size_t max_keys) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(std::min(max_keys, recency_.size()));
    for (auto it = recency_.rbegin(); it != recency_.rend() && keys.size() < max_keys; ++it) {
        keys.push_back(it->key);
    }
    return keys;
}

uint64_t PartialTracker::oldest_tick() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recency_.empty() ? std::numeric_limits<uint64_t>::max() : recency_.back().tick;
}

size_t PartialTracker::filled_key_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filled_keys_.size();
}

size_t PartialTracker::filled_range_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filled_ranges_.ranges().size();
}

void PartialTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    filled_keys_.clear();
    filled_ranges_.clear();
    in_flight_keys_.clear();
    in_flight_ranges_.clear();
    recency_.clear();
    recency_index_.clear();
}

} // namespace dfstate
