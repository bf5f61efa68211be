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

#include "value.h"
#include "row.h"
#include <string>
#include <vector>

namespace dfstate {

    // Ordered tuple of cells drawn from a row by an index's column list.
    using Key = std::vector<Value>;

    /**
     * Order-preserving, self-delimiting key encoding.
     *
     * Each cell is a tag byte followed by its payload:
     *   None          0x01
     *   Int           0x02 + 8 bytes big-endian, sign bit flipped
     *   UnsignedInt   0x03 + 8 bytes big-endian
     *   Double        0x04 + 8 bytes big-endian of the ordered IEEE image
     *   Text          0x05 + bytes, 0x00 escaped as 0x00 0xFF, terminated 0x00 0x01
     *   ByteArray     0x06 + same escaping and terminator as Text
     *
     * memcmp order of two encodings equals Key order, and no encoding is a
     * proper prefix of a different key's encoding.
     */
    class KeyCodec {
    public:
        static std::string encode(const Key& key);
        static void encode_value(std::string& out, const Value& v);

        // Encode the projection of row onto columns without materializing a Key
        static std::string encode_columns(const Row& row, const std::vector<size_t>& columns);

        // Throws std::invalid_argument on malformed input
        static Key decode(const std::string& bytes);

        // Decodes one cell starting at pos; advances pos past it
        static Value decode_value(const std::string& bytes, size_t& pos);
    };

    /**
     * One end of a key range.
     */
    struct Bound {
        enum class Kind : uint8_t { Unbounded, Included, Excluded };

        Kind kind = Kind::Unbounded;
        Key key;

        static Bound unbounded() { return Bound{}; }
        static Bound included(Key k) { return Bound{Kind::Included, std::move(k)}; }
        static Bound excluded(Key k) { return Bound{Kind::Excluded, std::move(k)}; }
    };

    // Bound over encoded key bytes. Compared bytewise.
    struct EncodedBound {
        Bound::Kind kind = Bound::Kind::Unbounded;
        std::string bytes;

        static EncodedBound unbounded() { return EncodedBound{}; }
        static EncodedBound included(std::string b) { return EncodedBound{Bound::Kind::Included, std::move(b)}; }
        static EncodedBound excluded(std::string b) { return EncodedBound{Bound::Kind::Excluded, std::move(b)}; }

        bool is_unbounded() const { return kind == Bound::Kind::Unbounded; }
        bool operator==(const EncodedBound& o) const {
            return kind == o.kind && (kind == Bound::Kind::Unbounded || bytes == o.bytes);
        }
    };

    struct EncodedRange {
        EncodedBound lower;
        EncodedBound upper;

        static EncodedRange all() { return EncodedRange{}; }
        static EncodedRange point(const std::string& k) {
            return EncodedRange{EncodedBound::included(k), EncodedBound::included(k)};
        }

        bool contains(const std::string& key) const;
        bool above_lower(const std::string& key) const;
        bool below_upper(const std::string& key) const;

        // True when no key can satisfy both bounds
        bool is_empty() const;

        bool operator==(const EncodedRange& o) const { return lower == o.lower && upper == o.upper; }
    };

    std::ostream& operator<<(std::ostream& os, const EncodedRange& r);

    /**
     * A range of keys on an ordered index, bounded on each side by
     * Unbounded, Included(key) or Excluded(key).
     */
    struct KeyRange {
        Bound lower;
        Bound upper;

        static KeyRange all() { return KeyRange{}; }
        static KeyRange point(Key k) { return KeyRange{Bound::included(k), Bound::included(k)}; }
        // Inclusive on both ends
        static KeyRange between(Key lo, Key hi) {
            return KeyRange{Bound::included(std::move(lo)), Bound::included(std::move(hi))};
        }

        EncodedRange encode() const;
    };

    // Lower bound comparison: is a's start at or before b's start
    bool lower_le(const EncodedBound& a, const EncodedBound& b);
    // Upper bound comparison: is a's end at or before b's end
    bool upper_le(const EncodedBound& a, const EncodedBound& b);
    // Do ranges ending at upper and starting at lower overlap or touch without a gap
    bool touches(const EncodedBound& upper, const EncodedBound& lower);

} // namespace dfstate
