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
#include "../../src/util/endian.hpp"
#include <cmath>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

using namespace dfstate::util;

class EndianTest : public ::testing::Test {
protected:
    uint8_t buffer[16];

    void SetUp() override {
        std::memset(buffer, 0, sizeof(buffer));
    }
};

TEST_F(EndianTest, Store16BitLittleEndian) {
    store_le16(buffer, 0x1234);
    EXPECT_EQ(buffer[0], 0x34);
    EXPECT_EQ(buffer[1], 0x12);
    EXPECT_EQ(load_le16(buffer), 0x1234);
}

TEST_F(EndianTest, Store32BitLittleEndian) {
    store_le32(buffer, 0x12345678);
    EXPECT_EQ(buffer[0], 0x78);
    EXPECT_EQ(buffer[1], 0x56);
    EXPECT_EQ(buffer[2], 0x34);
    EXPECT_EQ(buffer[3], 0x12);
    EXPECT_EQ(load_le32(buffer), 0x12345678u);
}

TEST_F(EndianTest, Store64BitLittleEndian) {
    store_le64(buffer, 0x0102030405060708ULL);
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(buffer[i], 8 - i);
    }
    EXPECT_EQ(load_le64(buffer), 0x0102030405060708ULL);
}

TEST_F(EndianTest, Store64BitBigEndian) {
    store_be64(buffer, 0x0102030405060708ULL);
    for (int i = 0; i < 8; ++i) {
        EXPECT_EQ(buffer[i], i + 1);
    }
    EXPECT_EQ(load_be64(buffer), 0x0102030405060708ULL);
}

TEST_F(EndianTest, BigEndianSortsLikeIntegers) {
    // Record-key suffixes rely on bytewise order matching numeric order
    std::vector<uint64_t> values = {0, 1, 255, 256, 65535, 1ULL << 32, UINT64_MAX - 1, UINT64_MAX};
    for (size_t i = 1; i < values.size(); ++i) {
        std::string a, b;
        append_be64(a, values[i - 1]);
        append_be64(b, values[i]);
        EXPECT_LT(a, b) << values[i - 1] << " vs " << values[i];
    }
}

TEST_F(EndianTest, AppendHelpers) {
    std::string out;
    append_le32(out, 0xAABBCCDD);
    append_le64(out, 1);
    ASSERT_EQ(out.size(), 12u);
    EXPECT_EQ(static_cast<uint8_t>(out[0]), 0xDD);
    EXPECT_EQ(load_le32(reinterpret_cast<const uint8_t*>(out.data())), 0xAABBCCDDu);
    EXPECT_EQ(load_le64(reinterpret_cast<const uint8_t*>(out.data() + 4)), 1u);
}

TEST_F(EndianTest, UnalignedAccess) {
    uint8_t raw[20] = {};
    store_le64(raw + 3, 0xDEADBEEFCAFEBABEULL);
    EXPECT_EQ(load_le64(raw + 3), 0xDEADBEEFCAFEBABEULL);
    store_le32(raw + 1, 0x01020304);
    EXPECT_EQ(load_le32(raw + 1), 0x01020304u);
}

TEST_F(EndianTest, DoubleBits) {
    EXPECT_EQ(double_bits(1.0), 0x3FF0000000000000ULL);
    EXPECT_EQ(bits_double(0x3FF0000000000000ULL), 1.0);
    EXPECT_EQ(double_bits(-0.0), 0x8000000000000000ULL);
    EXPECT_TRUE(std::isinf(bits_double(double_bits(std::numeric_limits<double>::infinity()))));
}
