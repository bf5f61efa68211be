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
#include <gmock/gmock.h>
#include <filesystem>
#include <map>
#include <random>
#include <string>
#include "../../src/errors.h"
#include "../../src/metrics.h"
#include "../../src/persistence/durable_table.h"
#include "test_helpers.h"

using namespace dfstate;
using namespace dfstate::persist;
using testing::UnorderedElementsAre;

namespace {
    std::vector<Row> values(const Rows& rows) {
        std::vector<Row> out;
        for (const auto& r : rows) out.push_back(*r);
        return out;
    }

    std::string enc(const Key& k) { return KeyCodec::encode(k); }
}

class DurableTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = test::create_temp_dir("durable_table_test");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    PersistenceParameters params(const std::string& name = "node") const {
        PersistenceParameters p;
        p.db_dir = test_dir_;
        p.db_name = name;
        p.sync_on_commit = false;
        return p;
    }

    // (id, city, score): unique primary on id, non-unique btree on city
    static std::vector<Index> people() {
        return {Index(0, {0}, true), Index(1, {1}, false, Materialization::Full, IndexType::BTree)};
    }

    static ReplicationOffset at(uint64_t offset) {
        return ReplicationOffset{"binlog.000001", offset};
    }

    std::string test_dir_;
};

TEST_F(DurableTableTest, FreshDirectoryLayout) {
    DurableTable table(params(), 3, people());
    EXPECT_FALSE(table.recovered());
    EXPECT_EQ(table.row_count(), 0u);
    EXPECT_FALSE(table.last_checkpoint().has_value());
    EXPECT_TRUE(table.indices()[0].primary);

    EXPECT_TRUE(std::filesystem::exists(table.dir() + "/manifest.json"));
    EXPECT_EQ(test::list_files(table.dir(), "batch-"),
              std::vector<std::string>{"batch-00000000000000000001.log"});
}

TEST_F(DurableTableTest, ApplyAndLookup) {
    DurableTable table(params(), 3, people());
    table.apply_batch({Record::insert({1, "paris", 10}),
                       Record::insert({2, "oslo", 20}),
                       Record::insert({3, "paris", 30})}, at(100));

    EXPECT_THAT(values(table.lookup(0, enc({2}))), UnorderedElementsAre(Row{2, "oslo", 20}));
    EXPECT_THAT(values(table.lookup(1, enc({"paris"}))),
                UnorderedElementsAre(Row{1, "paris", 10}, Row{3, "paris", 30}));
    EXPECT_TRUE(table.lookup(0, enc({9})).empty());
    EXPECT_TRUE(table.contains_key(1, enc({"oslo"})));
    EXPECT_FALSE(table.contains_key(1, enc({"rome"})));
    EXPECT_EQ(table.last_frame_seq(), 1u);
    EXPECT_EQ(*table.last_checkpoint(), at(100));

    table.apply_batch({Record::remove({1, "paris", 10})}, at(200));
    EXPECT_THAT(values(table.lookup(1, enc({"paris"}))), UnorderedElementsAre(Row{3, "paris", 30}));
    EXPECT_EQ(table.row_count(), 2u);
    EXPECT_THROW(table.lookup(7, enc({1})), std::invalid_argument);
}

TEST_F(DurableTableTest, RangeLookupOnSecondary) {
    DurableTable table(params(), 3, people());
    table.apply_batch({Record::insert({1, "amsterdam", 1}),
                       Record::insert({2, "berlin", 2}),
                       Record::insert({3, "cairo", 3}),
                       Record::insert({4, "dakar", 4})}, at(1));

    EncodedRange r = KeyRange::between({"b"}, {"d"}).encode();
    EXPECT_THAT(values(table.range_lookup(1, r)),
                UnorderedElementsAre(Row{2, "berlin", 2}, Row{3, "cairo", 3}));
    EXPECT_EQ(table.range_lookup(1, EncodedRange::all()).size(), 4u);
    EXPECT_THROW(table.range_lookup(0, r), std::invalid_argument);
}

TEST_F(DurableTableTest, ConstraintViolationLeavesNoTrace) {
    DurableTable table(params(), 3, people());
    table.apply_batch({Record::insert({1, "paris", 10})}, at(10));
    uint64_t log_bytes = table.active_log_bytes();

    EXPECT_THROW(table.apply_batch({Record::insert({2, "rome", 1}),
                                    Record::insert({1, "lima", 2})}, at(20)),
                 ConstraintViolation);
    EXPECT_THROW(table.apply_batch({Record::insert({5, "rome", 1}),
                                    Record::remove({6, "nowhere", 0})}, at(20)),
                 ConstraintViolation);

    EXPECT_EQ(table.row_count(), 1u);
    EXPECT_TRUE(table.lookup(0, enc({2})).empty());
    EXPECT_FALSE(table.contains_key(1, enc({"rome"})));
    EXPECT_EQ(table.active_log_bytes(), log_bytes);
    EXPECT_EQ(*table.last_checkpoint(), at(10));
    EXPECT_EQ(table.last_frame_seq(), 1u);
    EXPECT_FALSE(table.poisoned());

    // Arity mismatch is a caller error
    EXPECT_THROW(table.apply_batch({Record::insert({1, "x"})}, at(30)), std::invalid_argument);
}

TEST_F(DurableTableTest, RemoveThenReinsertInOneBatch) {
    DurableTable table(params(), 3, people());
    table.apply_batch({Record::insert({1, "paris", 10})}, at(1));
    table.apply_batch({Record::remove({1, "paris", 10}), Record::insert({1, "paris", 11})}, at(2));
    EXPECT_THAT(values(table.lookup(0, enc({1}))), UnorderedElementsAre(Row{1, "paris", 11}));
}

TEST_F(DurableTableTest, ReopenRecoversCommittedState) {
    {
        DurableTable table(params(), 3, people());
        table.apply_batch({Record::insert({1, "paris", 10}), Record::insert({2, "oslo", 20})}, at(5));
        table.apply_batch({Record::remove({2, "oslo", 20})}, at(6));
    }
    DurableTable table(params(), 3, people());
    EXPECT_TRUE(table.recovered());
    EXPECT_EQ(table.row_count(), 1u);
    EXPECT_EQ(*table.last_checkpoint(), at(6));
    EXPECT_EQ(table.last_frame_seq(), 2u);
    EXPECT_THAT(values(table.lookup(1, enc({"paris"}))), UnorderedElementsAre(Row{1, "paris", 10}));

    // Appends continue the frame sequence
    table.apply_batch({Record::insert({3, "rome", 1})}, at(7));
    EXPECT_EQ(table.last_frame_seq(), 3u);
}

TEST_F(DurableTableTest, NonUniquePrimaryKeepsDuplicates) {
    std::vector<Index> schema = {Index(0, {0}, false)};
    {
        DurableTable table(params("dups"), 2, schema);
        table.apply_batch({Record::insert({1, "a"}), Record::insert({1, "a"}),
                           Record::insert({1, "b"}), Record::insert({2, "c"})}, at(1));
        EXPECT_EQ(table.lookup(0, enc({1})).size(), 3u);

        // Removing one copy leaves the other
        table.apply_batch({Record::remove({1, "a"})}, at(2));
        EXPECT_THAT(values(table.lookup(0, enc({1}))), UnorderedElementsAre(Row{1, "a"}, Row{1, "b"}));
    }
    DurableTable table(params("dups"), 2, schema);
    EXPECT_THAT(values(table.lookup(0, enc({1}))), UnorderedElementsAre(Row{1, "a"}, Row{1, "b"}));

    // Sequence numbers keep growing after recovery
    table.apply_batch({Record::insert({1, "a"})}, at(3));
    EXPECT_EQ(table.lookup(0, enc({1})).size(), 3u);
    EXPECT_EQ(table.row_count(), 4u);
}

TEST_F(DurableTableTest, CompactionFoldsLogIntoSnapshot) {
    PersistenceParameters p = params("compact");
    p.wal_rotate_bytes = 512;
    uint64_t compactions = metrics::compactions.value();

    std::map<int, int> model;
    {
        DurableTable table(p, 3, people());
        for (int i = 0; i < 60; ++i) {
            Records batch{Record::insert({i, "city" + std::to_string(i % 4), i})};
            if (i >= 10 && i % 10 == 0) {
                batch.push_back(Record::remove({i - 10, "city" + std::to_string((i - 10) % 4), i - 10}));
                model.erase(i - 10);
            }
            model[i] = i;
            table.apply_batch(batch, at(static_cast<uint64_t>(i + 1)));
        }
        EXPECT_GT(metrics::compactions.value(), compactions);
        EXPECT_LT(table.active_log_bytes(), p.wal_rotate_bytes);
    }

    // Exactly one snapshot and one live segment remain
    std::string dir = test_dir_ + "/compact";
    EXPECT_EQ(test::list_files(dir, "snapshot-").size(), 1u);
    EXPECT_EQ(test::list_files(dir, "batch-").size(), 1u);

    DurableTable table(p, 3, people());
    EXPECT_EQ(table.row_count(), model.size());
    EXPECT_EQ(table.last_frame_seq(), 60u);
    EXPECT_EQ(*table.last_checkpoint(), at(60));
    for (const auto& [id, score] : model) {
        EXPECT_EQ(table.lookup(0, enc({id})).size(), 1u) << id;
    }
    EXPECT_TRUE(table.lookup(0, enc({0})).empty());
}

TEST_F(DurableTableTest, ExplicitCompactOnEmptyTable) {
    {
        DurableTable table(params(), 3, people());
        table.compact();
    }
    DurableTable table(params(), 3, people());
    EXPECT_TRUE(table.recovered());
    EXPECT_EQ(table.row_count(), 0u);
    EXPECT_FALSE(table.last_checkpoint().has_value());
}

TEST_F(DurableTableTest, VerifyOnOpenAcceptsHealthyData) {
    {
        DurableTable table(params(), 3, people());
        table.apply_batch({Record::insert({1, "paris", 10}), Record::insert({2, "paris", 20})}, at(1));
    }
    PersistenceParameters p = params();
    p.verify_on_open = true;
    DurableTable table(p, 3, people());
    EXPECT_EQ(table.lookup(1, enc({"paris"})).size(), 2u);
}

TEST_F(DurableTableTest, StorageFailurePoisonsTable) {
    PersistenceParameters p = params("doomed");
    p.wal_rotate_bytes = 64;
    DurableTable table(p, 3, people());

    // Compaction writes into a directory that no longer exists
    std::filesystem::remove_all(table.dir());
    EXPECT_THROW(table.apply_batch({Record::insert({1, std::string(100, 'x'), 1})}, at(1)),
                 StorageIOError);
    EXPECT_TRUE(table.poisoned());
    EXPECT_THROW(table.lookup(0, enc({1})), StorageIOError);
    EXPECT_THROW(table.apply_batch({Record::insert({2, "y", 2})}, at(2)), StorageIOError);
}

TEST_F(DurableTableTest, ClosedTableRejectsWrites) {
    DurableTable table(params(), 3, people());
    table.close();
    table.close();
    EXPECT_THROW(table.apply_batch({Record::insert({1, "a", 1})}, at(1)), std::invalid_argument);
}

TEST_F(DurableTableTest, DeleteOnExitStartsEmptyAndCleansUp) {
    PersistenceParameters p = params("scratch");
    p.mode = DurabilityMode::DeleteOnExit;
    {
        DurableTable table(p, 3, people());
        table.apply_batch({Record::insert({1, "a", 1})}, at(1));
        table.close();
        EXPECT_FALSE(std::filesystem::exists(test_dir_ + "/scratch"));
    }

    // Leftovers from a crashed run are wiped on open
    {
        p.mode = DurabilityMode::Permanent;
        DurableTable table(p, 3, people());
        table.apply_batch({Record::insert({1, "a", 1})}, at(1));
    }
    p.mode = DurabilityMode::DeleteOnExit;
    DurableTable table(p, 3, people());
    EXPECT_FALSE(table.recovered());
    EXPECT_EQ(table.row_count(), 0u);
}

TEST_F(DurableTableTest, MissingNameIsRejected) {
    EXPECT_THROW(DurableTable(params(""), 3, people()), std::invalid_argument);
}

TEST_F(DurableTableTest, SnapshotForRecoveryListsAllRows) {
    DurableTable table(params(), 3, people());
    EXPECT_FALSE(table.snapshot_for_recovery().second.has_value());
    table.apply_batch({Record::insert({2, "b", 2}), Record::insert({1, "a", 1})}, at(9));

    auto [rows, checkpoint] = table.snapshot_for_recovery();
    EXPECT_THAT(values(rows), UnorderedElementsAre(Row{1, "a", 1}, Row{2, "b", 2}));
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ(*checkpoint, at(9));
}
