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
#include <filesystem>
#include <string>
#include "../../src/errors.h"
#include "../../src/persistence/manifest.h"
#include "test_helpers.h"

using namespace dfstate;
using namespace dfstate::persist;

class ManifestTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = test::create_temp_dir("manifest_test");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    static std::vector<Index> schema() {
        return {Index(0, {0}, true, Materialization::Full, IndexType::Hash, true),
                Index(1, {2, 1}, false, Materialization::Full, IndexType::BTree)};
    }

    std::string test_dir_;
};

TEST_F(ManifestTest, StoreAndLoad) {
    Manifest manifest(test_dir_);
    manifest.set_schema(3, schema());

    Manifest::SnapshotInfo snap;
    snap.path = "snapshot-00000000000000000007.snap";
    snap.covered_seq = 7;
    snap.records = 1200;
    snap.size = 65536;
    snap.crc32c = 0xDEADBEEF;
    manifest.set_snapshot(snap);
    manifest.add_log({"batch-00000000000000000008.log", 8});
    manifest.add_log({"batch-00000000000000000009.log", 9});
    manifest.store();

    ASSERT_TRUE(std::filesystem::exists(test_dir_ + "/manifest.json"));
    EXPECT_EQ(manifest.get_manifest_path(), test_dir_ + "/manifest.json");

    Manifest loaded(test_dir_);
    ASSERT_TRUE(loaded.load());
    EXPECT_EQ(loaded.get_arity(), 3u);
    ASSERT_EQ(loaded.get_indices().size(), 2u);
    for (size_t i = 0; i < 2; ++i) {
        EXPECT_TRUE(loaded.get_indices()[i].same_shape(schema()[i])) << loaded.get_indices()[i];
    }

    ASSERT_TRUE(loaded.has_snapshot());
    EXPECT_EQ(loaded.get_snapshot().path, snap.path);
    EXPECT_EQ(loaded.get_snapshot().covered_seq, 7u);
    EXPECT_EQ(loaded.get_snapshot().records, 1200u);
    EXPECT_EQ(loaded.get_snapshot().size, 65536u);
    EXPECT_EQ(loaded.get_snapshot().crc32c, 0xDEADBEEFu);

    ASSERT_EQ(loaded.get_logs().size(), 2u);
    EXPECT_EQ(loaded.get_logs()[0].seq, 8u);
    EXPECT_EQ(loaded.get_logs()[1].path, "batch-00000000000000000009.log");
}

TEST_F(ManifestTest, NoSnapshotRoundTrips) {
    Manifest manifest(test_dir_);
    manifest.set_schema(2, {Index(0, {0}, true)});
    manifest.add_log({"batch-00000000000000000001.log", 1});
    manifest.store();

    Manifest loaded(test_dir_);
    ASSERT_TRUE(loaded.load());
    EXPECT_FALSE(loaded.has_snapshot());
    EXPECT_EQ(loaded.get_logs().size(), 1u);
}

TEST_F(ManifestTest, StoreReplacesPreviousContents) {
    Manifest manifest(test_dir_);
    manifest.set_schema(1, {Index(0, {0}, true)});
    manifest.add_log({"batch-00000000000000000001.log", 1});
    manifest.store();

    manifest.set_logs({Manifest::LogInfo{"batch-00000000000000000002.log", 2}});
    manifest.store();

    Manifest loaded(test_dir_);
    ASSERT_TRUE(loaded.load());
    ASSERT_EQ(loaded.get_logs().size(), 1u);
    EXPECT_EQ(loaded.get_logs()[0].seq, 2u);
    EXPECT_TRUE(test::list_files(test_dir_, "manifest.json.").empty());
}

TEST_F(ManifestTest, StoreCreatesDirectory) {
    std::string nested = test_dir_ + "/a/b";
    Manifest manifest(nested);
    manifest.set_schema(1, {Index(0, {0}, true)});
    manifest.store();
    EXPECT_TRUE(std::filesystem::exists(nested + "/manifest.json"));
}

TEST_F(ManifestTest, MissingManifest) {
    Manifest manifest(test_dir_);
    EXPECT_FALSE(manifest.load());
}

TEST_F(ManifestTest, CorruptManifestIsInconsistent) {
    std::string path = test_dir_ + "/manifest.json";

    test::write_text(path, "");
    EXPECT_THROW(Manifest(test_dir_).load(), RecoveryInconsistency);

    test::write_text(path, "{\"version\": 1, \"arity\": ");
    EXPECT_THROW(Manifest(test_dir_).load(), RecoveryInconsistency);

    test::write_text(path, "[]");
    EXPECT_THROW(Manifest(test_dir_).load(), RecoveryInconsistency);

    test::write_text(path, R"({"version": 99, "arity": 1, "indices": []})");
    EXPECT_THROW(Manifest(test_dir_).load(), RecoveryInconsistency);

    test::write_text(path, R"({"version": 1, "indices": []})");
    EXPECT_THROW(Manifest(test_dir_).load(), RecoveryInconsistency);

    test::write_text(path, R"({"version": 1, "arity": 1, "indices": [{"id": 0}]})");
    EXPECT_THROW(Manifest(test_dir_).load(), RecoveryInconsistency);

    test::write_text(path, R"({"version": 1, "arity": 1, "indices": [], "logs": [{"seq": 3}]})");
    EXPECT_THROW(Manifest(test_dir_).load(), RecoveryInconsistency);
}

TEST_F(ManifestTest, JsonIsReadable) {
    Manifest manifest(test_dir_);
    manifest.set_schema(2, {Index(0, {1}, true, Materialization::Partial, IndexType::BTree)});
    std::string json = manifest.to_json();
    EXPECT_NE(json.find("\"arity\": 2"), std::string::npos);
    EXPECT_NE(json.find("\"partial\""), std::string::npos);
    EXPECT_NE(json.find("\"btree\""), std::string::npos);
}
