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
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include "../src/errors.h"
#include "../src/store_config.h"
#include "../src/util/log.h"
#include "../src/util/logmanager.h"
#include "persistence/test_helpers.h"

using namespace dfstate;

class StoreConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("DFSTATE_MEMORY_BUDGET");
        ::unsetenv("DFSTATE_EVICTION_INTERVAL_MS");
        ::unsetenv("DFSTATE_LOG_LEVEL");
        saved_level_ = logLevel.load();
        test_dir_ = persist::test::create_temp_dir("store_config_test");
    }

    void TearDown() override {
        ::unsetenv("DFSTATE_MEMORY_BUDGET");
        ::unsetenv("DFSTATE_EVICTION_INTERVAL_MS");
        ::unsetenv("DFSTATE_LOG_LEVEL");
        logLevel.store(saved_level_);
        std::filesystem::remove_all(test_dir_);
    }

    int saved_level_ = LOG_INFO;
    std::string test_dir_;
};

TEST_F(StoreConfigTest, ParseByteSize) {
    EXPECT_EQ(parse_byte_size("0"), 0u);
    EXPECT_EQ(parse_byte_size("512"), 512u);
    EXPECT_EQ(parse_byte_size("4KB"), 4096u);
    EXPECT_EQ(parse_byte_size("4kb"), 4096u);
    EXPECT_EQ(parse_byte_size("3MB"), 3ULL * 1024 * 1024);
    EXPECT_EQ(parse_byte_size("2GB"), 2ULL * 1024 * 1024 * 1024);

    EXPECT_THROW(parse_byte_size(""), std::invalid_argument);
    EXPECT_THROW(parse_byte_size("KB"), std::invalid_argument);
    EXPECT_THROW(parse_byte_size("-1"), std::invalid_argument);
    EXPECT_THROW(parse_byte_size("1.5MB"), std::invalid_argument);
    EXPECT_THROW(parse_byte_size("10TB"), std::invalid_argument);
}

TEST_F(StoreConfigTest, DefaultsWithoutEnvironment) {
    StoreConfig cfg = StoreConfig::defaults();
    EXPECT_EQ(cfg.memory_limit_bytes, 0u);
    EXPECT_EQ(cfg.eviction_interval_ms, 1000u);
    EXPECT_EQ(cfg.eviction_policy, "largest_node");
    EXPECT_TRUE(cfg.sync_on_commit);
    EXPECT_TRUE(cfg.log_level.empty());
    EXPECT_EQ(cfg, StoreConfig());
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(StoreConfigTest, MergeJsonOverlaysPresentMembers) {
    StoreConfig cfg;
    cfg.merge_json(R"({
        "memory_limit_bytes": "64MB",
        "eviction_batch_keys": 32,
        "sync_on_commit": false,
        "wal_rotate_bytes": 1048576
    })");
    EXPECT_EQ(cfg.memory_limit_bytes, 64ULL * 1024 * 1024);
    EXPECT_EQ(cfg.eviction_batch_keys, 32u);
    EXPECT_FALSE(cfg.sync_on_commit);
    EXPECT_EQ(cfg.wal_rotate_bytes, 1048576u);
    // Untouched
    EXPECT_EQ(cfg.eviction_interval_ms, 1000u);
    EXPECT_EQ(cfg.eviction_policy, "largest_node");
    EXPECT_NE(cfg, StoreConfig());
}

TEST_F(StoreConfigTest, MergeJsonRejectsBadInput) {
    StoreConfig cfg;
    EXPECT_THROW(cfg.merge_json("{ broken"), std::invalid_argument);
    EXPECT_THROW(cfg.merge_json("[1, 2]"), std::invalid_argument);
    EXPECT_THROW(cfg.merge_json(R"({"memory_limit_bytes": true})"), std::invalid_argument);
    EXPECT_THROW(cfg.merge_json(R"({"eviction_interval_ms": -5})"), std::invalid_argument);
    EXPECT_THROW(cfg.merge_json(R"({"eviction_policy": 3})"), std::invalid_argument);
    EXPECT_THROW(cfg.merge_json(R"({"sync_on_commit": "yes"})"), std::invalid_argument);
}

TEST_F(StoreConfigTest, ValidateRejectsNonsense) {
    StoreConfig cfg;
    cfg.eviction_policy = "fifo";
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = StoreConfig();
    cfg.eviction_interval_ms = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = StoreConfig();
    cfg.eviction_batch_keys = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = StoreConfig();
    cfg.wal_rotate_bytes = 4;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(StoreConfigTest, EnvironmentOverridesFile) {
    std::string path = test_dir_ + "/store.json";
    persist::test::write_text(path, R"({"memory_limit_bytes": 100, "eviction_interval_ms": 50})");

    ::setenv("DFSTATE_MEMORY_BUDGET", "2MB", 1);
    StoreConfig cfg = StoreConfig::load_file(path);
    EXPECT_EQ(cfg.memory_limit_bytes, 2ULL * 1024 * 1024);
    EXPECT_EQ(cfg.eviction_interval_ms, 50u);

    ::setenv("DFSTATE_EVICTION_INTERVAL_MS", "250", 1);
    ::setenv("DFSTATE_LOG_LEVEL", "debug", 1);
    cfg = StoreConfig::load_file(path);
    EXPECT_EQ(cfg.eviction_interval_ms, 250u);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST_F(StoreConfigTest, BadEnvironmentValuesAreIgnored) {
    ::setenv("DFSTATE_MEMORY_BUDGET", "lots", 1);
    ::setenv("DFSTATE_EVICTION_INTERVAL_MS", "soon", 1);
    StoreConfig cfg = StoreConfig::defaults();
    EXPECT_EQ(cfg.memory_limit_bytes, 0u);
    EXPECT_EQ(cfg.eviction_interval_ms, 1000u);
}

TEST_F(StoreConfigTest, LoadFileErrors) {
    EXPECT_THROW(StoreConfig::load_file(test_dir_ + "/missing.json"), StorageIOError);

    std::string path = test_dir_ + "/bad.json";
    persist::test::write_text(path, R"({"eviction_policy": "fifo"})");
    EXPECT_THROW(StoreConfig::load_file(path), std::invalid_argument);
}

TEST_F(StoreConfigTest, ApplyLoggingSetsLevel) {
    StoreConfig cfg;
    cfg.log_level = "error";
    cfg.apply_logging();
    EXPECT_EQ(logLevel.load(), LOG_ERROR);

    // Unknown names keep the current level
    cfg.log_level = "chatty";
    cfg.apply_logging();
    EXPECT_EQ(logLevel.load(), LOG_ERROR);

    // Empty leaves it alone
    cfg.log_level.clear();
    cfg.apply_logging();
    EXPECT_EQ(logLevel.load(), LOG_ERROR);
}

TEST_F(StoreConfigTest, StartLoggingWritesToLogDir) {
    StoreConfig cfg;
    EXPECT_FALSE(cfg.start_logging());

    cfg.log_dir = test_dir_ + "/logs";
    cfg.log_level = "info";
    {
        std::unique_ptr<LogManager> manager = cfg.start_logging();
        ASSERT_TRUE(manager);
        EXPECT_EQ(manager->path(), cfg.log_dir + "/dfstate.log");
        info() << "store config test line";
    }
    ASSERT_TRUE(std::filesystem::exists(cfg.log_dir + "/dfstate.log"));
    EXPECT_GT(std::filesystem::file_size(cfg.log_dir + "/dfstate.log"), 0u);
}

TEST_F(StoreConfigTest, PersistenceParametersCarryDefaults) {
    StoreConfig cfg;
    cfg.sync_on_commit = false;
    cfg.wal_rotate_bytes = 4096;
    cfg.verify_on_open = true;

    persist::PersistenceParameters p = cfg.persistence("/data", "orders", persist::DurabilityMode::DeleteOnExit);
    EXPECT_EQ(p.db_dir, "/data");
    EXPECT_EQ(p.db_name, "orders");
    EXPECT_EQ(p.mode, persist::DurabilityMode::DeleteOnExit);
    EXPECT_FALSE(p.sync_on_commit);
    EXPECT_EQ(p.wal_rotate_bytes, 4096u);
    EXPECT_TRUE(p.verify_on_open);
}
