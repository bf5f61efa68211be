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
#include "../../src/util/log.h"
#include "../../src/util/logmanager.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>
#include <unistd.h>

namespace dfstate {

class LoggingTest : public ::testing::Test {
protected:
    int original_log_level;
    std::string test_log_dir;

    void SetUp() override {
        original_log_level = logLevel;
        test_log_dir = (std::filesystem::temp_directory_path() /
                        ("dfstate_logging_test_" + std::to_string(getpid()))).string();
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        logLevel = original_log_level;
        std::filesystem::remove_all(test_log_dir);
        unsetenv("DFSTATE_LOG_LEVEL");
    }

    static std::string readFile(const std::string& path) {
        std::ifstream file(path);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    // Logger writes to stderr when no file sink is set
    std::string captureStderr(const std::function<void()>& func) {
        std::string tmp_file = test_log_dir + "/capture.log";
        int saved_stderr = dup(STDERR_FILENO);

        FILE* temp = fopen(tmp_file.c_str(), "w");
        if (!temp) return "";
        dup2(fileno(temp), STDERR_FILENO);

        func();

        fflush(stderr);
        std::cerr.flush();
        fclose(temp);
        dup2(saved_stderr, STDERR_FILENO);
        close(saved_stderr);

        std::string content = readFile(tmp_file);
        std::filesystem::remove(tmp_file);
        return content;
    }
};

TEST_F(LoggingTest, SetLogLevelFromString) {
    EXPECT_TRUE(setLogLevelFromString("TRACE"));
    EXPECT_EQ(logLevel, LOG_TRACE);
    EXPECT_TRUE(setLogLevelFromString("INFO"));
    EXPECT_EQ(logLevel, LOG_INFO);
    EXPECT_TRUE(setLogLevelFromString("WARN"));
    EXPECT_EQ(logLevel, LOG_WARNING);
    EXPECT_TRUE(setLogLevelFromString("FATAL"));
    EXPECT_EQ(logLevel, LOG_SEVERE);

    // Case insensitive
    EXPECT_TRUE(setLogLevelFromString("DeBuG"));
    EXPECT_EQ(logLevel, LOG_DEBUG);

    EXPECT_FALSE(setLogLevelFromString("INVALID"));
    EXPECT_EQ(logLevel, LOG_DEBUG);
}

TEST_F(LoggingTest, SetLogLevelFromEnvironment) {
    setenv("DFSTATE_LOG_LEVEL", "ERROR", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel, LOG_ERROR);

    int current_level = logLevel;
    setenv("DFSTATE_LOG_LEVEL", "INVALID_LEVEL", 1);
    auto output = captureStderr([&]() {
        initLoggingFromEnv();
    });
    EXPECT_EQ(logLevel, current_level);
    EXPECT_NE(output.find("Invalid DFSTATE_LOG_LEVEL"), std::string::npos);
}

TEST_F(LoggingTest, LevelFiltering) {
    logLevel = LOG_WARNING;
    auto output = captureStderr([&]() {
        debug() << "debug should not show";
        info() << "info should not show";
        warning() << "warning shows";
        error() << "error shows " << 42;
    });
    EXPECT_EQ(output.find("should not show"), std::string::npos);
    EXPECT_NE(output.find("[WARNING]"), std::string::npos);
    EXPECT_NE(output.find("warning shows"), std::string::npos);
    EXPECT_NE(output.find("error shows 42"), std::string::npos);
}

TEST_F(LoggingTest, ThreadSafety) {
    logLevel = LOG_INFO;
    const int num_threads = 8;
    const int messages_per_thread = 100;

    {
        LogManager log_mgr(test_log_dir);
        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([i]() {
                for (int j = 0; j < messages_per_thread; ++j) {
                    info() << "thread " << i << " message " << j;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    // Every line arrives whole
    std::ifstream in(test_log_dir + "/dfstate.log");
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        if (line.find(" message ") != std::string::npos) {
            EXPECT_NE(line.find("thread "), std::string::npos) << line;
            ++lines;
        }
    }
    EXPECT_EQ(lines, num_threads * messages_per_thread);
}

TEST_F(LoggingTest, LogManagerFileOutput) {
    {
        LogManager log_mgr(test_log_dir);
        EXPECT_EQ(log_mgr.path(), test_log_dir + "/dfstate.log");
        logLevel = LOG_INFO;
        info() << "test message to file";
        warning() << "warning to file";
    }

    std::string content = readFile(test_log_dir + "/dfstate.log");
    EXPECT_NE(content.find("test message to file"), std::string::npos);
    EXPECT_NE(content.find("warning to file"), std::string::npos);

    // Reopening marks the restart
    {
        LogManager log_mgr(test_log_dir);
    }
    EXPECT_NE(readFile(test_log_dir + "/dfstate.log").find("RESTARTED"), std::string::npos);
}

TEST_F(LoggingTest, LogRotation) {
    LogManager::RotationConfig config;
    config.max_file_size = 64;
    {
        LogManager log_mgr(test_log_dir, config);
        logLevel = LOG_INFO;
        EXPECT_FALSE(log_mgr.rotateIfNeeded());

        info() << "before rotation, long enough to cross the rotation threshold";
        EXPECT_TRUE(log_mgr.rotateIfNeeded());

        info() << "after rotation";
    }

    bool found_rotated = false;
    for (const auto& entry : std::filesystem::directory_iterator(test_log_dir)) {
        if (entry.path().filename().string().rfind("dfstate.log.", 0) == 0) {
            found_rotated = true;
            EXPECT_NE(readFile(entry.path().string()).find("before rotation"), std::string::npos);
        }
    }
    EXPECT_TRUE(found_rotated);

    std::string current = readFile(test_log_dir + "/dfstate.log");
    EXPECT_NE(current.find("after rotation"), std::string::npos);
    EXPECT_EQ(current.find("before rotation"), std::string::npos);
}

TEST_F(LoggingTest, MissingLogDirectoryIsCreated) {
    std::string nested = test_log_dir + "/a/b";
    {
        LogManager log_mgr(nested);
    }
    EXPECT_TRUE(std::filesystem::exists(nested + "/dfstate.log"));

    std::string file_path = test_log_dir + "/plain";
    std::ofstream(file_path) << "x";
    EXPECT_THROW(LogManager mgr(file_path), std::runtime_error);
}

TEST_F(LoggingTest, ErrnoDescription) {
    std::string s = errnoWithDescription(ENOENT);
    EXPECT_NE(s.find("errno:2"), std::string::npos);
}

} // namespace dfstate
