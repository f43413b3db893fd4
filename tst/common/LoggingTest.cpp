// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * USTORE an in-memory user store.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include "common/Logging.hpp"

using ustore::LogConfig;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved = spdlog::default_logger();
    }
    void TearDown() override {
        spdlog::set_default_logger(saved);
        spdlog::set_level(saved->level());
        std::error_code ec;
        std::filesystem::remove(logFile, ec);
    }
    std::shared_ptr<spdlog::logger> saved;
    const std::filesystem::path logFile {std::filesystem::temp_directory_path() / "ustore_logging_test.txt"};
};

TEST_F(LoggingTest, ConsoleOnlyLogger) {
    ustore::initLogging(LogConfig {spdlog::level::warn});
    const auto logger = spdlog::default_logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), ustore::kLoggerName);
    EXPECT_EQ(logger->level(), spdlog::level::warn);
    EXPECT_EQ(logger->sinks().size(), 1);
    EXPECT_EQ(spdlog::get(ustore::kLoggerName), logger);
}

TEST_F(LoggingTest, FileAddsRotatingSink) {
    ustore::initLogging(LogConfig {spdlog::level::debug, logFile.string()});
    const auto logger = spdlog::default_logger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
    ASSERT_EQ(logger->sinks().size(), 2);
    EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::rotating_file_sink_mt>(logger->sinks()[1]), nullptr);
}

TEST_F(LoggingTest, ReinitReplacesLogger) {
    ustore::initLogging(LogConfig {spdlog::level::info});
    const auto first = spdlog::default_logger();
    ustore::initLogging(LogConfig {spdlog::level::err});
    const auto second = spdlog::default_logger();
    EXPECT_NE(first, second);
    EXPECT_EQ(second->level(), spdlog::level::err);
    EXPECT_EQ(spdlog::get(ustore::kLoggerName), second);
}

TEST_F(LoggingTest, FailedReinitKeepsPreviousLogger) {
    ustore::initLogging(LogConfig {spdlog::level::info});
    const auto before = spdlog::default_logger();
    EXPECT_THROW(ustore::initLogging(LogConfig {spdlog::level::info, "/proc/nonexistent_dir/x.txt"}), spdlog::spdlog_ex);
    ASSERT_NE(spdlog::default_logger_raw(), nullptr);
    EXPECT_EQ(spdlog::default_logger(), before);
    EXPECT_EQ(spdlog::get(ustore::kLoggerName), before);
    spdlog::info("LoggingTest: logging after failed re-init");
}
