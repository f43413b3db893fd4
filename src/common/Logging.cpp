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
#include "common/Logging.hpp"
#include <memory>
#include <vector>
#include <string>
#include <utility>
#include <stdexcept>
#include <spdlog/common.h>
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace ustore {

LogConfig::LogConfig(
    spdlog::level::level_enum l,
    std::string f,
    std::size_t maxSize,
    std::size_t files,
    std::size_t queue)
    : level(l),
      file(std::move(f)),
      maxFileSize(maxSize),
      maxFiles(files),
      queueSize(queue) {
    if (queue == 0) {
        throw std::invalid_argument("Log queue size must be > zero.");
    }
    if (!file.empty() && maxSize == 0) {
        throw std::invalid_argument("Max log file size must be > zero.");
    }
    if (!file.empty() && files == 0) {
        throw std::invalid_argument("Max log files must be > zero.");
    }
}

void initLogging(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks {std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, config.maxFileSize, config.maxFiles));
    }
    auto pool = spdlog::thread_pool();
    if (!pool) {
        spdlog::init_thread_pool(config.queueSize, 1);
        pool = spdlog::thread_pool();
    }
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        kLoggerName, sinks.begin(), sinks.end(),
        pool, spdlog::async_overflow_policy::overrun_oldest);
    asyncLogger->set_level(config.level);
    // Registers the logger under kLoggerName and swaps the default in one step.
    spdlog::set_default_logger(asyncLogger);
    spdlog::set_level(config.level);
}

void shutdownLogging() {
    if (auto logger = spdlog::get(kLoggerName)) {
        logger->flush();
    }
    spdlog::shutdown();
}

} // namespace ustore
