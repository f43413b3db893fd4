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
#ifndef USTORE_LOGGING_H
#define USTORE_LOGGING_H

#include <string>
#include <cstddef>
#include <spdlog/common.h>

namespace ustore {

inline constexpr auto kLoggerName = "ustore";

struct LogConfig {
    explicit LogConfig(
        spdlog::level::level_enum l = spdlog::level::info,
        std::string f = {},
        std::size_t maxSize = 1024 * 1024 * 5,
        std::size_t files = 3,
        std::size_t queue = 8192
    );
    spdlog::level::level_enum level;
    // Empty means console only.
    std::string file;
    std::size_t maxFileSize;
    std::size_t maxFiles;
    std::size_t queueSize;
};

// Installs an async logger named kLoggerName as the spdlog default.
// Calling it again replaces the previous logger; if the sinks cannot be
// created it throws and the previous logger stays installed.
// queueSize only applies when no spdlog thread pool exists yet.
void initLogging(const LogConfig& config);

// No spdlog call may be made after this until initLogging runs again.
void shutdownLogging();

} // namespace ustore

#endif // USTORE_LOGGING_H
