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
#ifndef USTORE_TST_LOG_CAPTURE_HPP
#define USTORE_TST_LOG_CAPTURE_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>

namespace ustore::test {

// Swaps in a synchronous ring-buffer logger as the spdlog default while alive.
class LogCapture {
public:
    LogCapture()
        : previous {spdlog::default_logger()},
          sink {std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)},
          capture {std::make_shared<spdlog::logger>("capture", sink)} {
        capture->set_level(spdlog::level::trace);
        spdlog::set_default_logger(capture);
    }
    ~LogCapture() {
        spdlog::set_default_logger(previous);
    }
    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::size_t count(spdlog::level::level_enum level, std::string_view text = {}) const {
        std::size_t n = 0;
        for (const auto& msg : sink->last_raw()) {
            const std::string payload(msg.payload.data(), msg.payload.size());
            if (msg.level == level && payload.find(text) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }
private:
    std::shared_ptr<spdlog::logger> previous;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
    std::shared_ptr<spdlog::logger> capture;
};

} // namespace ustore::test

#endif // USTORE_TST_LOG_CAPTURE_HPP
