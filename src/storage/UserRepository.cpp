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
#include "storage/UserRepository.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <utility>
#include <spdlog/spdlog.h>
#include "common/Error.hpp"
#include "common/Types.hpp"

namespace ustore {

bool interruptibleSleep(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex mtx;
    std::condition_variable_any cv;
    std::unique_lock lock {mtx};
    return !cv.wait_for(lock, stop, delay, [&stop] { return stop.stop_requested(); });
}

UserRepository::UserRepository() : UserRepository(RepositoryConfig {}) {}

UserRepository::UserRepository(const RepositoryConfig& c, Sleeper s)
    : config {c}, sleeper {std::move(s)}, users {}, m {} {}

std::optional<std::reference_wrapper<const User>> UserRepository::getById(EntityId id) const {
    const std::shared_lock lock {m};
    auto i = users.find(id);
    if (i == users.end()) {
        return std::nullopt;
    }
    return std::cref(i->second);
}

void UserRepository::add(User entity) {
    const std::unique_lock lock {m};
    const auto id = entity.id;
    auto [i, inserted] = users.insert_or_assign(id, std::move(entity));
    if (inserted) {
        spdlog::debug("UserRepository::add: stored user {} ({})", id, i->second.email);
    } else {
        spdlog::debug("UserRepository::add: overwrote user {} ({})", id, i->second.email);
    }
}

std::future<std::expected<std::optional<User>, Error>> UserRepository::getByIdAsync(EntityId id, std::stop_token stop) const {
    spdlog::debug("UserRepository::getByIdAsync: lookup {} after {}ms", id, config.lookupDelay.count());
    return std::async(std::launch::async, [this, id, stop]() -> std::expected<std::optional<User>, Error> {
        if (!sleeper(config.lookupDelay, stop)) {
            spdlog::warn("UserRepository::getByIdAsync: lookup {} cancelled", id);
            return std::unexpected {Error {ErrorCode::Cancelled, "Lookup cancelled", id}};
        }
        const std::shared_lock lock {m};
        auto i = users.find(id);
        if (i == users.end()) {
            return std::nullopt;
        }
        return i->second;
    });
}

std::optional<User> UserRepository::erase(EntityId id) {
    const std::unique_lock lock {m};
    auto i = users.find(id);
    if (i == users.end()) {
        return std::nullopt;
    }
    auto u = std::move(i->second);
    users.erase(i);
    spdlog::debug("UserRepository::erase: removed user {}", id);
    return u;
}

bool UserRepository::contains(EntityId id) const {
    const std::shared_lock lock {m};
    return users.contains(id);
}

size_t UserRepository::size() const {
    const std::shared_lock lock {m};
    return users.size();
}

} // namespace ustore
