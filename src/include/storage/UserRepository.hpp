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
#ifndef USER_REPOSITORY_H
#define USER_REPOSITORY_H

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <future>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <unordered_map>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/Repository.hpp"
#include "storage/RepositoryConfig.hpp"

namespace ustore {

// Waits for delay unless stop is requested first. Returns false when interrupted.
bool interruptibleSleep(std::chrono::milliseconds delay, std::stop_token stop);

class UserRepository : public Repository<User> {
public:
    using Sleeper = std::function<bool(std::chrono::milliseconds, std::stop_token)>;

    UserRepository();
    explicit UserRepository(const RepositoryConfig& c, Sleeper s = interruptibleSleep);
    UserRepository(const UserRepository&) = delete;
    UserRepository& operator=(const UserRepository&) = delete;
    UserRepository(UserRepository&&) = delete;
    UserRepository& operator=(UserRepository&&) = delete;

    // The reference stays valid until the entry is overwritten or erased.
    std::optional<std::reference_wrapper<const User>> getById(EntityId id) const override;
    void add(User entity) override;

    // Waits config.lookupDelay on another thread, then returns a copy of the entry.
    // Fails with ErrorCode::Cancelled if stop is requested during the wait.
    // The repository must outlive the returned future.
    std::future<std::expected<std::optional<User>, Error>> getByIdAsync(EntityId id, std::stop_token stop = {}) const;

    std::optional<User> erase(EntityId id);
    bool contains(EntityId id) const;
    size_t size() const;
private:
    RepositoryConfig config;
    Sleeper sleeper;
    std::unordered_map<EntityId, User> users;
    mutable std::shared_mutex m;
};

} // namespace ustore

#endif // USER_REPOSITORY_H
