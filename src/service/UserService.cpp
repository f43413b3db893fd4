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
#include "service/UserService.hpp"
#include <string>
#include <utility>
#include <spdlog/spdlog.h>
#include "common/Types.hpp"
#include "storage/UserRepository.hpp"

namespace ustore {

UserService::UserService(UserRepository& r) : repository {r} {}

User UserService::createUser(std::string name, std::string email) {
    User user {generateId(), std::move(name), std::move(email)};
    if (repository.contains(user.id)) {
        spdlog::warn("UserService::createUser: id {} already taken, overwriting", user.id);
    }
    repository.add(user);
    spdlog::info("UserService::createUser: created user {} name={} email={}", user.id, user.name, user.email);
    return user;
}

EntityId UserService::generateId() const {
    return static_cast<EntityId>(repository.size()) + 1;
}

} // namespace ustore
