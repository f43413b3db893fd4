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
#ifndef USER_SERVICE_H
#define USER_SERVICE_H

#include <string>
#include "common/Types.hpp"
#include "storage/UserRepository.hpp"

namespace ustore {

class UserService {
public:
    explicit UserService(UserRepository& r);
    UserService(const UserService&) = delete;
    UserService& operator=(const UserService&) = delete;

    User createUser(std::string name, std::string email);
private:
    // size() + 1, so ids repeat once entries are erased or added directly.
    EntityId generateId() const;
    UserRepository& repository;
};

} // namespace ustore

#endif // USER_SERVICE_H
