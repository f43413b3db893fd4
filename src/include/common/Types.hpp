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
#ifndef TYPES_HPP
#define TYPES_HPP

#include <string>
#include <string_view>
#include <ostream>
#include <cstdint>
#include <expected>
#include "proto/user.pb.h"
#include "common/Error.hpp"

namespace ustore {

using EntityId = uint64_t;

struct User {
    EntityId id;
    std::string name;
    std::string email;

    User(EntityId i, std::string n, std::string e);

    explicit User(const proto::User& protoUser);

    proto::User toProto() const;

    bool operator==(const User& other) const {
        return id == other.id && name == other.name && email == other.email;
    }
};

// Not attached to any user.
enum class UserRole {
    Admin,
    User,
    Guest
};

std::string toString(const UserRole& role);

std::ostream& operator<<(std::ostream& os, const UserRole& role);

std::expected<UserRole, Error> userRoleFromString(std::string_view name);

} // namespace ustore

#endif // TYPES_HPP
