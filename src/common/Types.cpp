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
#include "common/Types.hpp"
#include <utility>
#include <string>
#include <string_view>
#include <expected>
#include "proto/user.pb.h"
#include "common/Error.hpp"

namespace ustore {

User::User(EntityId i, std::string n, std::string e)
    : id {i}, name {std::move(n)}, email {std::move(e)} {}

User::User(const proto::User& protoUser)
    : id {protoUser.id()}, name {protoUser.name()}, email {protoUser.email()} {}

proto::User User::toProto() const {
    proto::User protoUser;
    protoUser.set_id(id);
    protoUser.set_name(name);
    protoUser.set_email(email);
    return protoUser;
}

std::string toString(const UserRole& role) {
    switch (role)
    {
        case UserRole::Admin: return "Admin";
        case UserRole::User: return "User";
        case UserRole::Guest: return "Guest";
    }
    std::unreachable();
}

std::ostream& operator<<(std::ostream& os, const UserRole& role) {
    os << toString(role);
    return os;
}

std::expected<UserRole, Error> userRoleFromString(std::string_view name) {
    if (name == "Admin") {
        return UserRole::Admin;
    }
    if (name == "User") {
        return UserRole::User;
    }
    if (name == "Guest") {
        return UserRole::Guest;
    }
    return std::unexpected {Error {ErrorCode::InvalidArg, "Unknown user role: " + std::string {name}}};
}

} // namespace ustore
