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
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include "proto/user.pb.h"
#include "common/Error.hpp"
#include "common/Types.hpp"

using ustore::ErrorCode;
using ustore::User;
using ustore::UserRole;

TEST(TypesTest, UserEquality) {
    const User a {1, "Ann", "ann@x.com"};
    const User b {1, "Ann", "ann@x.com"};
    const User c {1, "Ann", "ann@y.com"};
    const User d {2, "Ann", "ann@x.com"};
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
    EXPECT_FALSE(a == d);
}

static_assert(std::is_nothrow_move_constructible_v<User>);
static_assert(std::is_copy_assignable_v<User>);

TEST(TypesTest, UserCopyAndMove) {
    User a {1, "Ann", "ann@x.com"};
    User copy {a};
    EXPECT_EQ(copy, a);
    User moved {std::move(a)};
    EXPECT_EQ(moved, copy);
    User target {2, "Bob", "bob@x.com"};
    target = moved;
    EXPECT_EQ(target, copy);
}

TEST(TypesTest, UserFromProto) {
    ustore::proto::User p;
    p.set_id(9);
    p.set_name("Eve");
    p.set_email("eve@x.com");
    const User u {p};
    EXPECT_EQ(u.id, 9);
    EXPECT_EQ(u.name, "Eve");
    EXPECT_EQ(u.email, "eve@x.com");
    EXPECT_EQ(User {u.toProto()}, u);
}

TEST(TypesTest, EmptyFieldsAreAccepted) {
    const User u {3, "", "not-an-email"};
    const auto p = u.toProto();
    EXPECT_EQ(p.name(), "");
    EXPECT_EQ(p.email(), "not-an-email");
}

TEST(TypesTest, RoleNames) {
    EXPECT_EQ(ustore::toString(UserRole::Admin), "Admin");
    EXPECT_EQ(ustore::toString(UserRole::User), "User");
    EXPECT_EQ(ustore::toString(UserRole::Guest), "Guest");
    std::ostringstream os;
    os << UserRole::Guest;
    EXPECT_EQ(os.str(), "Guest");
}

TEST(TypesTest, RoleFromString) {
    auto admin = ustore::userRoleFromString("Admin");
    ASSERT_TRUE(admin.has_value());
    EXPECT_EQ(admin.value(), UserRole::Admin);
    auto guest = ustore::userRoleFromString("Guest");
    ASSERT_TRUE(guest.has_value());
    EXPECT_EQ(guest.value(), UserRole::Guest);
}

TEST(TypesTest, UnknownRoleIsInvalidArg) {
    auto role = ustore::userRoleFromString("root");
    ASSERT_FALSE(role.has_value());
    EXPECT_EQ(role.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(role.error().what, "Unknown user role: root");
}
