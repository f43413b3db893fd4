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
#include <chrono>
#include <stdexcept>
#include "storage/RepositoryConfig.hpp"

using ustore::RepositoryConfig;

TEST(RepositoryConfigTest, DefaultDelay) {
    const RepositoryConfig config {};
    EXPECT_EQ(config.lookupDelay, std::chrono::milliseconds {100});
}

TEST(RepositoryConfigTest, CustomDelay) {
    const RepositoryConfig config {std::chrono::milliseconds {5}};
    EXPECT_EQ(config.lookupDelay, std::chrono::milliseconds {5});
}

TEST(RepositoryConfigTest, ZeroDelayAllowed) {
    EXPECT_NO_THROW(RepositoryConfig {std::chrono::milliseconds::zero()});
}

TEST(RepositoryConfigTest, NegativeDelayThrows) {
    EXPECT_THROW(RepositoryConfig {std::chrono::milliseconds {-1}}, std::invalid_argument);
}
