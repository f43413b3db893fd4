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
#ifndef REPOSITORY_CONFIG_H
#define REPOSITORY_CONFIG_H

#include <chrono>

namespace ustore {

inline constexpr std::chrono::milliseconds kDefaultLookupDelay {100};

struct RepositoryConfig {
    explicit RepositoryConfig(std::chrono::milliseconds delay = kDefaultLookupDelay);
    std::chrono::milliseconds lookupDelay;
};

} // namespace ustore

#endif // REPOSITORY_CONFIG_H
