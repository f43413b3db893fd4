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
#ifndef REPOSITORY_HPP
#define REPOSITORY_HPP

#include <functional>
#include <optional>
#include "common/Types.hpp"

namespace ustore {

template <typename T>
class Repository {
public:
    virtual ~Repository() = default;

    virtual std::optional<std::reference_wrapper<const T>> getById(EntityId id) const = 0;
    // Replaces any entity already stored under the same id.
    virtual void add(T entity) = 0;
};

} // namespace ustore

#endif // REPOSITORY_HPP
