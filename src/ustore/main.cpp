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
#include <iostream>
#include <string>
#include <spdlog/spdlog.h>
#include "common/Logging.hpp"
#include "common/Types.hpp"
#include "service/UserService.hpp"
#include "storage/RepositoryConfig.hpp"
#include "storage/UserRepository.hpp"

using ustore::LogConfig;
using ustore::RepositoryConfig;
using ustore::UserRepository;
using ustore::UserRole;
using ustore::UserService;

int main(int /*argc*/, char** /*argv*/) {
    ustore::initLogging(LogConfig {spdlog::level::debug});
    spdlog::info("USTORE! Starting...");

    UserRepository repository {RepositoryConfig {}};
    {
        UserService service {repository};
        service.createUser("Ann", "ann@x.com");
        service.createUser("Bob", "bob@x.com");
    }

    if (auto ann = repository.getById(1)) {
        std::cout << ann->get().id << ' ' << ann->get().name << ' ' << ann->get().email << '\n';
    }

    auto lookup = repository.getByIdAsync(2);
    const auto bob = lookup.get();
    if (!bob.has_value()) {
        spdlog::error("Async lookup failed: {}", bob.error().what);
    } else if (bob.value().has_value()) {
        std::cout << bob.value()->id << ' ' << bob.value()->name << ' ' << bob.value()->email << '\n';
    }

    std::cout << "roles: " << UserRole::Admin << ' ' << UserRole::User << ' ' << UserRole::Guest << '\n';
    spdlog::info("Stored users: {}", repository.size());
    ustore::shutdownLogging();
    return 0;
}
