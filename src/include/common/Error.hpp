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
#ifndef USTORE_COMMON_ERROR_HPP
#define USTORE_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <cstdint>
#include <proto/error.pb.h>

namespace ustore {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    KeyNotFound = 6,
    Internal = 9,
    Cancelled = 10,
    Unknown = 128
};

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    uint64_t id;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, uint64_t i);
    explicit Error(const ErrorCode& c);
    explicit Error(const proto::ErrorDetails& error);

    proto::ErrorDetails toProto() const;
};

} // namespace ustore

#endif // USTORE_COMMON_ERROR_HPP
