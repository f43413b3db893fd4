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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <cstdint>
#include <proto/error.pb.h>

namespace ustore {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

Error::Error(const ErrorCode& c, std::string w, uint64_t i) : code {c}, what {std::move(w)}, id {i} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, id {} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, id {} {}

// Codes outside the known set collapse to Unknown.
Error::Error(const proto::ErrorDetails& error) : code {ErrorCode::Unknown}, what {error.what()}, id {error.id()} {
    switch (static_cast<ErrorCode>(error.code())) {
        case ErrorCode::OK:
        case ErrorCode::InvalidArg:
        case ErrorCode::KeyNotFound:
        case ErrorCode::Internal:
        case ErrorCode::Cancelled:
        case ErrorCode::Unknown:
            code = static_cast<ErrorCode>(error.code());
            break;
    }
}

proto::ErrorDetails Error::toProto() const {
    proto::ErrorDetails details;
    details.set_code(static_cast<int32_t>(code));
    details.set_what(what);
    details.set_id(id);
    return details;
}

} // namespace ustore
