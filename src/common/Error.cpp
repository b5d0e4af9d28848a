// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * ZLedger a concurrent, fault-tolerant ledger service.
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
#include <unordered_set>
#include <unordered_map>

namespace zledger {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::AccountNotFound: return "AccountNotFound";
        case ErrorCode::InsufficientFunds: return "InsufficientFunds";
        case ErrorCode::SameAccount: return "SameAccount";
        case ErrorCode::LockTimeout: return "LockTimeout";
        case ErrorCode::TransientStoreFailure: return "TransientStoreFailure";
        case ErrorCode::IntegrityViolation: return "IntegrityViolation";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes = {
    // Every attempt draws a fresh number, so losing a race for one is worth another try.
    {"openAccount", {
        ErrorCode::TransientStoreFailure,
        ErrorCode::IntegrityViolation,
    }},
    {"default", {
        ErrorCode::TransientStoreFailure,
    }}
};

bool isRetriable(const std::string& op, const ErrorCode& code) {
    auto it = retriableErrorCodes.find(op);
    if (it != retriableErrorCodes.end()) {
        return it->second.contains(code);
    } else {
        auto d = retriableErrorCodes.find("default");
        return d->second.contains(code);
    }
}

bool isBusinessError(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::InvalidArg:
        case ErrorCode::AccountNotFound:
        case ErrorCode::InsufficientFunds:
        case ErrorCode::SameAccount:
        case ErrorCode::LockTimeout:
            return true;
        default:
            return false;
    }
}

ErrorCategory category(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorCategory::None;
        case ErrorCode::InvalidArg:
            return ErrorCategory::Invalid;
        case ErrorCode::InsufficientFunds:
        case ErrorCode::SameAccount:
            return ErrorCategory::Rejected;
        case ErrorCode::AccountNotFound:
            return ErrorCategory::NotFound;
        case ErrorCode::IntegrityViolation:
            return ErrorCategory::Conflict;
        case ErrorCode::LockTimeout:
            return ErrorCategory::Contention;
        case ErrorCode::TransientStoreFailure:
            return ErrorCategory::Unavailable;
        case ErrorCode::Internal:
        case ErrorCode::Unknown:
            return ErrorCategory::Internal;
    }
    std::unreachable();
}

Error::Error(const ErrorCode& c, std::string w, std::string a, const Amount& avail, const Amount& req)
    : code {c}, what {std::move(w)}, account {std::move(a)}, available {avail}, required {req} {}
Error::Error(const ErrorCode& c, std::string w, std::string a) : code {c}, what {std::move(w)}, account {std::move(a)}, available{}, required{} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, account{}, available{}, required{} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, account{}, available{}, required{} {}

Error accountNotFound(const std::string& account) {
    return Error {ErrorCode::AccountNotFound, "Account " + account + " not found", account};
}

Error insufficientFunds(const std::string& account, const Amount& available, const Amount& required) {
    return Error {
        ErrorCode::InsufficientFunds,
        "Insufficient balance. Available: " + available.toString() + ", Required: " + required.toString(),
        account,
        available,
        required
    };
}

} // namespace zledger
