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

#ifndef ZLEDGER_COMMON_ERROR_HPP
#define ZLEDGER_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <cstdint>
#include <unordered_set>
#include <unordered_map>
#include <functional>
#include <type_traits>
#include "common/Amount.hpp"

namespace zledger {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    AccountNotFound = 2,
    InsufficientFunds = 3,
    SameAccount = 4,
    LockTimeout = 5,
    TransientStoreFailure = 6,
    IntegrityViolation = 7,
    Internal = 8,
    Unknown = 128
};

// How a failure is surfaced to a caller, independent of transport.
enum class ErrorCategory : char {
    None,
    Invalid,
    Rejected,
    NotFound,
    Conflict,
    Contention,
    Unavailable,
    Internal
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

extern const std::unordered_map<std::string, std::unordered_set<ErrorCode, ErrorCodeHash>> retriableErrorCodes;
bool isRetriable(const std::string& op, const ErrorCode& code);

// Expected outcomes of the ledger rules. They are never retried and never logged above warn.
bool isBusinessError(const ErrorCode& code);

ErrorCategory category(const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    std::string account;
    Amount available;
    Amount required;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string a);
    Error(const ErrorCode& c, std::string w, std::string a, const Amount& avail, const Amount& req);
    explicit Error(const ErrorCode& c);
};

Error accountNotFound(const std::string& account);
Error insufficientFunds(const std::string& account, const Amount& available, const Amount& required);

} // namespace zledger

#endif // ZLEDGER_COMMON_ERROR_HPP
