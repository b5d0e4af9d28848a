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

#include "engine/AccountNumberGenerator.hpp"
#include "storage/LedgerStore.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <expected>
#include <stdexcept>
#include <string>

namespace zledger {

RandomAccountNumberGenerator::RandomAccountNumberGenerator(const LedgerStore& s, size_t length, int maxAttempts)
    : store {s}, digits {length}, attempts {maxAttempts} {
    if (length == 0) {
        throw std::invalid_argument("Account number length must be > zero.");
    }
    if (maxAttempts <= 0) {
        throw std::invalid_argument("Account number attempts must be > zero.");
    }
}

std::expected<AccountNumber, Error> RandomAccountNumberGenerator::next() {
    for (int i = 0; i < attempts; ++i) {
        auto candidate = zledger_generate_random_digits(digits);
        auto existing = store.getAccount(candidate);
        if (!existing.has_value()) {
            return std::unexpected {existing.error()};
        }
        if (!existing->has_value()) {
            spdlog::debug("RandomAccountNumberGenerator: generated {} after {} attempts", candidate, i + 1);
            return candidate;
        }
    }
    spdlog::error("RandomAccountNumberGenerator: no unique number after {} attempts", attempts);
    return std::unexpected {Error {ErrorCode::Internal, "Could not generate a unique account number after " + std::to_string(attempts) + " attempts"}};
}

} // namespace zledger
