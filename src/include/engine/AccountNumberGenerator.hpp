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

#ifndef ZLEDGER_ENGINE_ACCOUNT_NUMBER_GENERATOR_HPP
#define ZLEDGER_ENGINE_ACCOUNT_NUMBER_GENERATOR_HPP

#include "storage/LedgerStore.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <cstddef>
#include <expected>

namespace zledger {

class AccountNumberGenerator {
public:
    virtual ~AccountNumberGenerator() = default;
    // A number no existing account uses at the time of the call.
    virtual std::expected<AccountNumber, Error> next() = 0;
};

// Random decimal numbers without a leading zero, checked against the store.
class RandomAccountNumberGenerator : public AccountNumberGenerator {
public:
    explicit RandomAccountNumberGenerator(const LedgerStore& s, size_t length = 10, int maxAttempts = 100);
    std::expected<AccountNumber, Error> next() override;
private:
    const LedgerStore& store;
    size_t digits;
    int attempts;
};

} // namespace zledger

#endif // ZLEDGER_ENGINE_ACCOUNT_NUMBER_GENERATOR_HPP
