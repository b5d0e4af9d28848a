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

#ifndef ZLEDGER_COMMON_TYPES_HPP
#define ZLEDGER_COMMON_TYPES_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>
#include "common/Amount.hpp"

namespace zledger {

using AccountNumber = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using TransactionId = uint64_t;

int64_t toMicros(const Timestamp& t);
Timestamp fromMicros(int64_t micros);

enum class TransactionKind : char {
    Deposit,
    Withdrawal,
    Transfer
};

std::string toString(const TransactionKind& kind);

struct Account {
    AccountNumber number;
    Amount balance;
    Timestamp createdAt;
    Timestamp updatedAt;
    // Bumped on every committed change; sessions use it to detect foreign writers.
    uint64_t version = 0;
};

// One immutable row of the transaction log.
struct TransactionRecord {
    TransactionId id = 0;
    std::optional<AccountNumber> from;
    AccountNumber to;
    Amount amount;
    TransactionKind kind = TransactionKind::Deposit;
    Timestamp createdAt;

    [[nodiscard]] bool involves(const AccountNumber& account) const {
        return to == account || (from.has_value() && from.value() == account);
    }
};

struct DepositResult {
    AccountNumber account;
    Amount newBalance;
    Amount depositedAmount;
    TransactionId transactionId = 0;
};

struct TransferResult {
    std::string transferId;
    AccountNumber fromAccount;
    AccountNumber toAccount;
    Amount amount;
    Amount fromBalance;
    Amount toBalance;
    TransactionId transactionId = 0;
};

struct AccountCheck {
    AccountNumber number;
    bool exists = false;
    Amount balance;
    bool locked = false;
};

struct TransferPreconditions {
    AccountCheck from;
    AccountCheck to;
    Amount amount;
    bool sameAccount = false;
    bool amountValid = false;
    bool sufficientFunds = false;
    bool valid = false;
    std::vector<std::string> problems;
};

struct ConcurrencyStatus {
    AccountNumber account;
    size_t recentTransactionCount = 0;
    std::chrono::seconds window{0};
    bool lockHeld = false;
};

struct StoreHealth {
    bool healthy = false;
    std::chrono::microseconds latency{0};
    std::string detail;
};

} // namespace zledger

#endif // ZLEDGER_COMMON_TYPES_HPP
