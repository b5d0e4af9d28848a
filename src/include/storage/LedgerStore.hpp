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

#ifndef ZLEDGER_STORAGE_LEDGER_STORE_HPP
#define ZLEDGER_STORAGE_LEDGER_STORE_HPP

#include "common/Amount.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace zledger {

// A transaction row staged in a session; id and timestamp are assigned at commit.
struct PendingTransaction {
    std::optional<AccountNumber> from;
    AccountNumber to;
    Amount amount;
    TransactionKind kind = TransactionKind::Deposit;
};

struct CommitReceipt {
    std::vector<TransactionId> transactionIds;
    Timestamp committedAt;
};

// One unit of work against the store. Writes are staged and become visible to
// other readers only when commit() succeeds; rollback() discards them. A
// session is used by a single thread and is finished by commit or rollback.
class StoreSession {
public:
    virtual ~StoreSession() = default;

    // Sees this session's own staged balance changes.
    virtual std::expected<std::optional<Account>, Error> findAccount(const AccountNumber& account) = 0;
    virtual std::expected<std::monostate, Error> updateBalance(const AccountNumber& account, const Amount& balance) = 0;
    virtual std::expected<std::monostate, Error> appendTransaction(const PendingTransaction& transaction) = 0;
    virtual std::expected<CommitReceipt, Error> commit() = 0;
    virtual void rollback() noexcept = 0;
};

class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    virtual std::expected<std::unique_ptr<StoreSession>, Error> begin() = 0;
    // Opens an account with a zero balance; a taken number is IntegrityViolation.
    virtual std::expected<Account, Error> createAccount(const AccountNumber& account) = 0;
    virtual std::expected<std::optional<Account>, Error> getAccount(const AccountNumber& account) const = 0;
    // Most recent first, at most limit rows.
    virtual std::expected<std::vector<TransactionRecord>, Error> history(const AccountNumber& account, size_t limit) const = 0;
    virtual std::expected<size_t, Error> countTransactionsSince(const AccountNumber& account, const Timestamp& since) const = 0;
    // Trivial read used as a connectivity probe.
    virtual std::expected<std::monostate, Error> ping() const = 0;
};

} // namespace zledger

#endif // ZLEDGER_STORAGE_LEDGER_STORE_HPP
