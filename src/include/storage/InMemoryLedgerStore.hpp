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

#ifndef ZLEDGER_STORAGE_IN_MEMORY_LEDGER_STORE_HPP
#define ZLEDGER_STORAGE_IN_MEMORY_LEDGER_STORE_HPP

#include "storage/LedgerStore.hpp"
#include "storage/Persister.hpp"
#include "common/Amount.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <variant>
#include <vector>

namespace zledger {

// Account and transaction tables behind a shared mutex. Commits check the
// constraints a relational schema would (non-negative balances, transaction
// rows referencing existing accounts, positive amounts) together with the row
// versions each session read, and apply all staged writes or none.
//
// With a Persister, every change is saved before it is applied in memory.
class InMemoryLedgerStore : public LedgerStore {
public:
    InMemoryLedgerStore();
    // Loads the persisted state; throws std::runtime_error if it cannot.
    explicit InMemoryLedgerStore(Persister& p);

    std::expected<std::unique_ptr<StoreSession>, Error> begin() override;
    std::expected<Account, Error> createAccount(const AccountNumber& account) override;
    std::expected<std::optional<Account>, Error> getAccount(const AccountNumber& account) const override;
    std::expected<std::vector<TransactionRecord>, Error> history(const AccountNumber& account, size_t limit) const override;
    std::expected<size_t, Error> countTransactionsSince(const AccountNumber& account, const Timestamp& since) const override;
    std::expected<std::monostate, Error> ping() const override;

    // Direct write that bypasses sessions, as an administrator editing the
    // table would. Bumps the row version.
    std::expected<Account, Error> setBalance(const AccountNumber& account, const Amount& balance);

    std::vector<Account> accounts() const;
    size_t transactionCount() const;
private:
    class Session;

    LedgerState stateWith(
        const std::vector<Account>& changed,
        const std::vector<TransactionRecord>& appended) const;
    std::expected<std::monostate, Error> persist(
        const std::vector<Account>& changed,
        const std::vector<TransactionRecord>& appended) const;
    void apply(const std::vector<Account>& changed, const std::vector<TransactionRecord>& appended);

    std::unordered_map<AccountNumber, Account> accountTable;
    std::vector<TransactionRecord> transactionTable;
    // Positions in transactionTable per account, ascending.
    std::unordered_map<AccountNumber, std::vector<size_t>> byAccount;
    TransactionId nextTransactionId {1};
    Persister* persister {nullptr};
    mutable std::shared_mutex m;
};

} // namespace zledger

#endif // ZLEDGER_STORAGE_IN_MEMORY_LEDGER_STORE_HPP
