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

#ifndef ZLEDGER_ENGINE_LEDGER_ENGINE_HPP
#define ZLEDGER_ENGINE_LEDGER_ENGINE_HPP

#include "engine/AccountNumberGenerator.hpp"
#include "lock/LockManager.hpp"
#include "storage/LedgerStore.hpp"
#include "common/Amount.hpp"
#include "common/Config.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <cstddef>
#include <expected>
#include <variant>
#include <vector>

namespace zledger {

// Applies balance-changing operations to the store. Each mutation runs as
//
//   retry(transient store failures) -> account locks -> atomic session
//
// so writers of the same account are serialized by its lock, and every
// balance change is committed together with its transaction row or not at
// all. Business rejections are never retried.
class LedgerEngine {
public:
    LedgerEngine(LedgerStore& s, LockManager& l, AccountNumberGenerator& g, EngineConfig c = EngineConfig {});

    std::expected<Account, Error> openAccount();
    std::expected<Account, Error> openAccount(const AccountNumber& account);

    std::expected<DepositResult, Error> deposit(const AccountNumber& account, const Amount& amount);
    // Locks both accounts in lexicographic order, whichever way the money flows.
    std::expected<TransferResult, Error> transfer(const AccountNumber& from, const AccountNumber& to, const Amount& amount);

    std::expected<Account, Error> getAccount(const AccountNumber& account) const;
    std::expected<Amount, Error> getBalance(const AccountNumber& account) const;
    // Most recent first. limit must be positive; values above the configured
    // cap are clamped to it.
    std::expected<std::vector<TransactionRecord>, Error> getHistory(const AccountNumber& account, size_t limit) const;

    [[nodiscard]] const EngineConfig& config() const;
private:
    std::expected<std::monostate, Error> checkAmount(const Amount& amount) const;

    LedgerStore& store;
    LockManager& lockManager;
    AccountNumberGenerator& numbers;
    const EngineConfig cfg;
};

} // namespace zledger

#endif // ZLEDGER_ENGINE_LEDGER_ENGINE_HPP
