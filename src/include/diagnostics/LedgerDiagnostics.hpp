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

#ifndef ZLEDGER_DIAGNOSTICS_LEDGER_DIAGNOSTICS_HPP
#define ZLEDGER_DIAGNOSTICS_LEDGER_DIAGNOSTICS_HPP

#include "lock/LockManager.hpp"
#include "storage/LedgerStore.hpp"
#include "common/Amount.hpp"
#include "common/Config.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <chrono>
#include <expected>
#include <vector>

namespace zledger {

// Read-only views of the ledger. Nothing here takes account locks or reserves
// anything; answers are advisory and may be stale by the time they arrive.
// Store reads follow the configured read retry policy.
class LedgerDiagnostics {
public:
    LedgerDiagnostics(
        const LedgerStore& s,
        const LockManager& l,
        EngineConfig c = EngineConfig {});

    // Missing accounts are reported in the result, not as an error.
    std::expected<TransferPreconditions, Error> validateTransferPreconditions(
        const AccountNumber& from,
        const AccountNumber& to,
        const Amount& amount) const;
    std::expected<ConcurrencyStatus, Error> concurrencyStatus(const AccountNumber& account) const;
    StoreHealth storeHealth() const;
    std::vector<AccountNumber> heldLocks() const;
private:
    std::expected<AccountCheck, Error> check(const AccountNumber& account) const;

    const LedgerStore& store;
    const LockManager& locks;
    const EngineConfig cfg;
};

} // namespace zledger

#endif // ZLEDGER_DIAGNOSTICS_LEDGER_DIAGNOSTICS_HPP
