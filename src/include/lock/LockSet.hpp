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

#ifndef ZLEDGER_LOCK_LOCK_SET_HPP
#define ZLEDGER_LOCK_LOCK_SET_HPP

#include "lock/LockManager.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <chrono>
#include <expected>
#include <vector>

namespace zledger {

// Account locks held together for one mutation. Accounts are always taken in
// ascending lexicographic order whatever order the caller lists them in, so
// any two sets over the same accounts lock them in the same sequence.
// Destruction releases in reverse acquisition order.
class LockSet {
public:
    static std::expected<LockSet, Error> acquire(
        LockManager& manager,
        std::vector<AccountNumber> accounts,
        std::chrono::milliseconds timeout);

    LockSet(LockSet&& other) noexcept;
    LockSet& operator=(LockSet&&) = delete;
    LockSet(const LockSet&) = delete;
    LockSet& operator=(const LockSet&) = delete;
    ~LockSet();

    [[nodiscard]] const std::vector<AccountNumber>& accounts() const;
private:
    LockSet(LockManager& m, std::vector<AccountNumber> held);
    LockManager* manager;
    std::vector<AccountNumber> held;
};

// Sorted, de-duplicated acquisition order for a set of accounts.
std::vector<AccountNumber> lockOrder(std::vector<AccountNumber> accounts);

} // namespace zledger

#endif // ZLEDGER_LOCK_LOCK_SET_HPP
