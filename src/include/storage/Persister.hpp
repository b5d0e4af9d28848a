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

#ifndef ZLEDGER_STORAGE_PERSISTER_HPP
#define ZLEDGER_STORAGE_PERSISTER_HPP

#include "common/Error.hpp"
#include "common/Types.hpp"
#include <expected>
#include <optional>
#include <variant>
#include <vector>

namespace zledger {

struct LedgerState {
    std::vector<Account> accounts;
    // In id order.
    std::vector<TransactionRecord> transactions;
    TransactionId nextTransactionId = 1;
};

class Persister {
public:
    virtual ~Persister() = default;
    // nullopt when nothing has been saved yet.
    virtual std::expected<std::optional<LedgerState>, Error> load() = 0;
    virtual std::expected<std::monostate, Error> save(const LedgerState& state) = 0;
};

} // namespace zledger

#endif // ZLEDGER_STORAGE_PERSISTER_HPP
