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

#include "common/Types.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace zledger {

int64_t toMicros(const Timestamp& t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

Timestamp fromMicros(const int64_t micros) {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds{micros})};
}

std::string toString(const TransactionKind& kind) {
    switch (kind) {
        case TransactionKind::Deposit: return "deposit";
        case TransactionKind::Withdrawal: return "withdrawal";
        case TransactionKind::Transfer: return "transfer";
    }
    std::unreachable();
}

} // namespace zledger
