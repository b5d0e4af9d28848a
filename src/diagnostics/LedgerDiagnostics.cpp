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

#include "diagnostics/LedgerDiagnostics.hpp"
#include "lock/LockManager.hpp"
#include "storage/LedgerStore.hpp"
#include "common/Amount.hpp"
#include "common/Config.hpp"
#include "common/Error.hpp"
#include "common/Repeater.hpp"
#include "common/Types.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <optional>
#include <utility>
#include <vector>

namespace zledger {

LedgerDiagnostics::LedgerDiagnostics(
    const LedgerStore& s,
    const LockManager& l,
    EngineConfig c)
    : store {s}, locks {l}, cfg {std::move(c)} {}

std::expected<AccountCheck, Error> LedgerDiagnostics::check(const AccountNumber& account) const {
    AccountCheck c;
    c.number = account;
    auto found = withRetry(cfg.readPolicy, "validateTransfer", [&]() { return store.getAccount(account); });
    if (!found.has_value()) {
        return std::unexpected {found.error()};
    }
    if (found->has_value()) {
        c.exists = true;
        c.balance = found->value().balance;
    }
    c.locked = locks.isLocked(account);
    return c;
}

std::expected<TransferPreconditions, Error> LedgerDiagnostics::validateTransferPreconditions(
    const AccountNumber& from,
    const AccountNumber& to,
    const Amount& amount) const {
    TransferPreconditions report;
    report.amount = amount;
    auto source = check(from);
    if (!source.has_value()) {
        return std::unexpected {source.error()};
    }
    auto target = check(to);
    if (!target.has_value()) {
        return std::unexpected {target.error()};
    }
    report.from = source.value();
    report.to = target.value();
    report.sameAccount = from == to;
    report.amountValid = amount.positive() && amount <= cfg.maxAmount;
    report.sufficientFunds = report.from.exists && report.from.balance >= amount;

    if (!report.from.exists) {
        report.problems.push_back("Source account " + from + " not found");
    }
    if (!report.to.exists) {
        report.problems.push_back("Destination account " + to + " not found");
    }
    if (report.sameAccount) {
        report.problems.push_back("Cannot transfer to the same account");
    }
    if (!report.amountValid) {
        report.problems.push_back("Amount must be between 0.01 and " + cfg.maxAmount.toString());
    }
    if (report.from.exists && !report.sufficientFunds) {
        report.problems.push_back("Insufficient balance. Available: " + report.from.balance.toString() + ", Required: " + amount.toString());
    }
    report.valid = report.problems.empty();
    return report;
}

std::expected<ConcurrencyStatus, Error> LedgerDiagnostics::concurrencyStatus(const AccountNumber& account) const {
    return withRetry(cfg.readPolicy, "concurrencyStatus", [&]() -> std::expected<ConcurrencyStatus, Error> {
        auto found = store.getAccount(account);
        if (!found.has_value()) {
            return std::unexpected {found.error()};
        }
        if (!found->has_value()) {
            return std::unexpected {accountNotFound(account)};
        }
        const auto since = std::chrono::system_clock::now() - cfg.recentWindow;
        auto count = store.countTransactionsSince(account, since);
        if (!count.has_value()) {
            return std::unexpected {count.error()};
        }
        return ConcurrencyStatus {account, count.value(), cfg.recentWindow, locks.isLocked(account)};
    });
}

StoreHealth LedgerDiagnostics::storeHealth() const {
    const auto start = std::chrono::steady_clock::now();
    auto probe = store.ping();
    const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    if (!probe.has_value()) {
        spdlog::warn("LedgerDiagnostics: store probe failed: {}", probe.error().what);
        return StoreHealth {false, latency, probe.error().what};
    }
    return StoreHealth {true, latency, "ok"};
}

std::vector<AccountNumber> LedgerDiagnostics::heldLocks() const {
    return locks.heldLocks();
}

} // namespace zledger
