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

#include "engine/LedgerEngine.hpp"
#include "engine/AccountNumberGenerator.hpp"
#include "engine/AtomicScope.hpp"
#include "lock/LockManager.hpp"
#include "lock/LockSet.hpp"
#include "storage/LedgerStore.hpp"
#include "common/Amount.hpp"
#include "common/Config.hpp"
#include "common/Error.hpp"
#include "common/Repeater.hpp"
#include "common/Types.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstddef>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace zledger {

namespace {

void report(const std::string& op, const AccountNumber& account, const Error& error) {
    if (isBusinessError(error.code)) {
        spdlog::warn("LedgerEngine: {} on {} rejected: {} - {}", op, account, toString(error.code), error.what);
    } else {
        spdlog::error("LedgerEngine: {} on {} failed: {} - {}", op, account, toString(error.code), error.what);
    }
}

// Last line of defence: anything thrown below becomes an Internal error
// whose message says nothing about the cause.
template<typename F, typename R = std::invoke_result_t<F&>>
R guarded(const std::string& op, const AccountNumber& account, F&& f) {
    try {
        R result = f();
        if (!result.has_value()) {
            report(op, account, result.error());
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::error("LedgerEngine: {} on {} failed unexpectedly: {}", op, account, e.what());
        return std::unexpected {Error {ErrorCode::Internal, "Unexpected failure during " + op}};
    }
}

std::expected<Account, Error> existing(StoreSession& session, const AccountNumber& account) {
    auto found = session.findAccount(account);
    if (!found.has_value()) {
        return std::unexpected {found.error()};
    }
    if (!found->has_value()) {
        return std::unexpected {accountNotFound(account)};
    }
    return std::move(found->value());
}

Error overflow(const AccountNumber& account) {
    return Error {ErrorCode::IntegrityViolation, "Numeric overflow in balance of account " + account, account};
}

} // namespace

LedgerEngine::LedgerEngine(LedgerStore& s, LockManager& l, AccountNumberGenerator& g, EngineConfig c)
    : store {s}, lockManager {l}, numbers {g}, cfg {std::move(c)} {}

const EngineConfig& LedgerEngine::config() const {
    return cfg;
}

std::expected<std::monostate, Error> LedgerEngine::checkAmount(const Amount& amount) const {
    if (!amount.positive()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Amount must be positive, got " + amount.toString()}};
    }
    if (amount > cfg.maxAmount) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Amount " + amount.toString() + " exceeds the limit of " + cfg.maxAmount.toString()}};
    }
    return {};
}

std::expected<Account, Error> LedgerEngine::openAccount() {
    return guarded("openAccount", "<new>", [this]() {
        return withRetry(cfg.mutatingPolicy, "openAccount", [this]() -> std::expected<Account, Error> {
            auto number = numbers.next();
            if (!number.has_value()) {
                return std::unexpected {number.error()};
            }
            auto account = store.createAccount(number.value());
            if (account.has_value()) {
                spdlog::info("LedgerEngine: opened account {}", account->number);
            }
            return account;
        });
    });
}

std::expected<Account, Error> LedgerEngine::openAccount(const AccountNumber& account) {
    return guarded("openAccount", account, [this, &account]() {
        return withRetry(cfg.mutatingPolicy, "createAccount", [this, &account]() -> std::expected<Account, Error> {
            auto created = store.createAccount(account);
            if (created.has_value()) {
                spdlog::info("LedgerEngine: opened account {}", account);
            }
            return created;
        });
    });
}

std::expected<DepositResult, Error> LedgerEngine::deposit(const AccountNumber& account, const Amount& amount) {
    return guarded("deposit", account, [&]() -> std::expected<DepositResult, Error> {
        if (auto valid = checkAmount(amount); !valid.has_value()) {
            return std::unexpected {valid.error()};
        }
        return withRetry(cfg.mutatingPolicy, "deposit", [&]() -> std::expected<DepositResult, Error> {
            auto held = LockSet::acquire(lockManager, {account}, cfg.lockTimeout);
            if (!held.has_value()) {
                return std::unexpected {held.error()};
            }
            auto committed = atomically(store, "deposit", [&](StoreSession& session) -> std::expected<DepositResult, Error> {
                auto target = existing(session, account);
                if (!target.has_value()) {
                    return std::unexpected {target.error()};
                }
                auto balance = target->balance.checkedAdd(amount);
                if (!balance.has_value()) {
                    return std::unexpected {overflow(account)};
                }
                if (auto u = session.updateBalance(account, balance.value()); !u.has_value()) {
                    return std::unexpected {u.error()};
                }
                if (auto t = session.appendTransaction({std::nullopt, account, amount, TransactionKind::Deposit}); !t.has_value()) {
                    return std::unexpected {t.error()};
                }
                return DepositResult {account, balance.value(), amount, 0};
            });
            if (!committed.has_value()) {
                return std::unexpected {committed.error()};
            }
            auto result = std::move(committed->value);
            result.transactionId = committed->receipt.transactionIds.front();
            spdlog::info("LedgerEngine: deposited {} to {}, balance {}", amount.toString(), account, result.newBalance.toString());
            return result;
        });
    });
}

std::expected<TransferResult, Error> LedgerEngine::transfer(const AccountNumber& from, const AccountNumber& to, const Amount& amount) {
    return guarded("transfer", from, [&]() -> std::expected<TransferResult, Error> {
        if (from == to) {
            return std::unexpected {Error {ErrorCode::SameAccount, "Cannot transfer to the same account", from}};
        }
        if (auto valid = checkAmount(amount); !valid.has_value()) {
            return std::unexpected {valid.error()};
        }
        const auto transferId = uuid_v7_to_hex(generate_uuid_v7());
        return withRetry(cfg.mutatingPolicy, "transfer", [&]() -> std::expected<TransferResult, Error> {
            auto held = LockSet::acquire(lockManager, {from, to}, cfg.lockTimeout);
            if (!held.has_value()) {
                return std::unexpected {held.error()};
            }
            auto committed = atomically(store, "transfer", [&](StoreSession& session) -> std::expected<TransferResult, Error> {
                auto source = existing(session, from);
                if (!source.has_value()) {
                    return std::unexpected {source.error()};
                }
                auto target = existing(session, to);
                if (!target.has_value()) {
                    return std::unexpected {target.error()};
                }
                // Read under both locks; the commit re-checks the row versions
                // and the non-negative balance constraint, which catches any
                // writer that bypassed the locks.
                if (source->balance < amount) {
                    return std::unexpected {insufficientFunds(from, source->balance, amount)};
                }
                const auto fromBalance = source->balance - amount;
                const auto toBalance = target->balance.checkedAdd(amount);
                if (!toBalance.has_value()) {
                    return std::unexpected {overflow(to)};
                }
                if (auto u = session.updateBalance(from, fromBalance); !u.has_value()) {
                    return std::unexpected {u.error()};
                }
                if (auto u = session.updateBalance(to, toBalance.value()); !u.has_value()) {
                    return std::unexpected {u.error()};
                }
                if (auto t = session.appendTransaction({from, to, amount, TransactionKind::Transfer}); !t.has_value()) {
                    return std::unexpected {t.error()};
                }
                return TransferResult {transferId, from, to, amount, fromBalance, toBalance.value(), 0};
            });
            if (!committed.has_value()) {
                return std::unexpected {committed.error()};
            }
            auto result = std::move(committed->value);
            result.transactionId = committed->receipt.transactionIds.front();
            spdlog::info("LedgerEngine: transfer {} moved {} from {} to {}", transferId, amount.toString(), from, to);
            return result;
        });
    });
}

std::expected<Account, Error> LedgerEngine::getAccount(const AccountNumber& account) const {
    return guarded("getAccount", account, [&]() {
        return withRetry(cfg.readPolicy, "getAccount", [&]() -> std::expected<Account, Error> {
            auto found = store.getAccount(account);
            if (!found.has_value()) {
                return std::unexpected {found.error()};
            }
            if (!found->has_value()) {
                return std::unexpected {accountNotFound(account)};
            }
            return std::move(found->value());
        });
    });
}

std::expected<Amount, Error> LedgerEngine::getBalance(const AccountNumber& account) const {
    return guarded("getBalance", account, [&]() {
        return withRetry(cfg.readPolicy, "getBalance", [&]() -> std::expected<Amount, Error> {
            auto found = store.getAccount(account);
            if (!found.has_value()) {
                return std::unexpected {found.error()};
            }
            if (!found->has_value()) {
                return std::unexpected {accountNotFound(account)};
            }
            return found->value().balance;
        });
    });
}

std::expected<std::vector<TransactionRecord>, Error> LedgerEngine::getHistory(const AccountNumber& account, size_t limit) const {
    return guarded("getHistory", account, [&]() -> std::expected<std::vector<TransactionRecord>, Error> {
        if (limit == 0) {
            return std::unexpected {Error {ErrorCode::InvalidArg, "History limit must be > zero"}};
        }
        const auto capped = std::min(limit, cfg.maxHistoryLimit);
        return withRetry(cfg.readPolicy, "getHistory", [&]() -> std::expected<std::vector<TransactionRecord>, Error> {
            auto found = store.getAccount(account);
            if (!found.has_value()) {
                return std::unexpected {found.error()};
            }
            if (!found->has_value()) {
                return std::unexpected {accountNotFound(account)};
            }
            return store.history(account, capped);
        });
    });
}

} // namespace zledger
