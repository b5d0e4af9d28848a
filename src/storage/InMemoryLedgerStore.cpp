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

#include "storage/InMemoryLedgerStore.hpp"
#include "storage/LedgerStore.hpp"
#include "storage/Persister.hpp"
#include "common/Amount.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace zledger {

class InMemoryLedgerStore::Session : public StoreSession {
public:
    explicit Session(InMemoryLedgerStore& s) : store {s} {}
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    ~Session() override {
        if (open) {
            rollback();
        }
    }

    std::expected<std::optional<Account>, Error> findAccount(const AccountNumber& account) override {
        if (auto o = ensureOpen(); !o.has_value()) {
            return std::unexpected {o.error()};
        }
        auto i = read.find(account);
        if (i == read.end()) {
            const std::shared_lock lock {store.m};
            auto row = store.accountTable.find(account);
            if (row == store.accountTable.end()) {
                return std::nullopt;
            }
            i = read.emplace(account, row->second).first;
        }
        Account a = i->second;
        if (auto s = staged.find(account); s != staged.end()) {
            a.balance = s->second;
        }
        return a;
    }

    std::expected<std::monostate, Error> updateBalance(const AccountNumber& account, const Amount& balance) override {
        auto a = findAccount(account);
        if (!a.has_value()) {
            return std::unexpected {a.error()};
        }
        if (!a->has_value()) {
            return std::unexpected {accountNotFound(account)};
        }
        staged.insert_or_assign(account, balance);
        return {};
    }

    std::expected<std::monostate, Error> appendTransaction(const PendingTransaction& transaction) override {
        if (auto o = ensureOpen(); !o.has_value()) {
            return std::unexpected {o.error()};
        }
        pending.push_back(transaction);
        return {};
    }

    std::expected<CommitReceipt, Error> commit() override {
        if (auto o = ensureOpen(); !o.has_value()) {
            return std::unexpected {o.error()};
        }
        open = false;
        const std::unique_lock lock {store.m};
        for (const auto& [number, seen] : read) {
            auto row = store.accountTable.find(number);
            if (row == store.accountTable.end() || row->second.version != seen.version) {
                spdlog::warn("InMemoryLedgerStore: account {} changed since it was read (version {})", number, seen.version);
                return std::unexpected {Error {ErrorCode::TransientStoreFailure, "Account " + number + " was modified concurrently", number}};
            }
        }
        const auto now = std::chrono::system_clock::now();
        std::vector<Account> changed;
        changed.reserve(staged.size());
        for (const auto& [number, balance] : staged) {
            if (balance.negative()) {
                return std::unexpected {Error {ErrorCode::IntegrityViolation, "CHECK constraint failed: balance >= 0 for account " + number, number}};
            }
            Account a = store.accountTable.at(number);
            a.balance = balance;
            a.updatedAt = now;
            ++a.version;
            changed.push_back(std::move(a));
        }
        std::vector<TransactionRecord> appended;
        appended.reserve(pending.size());
        auto id = store.nextTransactionId;
        for (const auto& p : pending) {
            if (!p.amount.positive()) {
                return std::unexpected {Error {ErrorCode::IntegrityViolation, "CHECK constraint failed: amount > 0", p.to}};
            }
            if (!store.accountTable.contains(p.to)) {
                return std::unexpected {Error {ErrorCode::IntegrityViolation, "FOREIGN KEY constraint failed: to_account " + p.to, p.to}};
            }
            if (p.from.has_value() && !store.accountTable.contains(p.from.value())) {
                return std::unexpected {Error {ErrorCode::IntegrityViolation, "FOREIGN KEY constraint failed: from_account " + p.from.value(), p.from.value()}};
            }
            appended.push_back(TransactionRecord {id++, p.from, p.to, p.amount, p.kind, now});
        }
        CommitReceipt receipt {{}, now};
        if (changed.empty() && appended.empty()) {
            return receipt;
        }
        if (auto saved = store.persist(changed, appended); !saved.has_value()) {
            return std::unexpected {saved.error()};
        }
        store.apply(changed, appended);
        for (const auto& t : appended) {
            receipt.transactionIds.push_back(t.id);
        }
        return receipt;
    }

    void rollback() noexcept override {
        open = false;
        staged.clear();
        pending.clear();
        read.clear();
    }

private:
    std::expected<std::monostate, Error> ensureOpen() const {
        if (!open) {
            return std::unexpected {Error {ErrorCode::Internal, "Session is already finished"}};
        }
        return {};
    }

    InMemoryLedgerStore& store;
    // Rows as first read by this session; their versions are checked at commit.
    std::unordered_map<AccountNumber, Account> read;
    std::unordered_map<AccountNumber, Amount> staged;
    std::vector<PendingTransaction> pending;
    bool open {true};
};

InMemoryLedgerStore::InMemoryLedgerStore() = default;

InMemoryLedgerStore::InMemoryLedgerStore(Persister& p) : persister {&p} {
    auto loaded = persister->load();
    if (!loaded.has_value()) {
        throw std::runtime_error("Failed to load ledger: " + loaded.error().what);
    }
    if (!loaded->has_value()) {
        return;
    }
    auto& state = loaded->value();
    std::vector<Account> rows {std::move(state.accounts)};
    std::vector<TransactionRecord> log {std::move(state.transactions)};
    apply(rows, log);
    nextTransactionId = std::max(nextTransactionId, state.nextTransactionId);
}

std::expected<std::unique_ptr<StoreSession>, Error> InMemoryLedgerStore::begin() {
    return std::make_unique<Session>(*this);
}

std::expected<Account, Error> InMemoryLedgerStore::createAccount(const AccountNumber& account) {
    if (account.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Account number must not be empty"}};
    }
    const std::unique_lock lock {m};
    if (accountTable.contains(account)) {
        return std::unexpected {Error {ErrorCode::IntegrityViolation, "UNIQUE constraint failed: account number " + account + " already exists", account}};
    }
    const auto now = std::chrono::system_clock::now();
    Account a {account, Amount::zero(), now, now, 1};
    if (auto saved = persist({a}, {}); !saved.has_value()) {
        return std::unexpected {saved.error()};
    }
    apply({a}, {});
    return a;
}

std::expected<std::optional<Account>, Error> InMemoryLedgerStore::getAccount(const AccountNumber& account) const {
    const std::shared_lock lock {m};
    auto i = accountTable.find(account);
    if (i == accountTable.end()) {
        return std::nullopt;
    }
    return i->second;
}

std::expected<std::vector<TransactionRecord>, Error> InMemoryLedgerStore::history(const AccountNumber& account, size_t limit) const {
    const std::shared_lock lock {m};
    std::vector<TransactionRecord> records;
    auto i = byAccount.find(account);
    if (i == byAccount.end()) {
        return records;
    }
    for (auto position : std::views::reverse(i->second)) {
        if (records.size() >= limit) {
            break;
        }
        records.push_back(transactionTable[position]);
    }
    return records;
}

std::expected<size_t, Error> InMemoryLedgerStore::countTransactionsSince(const AccountNumber& account, const Timestamp& since) const {
    const std::shared_lock lock {m};
    auto i = byAccount.find(account);
    if (i == byAccount.end()) {
        return 0;
    }
    size_t count = 0;
    for (auto position : std::views::reverse(i->second)) {
        if (transactionTable[position].createdAt < since) {
            break;
        }
        ++count;
    }
    return count;
}

std::expected<std::monostate, Error> InMemoryLedgerStore::ping() const {
    const std::shared_lock lock {m};
    return {};
}

std::expected<Account, Error> InMemoryLedgerStore::setBalance(const AccountNumber& account, const Amount& balance) {
    const std::unique_lock lock {m};
    auto i = accountTable.find(account);
    if (i == accountTable.end()) {
        return std::unexpected {accountNotFound(account)};
    }
    if (balance.negative()) {
        return std::unexpected {Error {ErrorCode::IntegrityViolation, "CHECK constraint failed: balance >= 0 for account " + account, account}};
    }
    Account a = i->second;
    a.balance = balance;
    a.updatedAt = std::chrono::system_clock::now();
    ++a.version;
    if (auto saved = persist({a}, {}); !saved.has_value()) {
        return std::unexpected {saved.error()};
    }
    apply({a}, {});
    spdlog::warn("InMemoryLedgerStore: balance of {} set directly to {}", account, balance.toString());
    return a;
}

std::vector<Account> InMemoryLedgerStore::accounts() const {
    const std::shared_lock lock {m};
    std::vector<Account> rows;
    rows.reserve(accountTable.size());
    for (const auto& [number, a] : accountTable) {
        rows.push_back(a);
    }
    std::ranges::sort(rows, {}, &Account::number);
    return rows;
}

size_t InMemoryLedgerStore::transactionCount() const {
    const std::shared_lock lock {m};
    return transactionTable.size();
}

LedgerState InMemoryLedgerStore::stateWith(
    const std::vector<Account>& changed,
    const std::vector<TransactionRecord>& appended) const {
    auto rows = accountTable;
    for (const auto& a : changed) {
        rows.insert_or_assign(a.number, a);
    }
    LedgerState state;
    state.accounts.reserve(rows.size());
    for (auto& [number, a] : rows) {
        state.accounts.push_back(std::move(a));
    }
    std::ranges::sort(state.accounts, {}, &Account::number);
    state.transactions = transactionTable;
    state.transactions.insert(state.transactions.end(), appended.begin(), appended.end());
    state.nextTransactionId = appended.empty() ? nextTransactionId : appended.back().id + 1;
    return state;
}

std::expected<std::monostate, Error> InMemoryLedgerStore::persist(
    const std::vector<Account>& changed,
    const std::vector<TransactionRecord>& appended) const {
    if (persister == nullptr) {
        return {};
    }
    auto saved = persister->save(stateWith(changed, appended));
    if (!saved.has_value()) {
        spdlog::warn("InMemoryLedgerStore: persist failed: {}", saved.error().what);
    }
    return saved;
}

void InMemoryLedgerStore::apply(const std::vector<Account>& changed, const std::vector<TransactionRecord>& appended) {
    for (const auto& a : changed) {
        accountTable.insert_or_assign(a.number, a);
    }
    for (const auto& t : appended) {
        const auto position = transactionTable.size();
        byAccount[t.to].push_back(position);
        if (t.from.has_value() && t.from.value() != t.to) {
            byAccount[t.from.value()].push_back(position);
        }
        transactionTable.push_back(t);
        nextTransactionId = std::max(nextTransactionId, t.id + 1);
    }
}

} // namespace zledger
