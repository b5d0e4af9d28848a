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

#ifndef ZLEDGER_TST_STORAGE_FAULT_INJECTING_STORE_HPP
#define ZLEDGER_TST_STORAGE_FAULT_INJECTING_STORE_HPP

#include "storage/LedgerStore.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <atomic>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

// Wraps a real store and fails chosen operations on demand.
class FaultInjectingStore : public zledger::LedgerStore {
public:
    explicit FaultInjectingStore(zledger::LedgerStore& s) : inner {s} {}

    // The next n commits fail with TransientStoreFailure without applying anything.
    void failCommits(int n) {
        transientCommits = n;
    }

    // The next n commits throw std::runtime_error without applying anything.
    void throwOnCommits(int n) {
        throwingCommits = n;
    }

    // The next n commits report a failure the engine has no category for.
    void breakCommits(int n) {
        brokenCommits = n;
    }

    // The next n account lookups or transaction counts fail with TransientStoreFailure.
    void failReads(int n) {
        transientReads = n;
    }

    void failPing(bool fail) {
        pingFails = fail;
    }

    [[nodiscard]] int commitAttempts() const {
        return attempts.load();
    }

    std::expected<std::unique_ptr<zledger::StoreSession>, zledger::Error> begin() override {
        auto session = inner.begin();
        if (!session.has_value()) {
            return std::unexpected {session.error()};
        }
        return std::make_unique<Session>(*this, std::move(session.value()));
    }

    std::expected<zledger::Account, zledger::Error> createAccount(const zledger::AccountNumber& account) override {
        return inner.createAccount(account);
    }

    std::expected<std::optional<zledger::Account>, zledger::Error> getAccount(const zledger::AccountNumber& account) const override {
        if (transientReads.fetch_sub(1) > 0) {
            return std::unexpected {readFailure()};
        }
        return inner.getAccount(account);
    }

    std::expected<std::vector<zledger::TransactionRecord>, zledger::Error> history(const zledger::AccountNumber& account, size_t limit) const override {
        return inner.history(account, limit);
    }

    std::expected<size_t, zledger::Error> countTransactionsSince(const zledger::AccountNumber& account, const zledger::Timestamp& since) const override {
        if (transientReads.fetch_sub(1) > 0) {
            return std::unexpected {readFailure()};
        }
        return inner.countTransactionsSince(account, since);
    }

    std::expected<std::monostate, zledger::Error> ping() const override {
        if (pingFails.load()) {
            return std::unexpected {zledger::Error {zledger::ErrorCode::TransientStoreFailure, "connection refused"}};
        }
        return inner.ping();
    }

private:
    static zledger::Error readFailure() {
        return zledger::Error {zledger::ErrorCode::TransientStoreFailure, "read timed out"};
    }

    class Session : public zledger::StoreSession {
    public:
        Session(FaultInjectingStore& s, std::unique_ptr<zledger::StoreSession> i)
            : store {s}, inner {std::move(i)} {}

        std::expected<std::optional<zledger::Account>, zledger::Error> findAccount(const zledger::AccountNumber& account) override {
            return inner->findAccount(account);
        }

        std::expected<std::monostate, zledger::Error> updateBalance(const zledger::AccountNumber& account, const zledger::Amount& balance) override {
            return inner->updateBalance(account, balance);
        }

        std::expected<std::monostate, zledger::Error> appendTransaction(const zledger::PendingTransaction& transaction) override {
            return inner->appendTransaction(transaction);
        }

        std::expected<zledger::CommitReceipt, zledger::Error> commit() override {
            store.attempts.fetch_add(1);
            if (store.transientCommits.fetch_sub(1) > 0) {
                inner->rollback();
                return std::unexpected {zledger::Error {zledger::ErrorCode::TransientStoreFailure, "connection reset by peer"}};
            }
            if (store.throwingCommits.fetch_sub(1) > 0) {
                inner->rollback();
                throw std::runtime_error("driver crashed");
            }
            if (store.brokenCommits.fetch_sub(1) > 0) {
                inner->rollback();
                return std::unexpected {zledger::Error {zledger::ErrorCode::Unknown, "protocol desync"}};
            }
            return inner->commit();
        }

        void rollback() noexcept override {
            inner->rollback();
        }

    private:
        FaultInjectingStore& store;
        std::unique_ptr<zledger::StoreSession> inner;
    };

    zledger::LedgerStore& inner;
    std::atomic<int> transientCommits {0};
    std::atomic<int> throwingCommits {0};
    std::atomic<int> brokenCommits {0};
    std::atomic<int> attempts {0};
    mutable std::atomic<int> transientReads {0};
    std::atomic<bool> pingFails {false};
};

#endif // ZLEDGER_TST_STORAGE_FAULT_INJECTING_STORE_HPP
