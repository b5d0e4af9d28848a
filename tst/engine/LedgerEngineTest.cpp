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

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include "common/Amount.hpp"
#include "common/Config.hpp"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include "common/Types.hpp"
#include "engine/AccountNumberGenerator.hpp"
#include "engine/LedgerEngine.hpp"
#include "lock/LockManager.hpp"
#include "storage/InMemoryLedgerStore.hpp"
#include "storage/FaultInjectingStore.hpp"

using zledger::Amount;
using zledger::EngineConfig;
using zledger::ErrorCode;
using zledger::InMemoryLedgerStore;
using zledger::LedgerEngine;
using zledger::LockManager;
using zledger::RandomAccountNumberGenerator;
using zledger::RetryPolicy;
using zledger::TransactionKind;

namespace {

Amount cents(int64_t value) {
    return Amount::fromCents(value);
}

EngineConfig testConfig() {
    return EngineConfig {
        std::chrono::milliseconds{100L},
        RetryPolicy {std::chrono::microseconds{1000L}, std::chrono::microseconds{4000L}, 3},
        RetryPolicy {std::chrono::microseconds{1000L}, std::chrono::microseconds{4000L}, 2},
        5,
        3,
        std::chrono::seconds{60L},
        cents(100'000'000)
    };
}

} // namespace

class LedgerEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(engine.openAccount(x).has_value());
        ASSERT_TRUE(engine.openAccount(y).has_value());
    }

    Amount balanceOf(const std::string& account) const {
        return engine.getBalance(account).value();
    }

    const std::string x {"1000000001"};
    const std::string y {"1000000002"};
    InMemoryLedgerStore inner;
    FaultInjectingStore store {inner};
    LockManager locks;
    RandomAccountNumberGenerator numbers {inner};
    LedgerEngine engine {store, locks, numbers, testConfig()};
};

TEST_F(LedgerEngineTest, DepositCreditsAccount) {
    auto result = engine.deposit(x, cents(10000));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->account, x);
    EXPECT_EQ(result->newBalance, cents(10000));
    EXPECT_EQ(result->depositedAmount, cents(10000));
    EXPECT_EQ(balanceOf(x), cents(10000));

    auto history = engine.getHistory(x, 10);
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(history->size(), 1U);
    EXPECT_EQ(history->front().kind, TransactionKind::Deposit);
    EXPECT_EQ(history->front().amount, cents(10000));
    EXPECT_FALSE(history->front().from.has_value());
    EXPECT_EQ(history->front().id, result->transactionId);
    EXPECT_FALSE(locks.isLocked(x));
}

TEST_F(LedgerEngineTest, TransferMovesFunds) {
    ASSERT_TRUE(engine.deposit(x, cents(10000)).has_value());
    auto result = engine.transfer(x, y, cents(4000));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->fromAccount, x);
    EXPECT_EQ(result->toAccount, y);
    EXPECT_EQ(result->amount, cents(4000));
    EXPECT_EQ(result->fromBalance, cents(6000));
    EXPECT_EQ(result->toBalance, cents(4000));
    EXPECT_EQ(result->transferId.size(), 36U);
    EXPECT_EQ(balanceOf(x), cents(6000));
    EXPECT_EQ(balanceOf(y), cents(4000));

    auto history = engine.getHistory(y, 10);
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(history->size(), 1U);
    EXPECT_EQ(history->front().kind, TransactionKind::Transfer);
    EXPECT_EQ(history->front().from, std::optional<std::string> {x});
    EXPECT_EQ(history->front().id, result->transactionId);
    EXPECT_EQ(inner.transactionCount(), 2U);
    EXPECT_TRUE(locks.heldLocks().empty());
}

TEST_F(LedgerEngineTest, EveryTransferGetsItsOwnId) {
    ASSERT_TRUE(engine.deposit(x, cents(200)).has_value());
    auto first = engine.transfer(x, y, cents(100));
    auto second = engine.transfer(x, y, cents(100));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->transferId, second->transferId);
    EXPECT_NE(first->transactionId, second->transactionId);
}

TEST_F(LedgerEngineTest, InsufficientFundsChangesNothing) {
    ASSERT_TRUE(engine.deposit(x, cents(5000)).has_value());
    const auto before = inner.transactionCount();
    auto result = engine.transfer(x, y, cents(10000));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InsufficientFunds);
    EXPECT_EQ(result.error().account, x);
    EXPECT_EQ(result.error().available, cents(5000));
    EXPECT_EQ(result.error().required, cents(10000));
    EXPECT_EQ(balanceOf(x), cents(5000));
    EXPECT_EQ(balanceOf(y), Amount::zero());
    EXPECT_EQ(inner.transactionCount(), before);
    EXPECT_EQ(store.commitAttempts(), 1);
}

TEST_F(LedgerEngineTest, ExactBalanceCanBeTransferred) {
    ASSERT_TRUE(engine.deposit(x, cents(5000)).has_value());
    auto result = engine.transfer(x, y, cents(5000));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->fromBalance, Amount::zero());
}

TEST_F(LedgerEngineTest, SameAccountFailsBeforeLocking) {
    auto result = engine.transfer(x, x, cents(1000));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::SameAccount);
    EXPECT_EQ(locks.size(), 0U);
    EXPECT_EQ(store.commitAttempts(), 0);
}

TEST_F(LedgerEngineTest, DepositToMissingAccountIsNotFound) {
    auto result = engine.deposit("9999999999", cents(1000));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::AccountNotFound);
    EXPECT_EQ(result.error().account, "9999999999");
    EXPECT_FALSE(locks.isLocked("9999999999"));
}

TEST_F(LedgerEngineTest, TransferWithMissingSideIsNotFound) {
    ASSERT_TRUE(engine.deposit(x, cents(1000)).has_value());
    auto toMissing = engine.transfer(x, "9999999999", cents(100));
    ASSERT_FALSE(toMissing.has_value());
    EXPECT_EQ(toMissing.error().code, ErrorCode::AccountNotFound);
    EXPECT_EQ(toMissing.error().account, "9999999999");
    auto fromMissing = engine.transfer("0000000000", x, cents(100));
    ASSERT_FALSE(fromMissing.has_value());
    EXPECT_EQ(fromMissing.error().code, ErrorCode::AccountNotFound);
    EXPECT_EQ(balanceOf(x), cents(1000));
}

TEST_F(LedgerEngineTest, RejectedRequestsLeaveNoLockEntries) {
    for (int i = 0; i < 200; ++i) {
        const auto n = std::to_string(i);
        auto deposit = engine.deposit("bogus" + n, cents(1));
        ASSERT_FALSE(deposit.has_value());
        EXPECT_EQ(deposit.error().code, ErrorCode::AccountNotFound);
        auto transfer = engine.transfer("ghostA" + n, "ghostB" + n, cents(1));
        ASSERT_FALSE(transfer.has_value());
        EXPECT_EQ(transfer.error().code, ErrorCode::AccountNotFound);
    }
    EXPECT_EQ(locks.size(), 0U);
    ASSERT_TRUE(engine.deposit(x, cents(100)).has_value());
    ASSERT_TRUE(engine.transfer(x, y, cents(50)).has_value());
    EXPECT_EQ(locks.size(), 0U);
}

TEST_F(LedgerEngineTest, AmountsOutsideRangeAreRejected) {
    for (const auto amount : {Amount::zero(), cents(-100), cents(100'000'001)}) {
        auto deposit = engine.deposit(x, amount);
        ASSERT_FALSE(deposit.has_value());
        EXPECT_EQ(deposit.error().code, ErrorCode::InvalidArg);
        auto transfer = engine.transfer(x, y, amount);
        ASSERT_FALSE(transfer.has_value());
        EXPECT_EQ(transfer.error().code, ErrorCode::InvalidArg);
    }
    EXPECT_TRUE(engine.deposit(x, cents(100'000'000)).has_value());
    EXPECT_EQ(inner.transactionCount(), 1U);
}

TEST_F(LedgerEngineTest, BalanceOverflowIsIntegrityViolation) {
    ASSERT_TRUE(inner.setBalance(x, cents(std::numeric_limits<int64_t>::max() - 5)).has_value());
    auto deposit = engine.deposit(x, cents(10));
    ASSERT_FALSE(deposit.has_value());
    EXPECT_EQ(deposit.error().code, ErrorCode::IntegrityViolation);
    EXPECT_EQ(store.commitAttempts(), 0);
    auto transfer = engine.transfer(x, y, cents(10));
    ASSERT_TRUE(transfer.has_value());
}

TEST_F(LedgerEngineTest, OpenAccountGeneratesNumbers) {
    auto opened = engine.openAccount();
    ASSERT_TRUE(opened.has_value());
    EXPECT_EQ(opened->number.size(), 10U);
    EXPECT_EQ(opened->balance, Amount::zero());
    EXPECT_EQ(balanceOf(opened->number), Amount::zero());
}

TEST_F(LedgerEngineTest, OpenAccountWithTakenNumberFails) {
    auto again = engine.openAccount(x);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::IntegrityViolation);
}

TEST_F(LedgerEngineTest, AccountLookupReturnsStoredRow) {
    ASSERT_TRUE(engine.deposit(x, cents(1234)).has_value());
    store.failReads(1);
    auto account = engine.getAccount(x);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account->number, x);
    EXPECT_EQ(account->balance, cents(1234));
    EXPECT_LE(account->createdAt, account->updatedAt);
    auto missing = engine.getAccount("9999999999");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::AccountNotFound);
    EXPECT_EQ(missing.error().account, "9999999999");
}

TEST_F(LedgerEngineTest, BalanceOfMissingAccountIsNotFound) {
    auto balance = engine.getBalance("9999999999");
    ASSERT_FALSE(balance.has_value());
    EXPECT_EQ(balance.error().code, ErrorCode::AccountNotFound);
}

TEST_F(LedgerEngineTest, HistoryLimits) {
    for (int64_t i = 1; i <= 7; ++i) {
        ASSERT_TRUE(engine.deposit(x, cents(i)).has_value());
    }
    auto two = engine.getHistory(x, 2);
    ASSERT_TRUE(two.has_value());
    ASSERT_EQ(two->size(), 2U);
    EXPECT_EQ(two->at(0).amount, cents(7));
    EXPECT_EQ(two->at(1).amount, cents(6));

    auto clamped = engine.getHistory(x, 1000);
    ASSERT_TRUE(clamped.has_value());
    EXPECT_EQ(clamped->size(), engine.config().maxHistoryLimit);

    auto zero = engine.getHistory(x, 0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, ErrorCode::InvalidArg);

    auto missing = engine.getHistory("9999999999", 10);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::AccountNotFound);

    auto empty = engine.getHistory(y, 10);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST_F(LedgerEngineTest, ReadsDoNotChangeState) {
    ASSERT_TRUE(engine.deposit(x, cents(4200)).has_value());
    const auto count = inner.transactionCount();
    const auto first = engine.getBalance(x);
    const auto second = engine.getBalance(x);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value(), second.value());
    const auto h1 = engine.getHistory(x, 10);
    const auto h2 = engine.getHistory(x, 10);
    ASSERT_TRUE(h1.has_value());
    ASSERT_TRUE(h2.has_value());
    ASSERT_EQ(h1->size(), h2->size());
    EXPECT_EQ(h1->front().id, h2->front().id);
    EXPECT_EQ(inner.transactionCount(), count);
    EXPECT_EQ(inner.getAccount(x)->value().version, 2U);
}

TEST_F(LedgerEngineTest, TransientCommitFailuresAreRetried) {
    ASSERT_TRUE(engine.deposit(x, cents(10000)).has_value());
    store.failCommits(2);
    auto result = engine.transfer(x, y, cents(2500));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(store.commitAttempts(), 4);
    EXPECT_EQ(balanceOf(x), cents(7500));
    EXPECT_EQ(balanceOf(y), cents(2500));
    EXPECT_EQ(inner.transactionCount(), 2U);
}

TEST_F(LedgerEngineTest, PersistentTransientFailureIsReported) {
    store.failCommits(3);
    auto result = engine.deposit(x, cents(100));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TransientStoreFailure);
    EXPECT_EQ(store.commitAttempts(), 3);
    EXPECT_EQ(balanceOf(x), Amount::zero());
    EXPECT_EQ(inner.transactionCount(), 0U);
    EXPECT_FALSE(locks.isLocked(x));
}

TEST_F(LedgerEngineTest, UnexpectedExceptionBecomesInternal) {
    store.throwOnCommits(1);
    auto result = engine.deposit(x, cents(100));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Internal);
    EXPECT_EQ(result.error().what.find("driver crashed"), std::string::npos);
    EXPECT_EQ(balanceOf(x), Amount::zero());
    EXPECT_FALSE(locks.isLocked(x));
    EXPECT_TRUE(engine.deposit(x, cents(100)).has_value());
}

TEST_F(LedgerEngineTest, LockHeldElsewhereTimesOut) {
    std::atomic<bool> holding {false};
    std::atomic<bool> done {false};
    std::thread holder([&]() {
        if (locks.acquire(y, std::chrono::seconds{1L}).has_value()) {
            holding = true;
            while (!done.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds{1L});
            }
            EXPECT_TRUE(locks.release(y).has_value());
        }
    });
    while (!holding.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds{1L});
    }
    ASSERT_TRUE(engine.deposit(x, cents(1000)).has_value());
    auto result = engine.transfer(x, y, cents(100));
    done = true;
    holder.join();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::LockTimeout);
    EXPECT_EQ(result.error().account, y);
    EXPECT_FALSE(locks.isLocked(x));
    EXPECT_EQ(balanceOf(x), cents(1000));
    EXPECT_EQ(store.commitAttempts(), 1);
}

TEST_F(LedgerEngineTest, ForeignWriteIsSeenByNextTransfer) {
    ASSERT_TRUE(engine.deposit(x, cents(10000)).has_value());
    // Drains the account behind the engine's back; the next transfer reads
    // the new balance and is rejected.
    ASSERT_TRUE(inner.setBalance(x, cents(50)).has_value());
    auto result = engine.transfer(x, y, cents(6000));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InsufficientFunds);
    EXPECT_EQ(balanceOf(x), cents(50));
    EXPECT_EQ(balanceOf(y), Amount::zero());
}
