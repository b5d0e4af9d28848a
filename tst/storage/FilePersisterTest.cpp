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
#include <chrono>
#include <filesystem>
#include <functional>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include "common/Amount.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "storage/FilePersister.hpp"
#include "storage/InMemoryLedgerStore.hpp"
#include "storage/LedgerStore.hpp"

using zledger::Amount;
using zledger::ErrorCode;
using zledger::FilePersister;
using zledger::InMemoryLedgerStore;
using zledger::PendingTransaction;
using zledger::TransactionKind;

class FilePersisterTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string name = std::string {"zledger_"} + info->name() + "_" + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) + ".bin";
        path = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove(path);
    }

    void TearDown() override {
        std::filesystem::remove(path);
        auto temporary = path;
        temporary += ".tmp";
        std::filesystem::remove(temporary);
    }

    std::filesystem::path path;
};

TEST_F(FilePersisterTest, MissingFileMeansNoState) {
    FilePersister persister {path.string()};
    auto loaded = persister.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->has_value());
}

TEST_F(FilePersisterTest, SavedStateLoadsBack) {
    const auto now = zledger::fromMicros(zledger::toMicros(std::chrono::system_clock::now()));
    zledger::LedgerState state;
    state.accounts.push_back(zledger::Account {"1000000001", Amount::fromCents(4000), now, now, 3});
    state.accounts.push_back(zledger::Account {"1000000002", Amount::fromCents(6000), now, now, 2});
    zledger::TransactionRecord deposit;
    deposit.id = 1;
    deposit.to = "1000000001";
    deposit.amount = Amount::fromCents(10000);
    deposit.kind = TransactionKind::Deposit;
    deposit.createdAt = now;
    zledger::TransactionRecord transfer;
    transfer.id = 2;
    transfer.from = "1000000001";
    transfer.to = "1000000002";
    transfer.amount = Amount::fromCents(6000);
    transfer.kind = TransactionKind::Transfer;
    transfer.createdAt = now;
    state.transactions = {deposit, transfer};
    state.nextTransactionId = 3;

    FilePersister persister {path.string()};
    ASSERT_TRUE(persister.save(state).has_value());
    auto loaded = persister.load();
    ASSERT_TRUE(loaded.has_value());
    ASSERT_TRUE(loaded->has_value());
    const auto& got = loaded->value();
    ASSERT_EQ(got.accounts.size(), 2U);
    EXPECT_EQ(got.accounts[0].number, "1000000001");
    EXPECT_EQ(got.accounts[0].balance, Amount::fromCents(4000));
    EXPECT_EQ(got.accounts[0].version, 3U);
    EXPECT_EQ(got.accounts[0].createdAt, now);
    ASSERT_EQ(got.transactions.size(), 2U);
    EXPECT_FALSE(got.transactions[0].from.has_value());
    EXPECT_EQ(got.transactions[1].from, std::optional<std::string> {"1000000001"});
    EXPECT_EQ(got.transactions[1].kind, TransactionKind::Transfer);
    EXPECT_EQ(got.transactions[1].amount, Amount::fromCents(6000));
    EXPECT_EQ(got.nextTransactionId, 3U);
}

TEST_F(FilePersisterTest, StoreSurvivesRestart) {
    {
        FilePersister persister {path.string()};
        InMemoryLedgerStore store {persister};
        ASSERT_TRUE(store.createAccount("1000000001").has_value());
        ASSERT_TRUE(store.createAccount("1000000002").has_value());
        auto session = store.begin();
        ASSERT_TRUE(session.has_value());
        auto& s = *session.value();
        ASSERT_TRUE(s.findAccount("1000000001").has_value());
        ASSERT_TRUE(s.updateBalance("1000000001", Amount::fromCents(123)).has_value());
        ASSERT_TRUE(s.appendTransaction(PendingTransaction {std::nullopt, "1000000001", Amount::fromCents(123), TransactionKind::Deposit}).has_value());
        ASSERT_TRUE(s.commit().has_value());
    }
    FilePersister persister {path.string()};
    InMemoryLedgerStore store {persister};
    auto a = store.getAccount("1000000001");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(a->has_value());
    EXPECT_EQ(a->value().balance, Amount::fromCents(123));
    EXPECT_TRUE(store.getAccount("1000000002")->has_value());
    auto history = store.history("1000000001", 10);
    ASSERT_TRUE(history.has_value());
    ASSERT_EQ(history->size(), 1U);
    EXPECT_EQ(history->front().id, 1U);
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));
}

TEST_F(FilePersisterTest, CorruptFileIsRejected) {
    {
        std::ofstream out {path, std::ios::binary};
        // Field 1 claims 80 bytes but only three follow.
        out << "\x0a\x50" << "abc";
    }
    FilePersister persister {path.string()};
    auto loaded = persister.load();
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::Internal);
    EXPECT_THROW(InMemoryLedgerStore store {persister}, std::runtime_error);
}

TEST_F(FilePersisterTest, UnwritableLocationIsTransient) {
    FilePersister persister {(path / "missing" / "ledger.bin").string()};
    auto saved = persister.save(zledger::LedgerState {});
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code, ErrorCode::TransientStoreFailure);
}
