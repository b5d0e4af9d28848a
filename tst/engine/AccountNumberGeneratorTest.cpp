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
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include "common/Error.hpp"
#include "engine/AccountNumberGenerator.hpp"
#include "storage/InMemoryLedgerStore.hpp"

using zledger::ErrorCode;
using zledger::InMemoryLedgerStore;
using zledger::RandomAccountNumberGenerator;

TEST(AccountNumberGeneratorTest, TenDecimalDigitsWithoutLeadingZero) {
    InMemoryLedgerStore store;
    RandomAccountNumberGenerator generator {store};
    for (int i = 0; i < 200; ++i) {
        auto number = generator.next();
        ASSERT_TRUE(number.has_value());
        ASSERT_EQ(number->size(), 10U);
        EXPECT_NE(number->front(), '0');
        EXPECT_TRUE(std::ranges::all_of(number.value(), [](unsigned char c) { return std::isdigit(c) != 0; }));
    }
}

TEST(AccountNumberGeneratorTest, SkipsNumbersAlreadyTaken) {
    InMemoryLedgerStore store;
    for (char c = '1'; c <= '8'; ++c) {
        ASSERT_TRUE(store.createAccount(std::string(1, c)).has_value());
    }
    RandomAccountNumberGenerator generator {store, 1, 1000};
    auto number = generator.next();
    ASSERT_TRUE(number.has_value());
    EXPECT_EQ(number.value(), "9");
}

TEST(AccountNumberGeneratorTest, GivesUpWhenEveryNumberIsTaken) {
    InMemoryLedgerStore store;
    for (char c = '1'; c <= '9'; ++c) {
        ASSERT_TRUE(store.createAccount(std::string(1, c)).has_value());
    }
    RandomAccountNumberGenerator generator {store, 1, 20};
    auto number = generator.next();
    ASSERT_FALSE(number.has_value());
    EXPECT_EQ(number.error().code, ErrorCode::Internal);
}

TEST(AccountNumberGeneratorTest, RejectsBadConfiguration) {
    InMemoryLedgerStore store;
    EXPECT_THROW(RandomAccountNumberGenerator(store, 0, 10), std::invalid_argument);
    EXPECT_THROW(RandomAccountNumberGenerator(store, 10, 0), std::invalid_argument);
}
