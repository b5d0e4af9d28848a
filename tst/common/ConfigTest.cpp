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
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/common.h>
#include "common/Amount.hpp"
#include "common/Config.hpp"
#include "common/RetryPolicy.hpp"

using zledger::Amount;
using zledger::EngineConfig;
using zledger::RetryPolicy;
using zledger::ServerConfig;

namespace {

EngineConfig makeEngineConfig(size_t maxHistory, size_t defaultHistory, std::chrono::seconds window, Amount largest) {
    return EngineConfig {
        std::chrono::milliseconds{50L},
        RetryPolicy {std::chrono::microseconds{0L}, std::chrono::microseconds{0L}, 3},
        RetryPolicy {std::chrono::microseconds{0L}, std::chrono::microseconds{0L}, 2},
        maxHistory,
        defaultHistory,
        window,
        largest
    };
}

} // namespace

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("ZLEDGER_LISTEN_ADDRESS");
        unsetenv("ZLEDGER_DATA_FILE");
        unsetenv("ZLEDGER_LOG_LEVEL");
        unsetenv("ZLEDGER_MAX_AMOUNT");
    }

    void TearDown() override {
        SetUp();
    }
};

TEST(EngineConfigTest, Defaults) {
    const EngineConfig config;
    EXPECT_EQ(config.lockTimeout, std::chrono::seconds{10L});
    EXPECT_EQ(config.mutatingPolicy.failureThreshold, 3);
    EXPECT_EQ(config.mutatingPolicy.baseDelay, std::chrono::milliseconds{100L});
    EXPECT_EQ(config.readPolicy.failureThreshold, 2);
    EXPECT_EQ(config.maxHistoryLimit, 100U);
    EXPECT_EQ(config.defaultHistoryLimit, 10U);
    EXPECT_EQ(config.recentWindow, std::chrono::seconds{60L});
    EXPECT_EQ(config.maxAmount, Amount::fromCents(100'000'000));
}

TEST(EngineConfigTest, RejectsBadValues) {
    EXPECT_THROW(makeEngineConfig(0, 0, std::chrono::seconds{60L}, Amount::fromCents(1)), std::invalid_argument);
    EXPECT_THROW(makeEngineConfig(10, 11, std::chrono::seconds{60L}, Amount::fromCents(1)), std::invalid_argument);
    EXPECT_THROW(makeEngineConfig(10, 0, std::chrono::seconds{60L}, Amount::fromCents(1)), std::invalid_argument);
    EXPECT_THROW(makeEngineConfig(10, 5, std::chrono::seconds{0L}, Amount::fromCents(1)), std::invalid_argument);
    EXPECT_THROW(makeEngineConfig(10, 5, std::chrono::seconds{60L}, Amount::zero()), std::invalid_argument);
    EXPECT_NO_THROW(makeEngineConfig(10, 5, std::chrono::seconds{60L}, Amount::fromCents(1)));
}

TEST_F(ServerConfigTest, Defaults) {
    const auto config = ServerConfig::fromEnvironment();
    EXPECT_EQ(config.listenAddress, "0.0.0.0:50051");
    EXPECT_TRUE(config.dataFile.empty());
    EXPECT_EQ(config.logLevel, spdlog::level::info);
    EXPECT_EQ(config.maxAmount, Amount::fromCents(100'000'000));
    EXPECT_EQ(config.engineConfig().maxAmount, Amount::fromCents(100'000'000));
}

TEST_F(ServerConfigTest, MaxAmountIsParsedAsMoney) {
    setenv("ZLEDGER_MAX_AMOUNT", "2500.5", 1);
    auto config = ServerConfig::fromEnvironment();
    EXPECT_EQ(config.maxAmount, Amount::fromCents(250050));
    config.applyArguments({"--max-amount", "75"});
    const auto engine = config.engineConfig();
    EXPECT_EQ(engine.maxAmount, Amount::fromCents(7500));
    EXPECT_EQ(engine.lockTimeout, std::chrono::seconds{10L});
    EXPECT_EQ(engine.maxHistoryLimit, 100U);
}

TEST_F(ServerConfigTest, BadMaxAmountThrows) {
    setenv("ZLEDGER_MAX_AMOUNT", "1.005", 1);
    EXPECT_THROW(ServerConfig::fromEnvironment(), std::invalid_argument);
    ServerConfig config;
    EXPECT_THROW(config.applyArguments({"--max-amount", "0"}), std::invalid_argument);
    EXPECT_THROW(config.applyArguments({"--max-amount", "-5"}), std::invalid_argument);
    EXPECT_THROW(config.applyArguments({"--max-amount", "92233720368547758.99"}), std::invalid_argument);
}

TEST_F(ServerConfigTest, ReadsEnvironment) {
    setenv("ZLEDGER_LISTEN_ADDRESS", "127.0.0.1:6000", 1);
    setenv("ZLEDGER_DATA_FILE", "/tmp/ledger.bin", 1);
    setenv("ZLEDGER_LOG_LEVEL", "debug", 1);
    const auto config = ServerConfig::fromEnvironment();
    EXPECT_EQ(config.listenAddress, "127.0.0.1:6000");
    EXPECT_EQ(config.dataFile, "/tmp/ledger.bin");
    EXPECT_EQ(config.logLevel, spdlog::level::debug);
}

TEST_F(ServerConfigTest, BadLogLevelInEnvironmentThrows) {
    setenv("ZLEDGER_LOG_LEVEL", "chatty", 1);
    EXPECT_THROW(ServerConfig::fromEnvironment(), std::invalid_argument);
}

TEST_F(ServerConfigTest, ArgumentsOverrideEnvironment) {
    setenv("ZLEDGER_LISTEN_ADDRESS", "127.0.0.1:6000", 1);
    auto config = ServerConfig::fromEnvironment();
    config.applyArguments({"--listen", "localhost:7000", "--log-level", "warn", "--data", "ledger.bin"});
    EXPECT_EQ(config.listenAddress, "localhost:7000");
    EXPECT_EQ(config.logLevel, spdlog::level::warn);
    EXPECT_EQ(config.dataFile, "ledger.bin");
}

TEST_F(ServerConfigTest, BadArgumentsThrow) {
    ServerConfig config;
    EXPECT_THROW(config.applyArguments({"--port", "1"}), std::invalid_argument);
    EXPECT_THROW(config.applyArguments({"--listen"}), std::invalid_argument);
    EXPECT_THROW(config.applyArguments({"--listen", ""}), std::invalid_argument);
    EXPECT_THROW(config.applyArguments({"--log-level", "loud"}), std::invalid_argument);
}

TEST(LogLevelTest, ParsesKnownNames) {
    EXPECT_EQ(zledger::parseLogLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(zledger::parseLogLevel("error"), spdlog::level::err);
    EXPECT_EQ(zledger::parseLogLevel("off"), spdlog::level::off);
    EXPECT_THROW(zledger::parseLogLevel("verbose"), std::invalid_argument);
}
