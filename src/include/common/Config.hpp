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

#ifndef ZLEDGER_COMMON_CONFIG_HPP
#define ZLEDGER_COMMON_CONFIG_HPP

#include "common/RetryPolicy.hpp"
#include "common/Amount.hpp"
#include <spdlog/common.h>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace zledger {

struct EngineConfig {
    EngineConfig();
    EngineConfig(
        std::chrono::milliseconds lock,
        RetryPolicy mutating,
        RetryPolicy read,
        size_t maxHistory,
        size_t defaultHistory,
        std::chrono::seconds window,
        Amount largest
    );
    std::chrono::milliseconds lockTimeout;
    RetryPolicy mutatingPolicy;
    RetryPolicy readPolicy;
    size_t maxHistoryLimit;
    size_t defaultHistoryLimit;
    std::chrono::seconds recentWindow;
    // Largest amount a single deposit or transfer may move.
    Amount maxAmount;
};

struct ServerConfig {
    std::string listenAddress {"0.0.0.0:50051"};
    // Empty keeps the ledger in memory only.
    std::string dataFile;
    spdlog::level::level_enum logLevel {spdlog::level::info};
    Amount maxAmount {Amount::fromCents(100'000'000)};

    // Reads ZLEDGER_LISTEN_ADDRESS, ZLEDGER_DATA_FILE, ZLEDGER_LOG_LEVEL and
    // ZLEDGER_MAX_AMOUNT.
    static ServerConfig fromEnvironment();
    // --listen <addr>, --data <path>, --log-level <level>, --max-amount <amount>;
    // throws std::invalid_argument.
    void applyArguments(const std::vector<std::string>& args);
    // Engine defaults with this configuration's limits applied.
    [[nodiscard]] EngineConfig engineConfig() const;
};

spdlog::level::level_enum parseLogLevel(const std::string& name);
// Parses a positive decimal amount such as "2500.00".
Amount parseMaxAmount(const std::string& text);

} // namespace zledger

#endif // ZLEDGER_COMMON_CONFIG_HPP
