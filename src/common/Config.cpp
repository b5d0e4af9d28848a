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

#include "common/Config.hpp"
#include "common/RetryPolicy.hpp"
#include "common/Amount.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace zledger {

EngineConfig::EngineConfig()
    : EngineConfig(
        std::chrono::seconds{10L},
        RetryPolicy{std::chrono::milliseconds{100L}, std::chrono::seconds{2L}, 3},
        RetryPolicy{std::chrono::milliseconds{100L}, std::chrono::seconds{2L}, 2},
        100,
        10,
        std::chrono::seconds{60L},
        Amount::fromCents(100'000'000)) {}

EngineConfig::EngineConfig(
    std::chrono::milliseconds lock,
    RetryPolicy mutating,
    RetryPolicy read,
    size_t maxHistory,
    size_t defaultHistory,
    std::chrono::seconds window,
    Amount largest)
    : lockTimeout {lock},
      mutatingPolicy {mutating},
      readPolicy {read},
      maxHistoryLimit {maxHistory},
      defaultHistoryLimit {defaultHistory},
      recentWindow {window},
      maxAmount {largest} {
    if (lock < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Lock timeout must be >= zero.");
    }
    if (maxHistory == 0) {
        throw std::invalid_argument("Max history limit must be > zero.");
    }
    if (defaultHistory == 0 || defaultHistory > maxHistory) {
        throw std::invalid_argument("Default history limit must be in (0, max history limit].");
    }
    if (window <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("Recent window must be > zero.");
    }
    if (!largest.positive()) {
        throw std::invalid_argument("Max amount must be > zero.");
    }
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str falls back to off for unknown names.
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

Amount parseMaxAmount(const std::string& text) {
    const auto amount = Amount::parse(text);
    if (!amount.has_value() || !amount->positive()) {
        throw std::invalid_argument("Max amount must be a positive amount with at most two decimals: " + text);
    }
    return amount.value();
}

ServerConfig ServerConfig::fromEnvironment() {
    ServerConfig config;
    if (const char* v = std::getenv("ZLEDGER_LISTEN_ADDRESS"); v != nullptr && *v != '\0') {
        config.listenAddress = v;
    }
    if (const char* v = std::getenv("ZLEDGER_DATA_FILE"); v != nullptr) {
        config.dataFile = v;
    }
    if (const char* v = std::getenv("ZLEDGER_LOG_LEVEL"); v != nullptr && *v != '\0') {
        config.logLevel = parseLogLevel(v);
    }
    if (const char* v = std::getenv("ZLEDGER_MAX_AMOUNT"); v != nullptr && *v != '\0') {
        config.maxAmount = parseMaxAmount(v);
    }
    return config;
}

void ServerConfig::applyArguments(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& flag = args[i];
        if (flag != "--listen" && flag != "--data" && flag != "--log-level" && flag != "--max-amount") {
            throw std::invalid_argument("Unknown argument: " + flag);
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        const auto& value = args[++i];
        if (flag == "--listen") {
            listenAddress = value;
        } else if (flag == "--data") {
            dataFile = value;
        } else if (flag == "--log-level") {
            logLevel = parseLogLevel(value);
        } else {
            maxAmount = parseMaxAmount(value);
        }
    }
    if (listenAddress.empty()) {
        throw std::invalid_argument("Listen address must not be empty.");
    }
}

EngineConfig ServerConfig::engineConfig() const {
    const EngineConfig defaults;
    return EngineConfig {
        defaults.lockTimeout,
        defaults.mutatingPolicy,
        defaults.readPolicy,
        defaults.maxHistoryLimit,
        defaults.defaultHistoryLimit,
        defaults.recentWindow,
        maxAmount
    };
}

} // namespace zledger
