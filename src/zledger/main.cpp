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

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/common.h>
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "common/Config.hpp"
#include "diagnostics/LedgerDiagnostics.hpp"
#include "engine/AccountNumberGenerator.hpp"
#include "engine/LedgerEngine.hpp"
#include "lock/LockManager.hpp"
#include "server/LedgerServiceImpl.hpp"
#include "storage/FilePersister.hpp"
#include "storage/InMemoryLedgerStore.hpp"

using zledger::EngineConfig;
using zledger::FilePersister;
using zledger::InMemoryLedgerStore;
using zledger::LedgerDiagnostics;
using zledger::LedgerEngine;
using zledger::LedgerServer;
using zledger::LedgerServiceImpl;
using zledger::LockManager;
using zledger::RandomAccountNumberGenerator;
using zledger::ServerConfig;

namespace {

std::atomic<bool> stopRequested {false};

void onSignal(int /*signal*/) {
    stopRequested.store(true);
}

void installLogger(spdlog::level::level_enum level) {
    spdlog::init_thread_pool(8192, 1);
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "logs/zledger.txt", 1024 * 1024 * 5, 3);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        "gAsync", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);
    spdlog::set_level(level);
}

} // namespace

int main(int argc, char** argv) {
    ServerConfig config;
    try {
        config = ServerConfig::fromEnvironment();
        config.applyArguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        spdlog::critical("ZLedger: bad configuration: {}", e.what());
        return 2;
    }
    installLogger(config.logLevel);
    spdlog::info("ZLedger! Starting...");

    int status = 0;
    try {
        std::optional<FilePersister> persister;
        std::unique_ptr<InMemoryLedgerStore> store;
        if (config.dataFile.empty()) {
            spdlog::warn("ZLedger: no data file configured, the ledger lives in memory only");
            store = std::make_unique<InMemoryLedgerStore>();
        } else {
            persister.emplace(config.dataFile);
            store = std::make_unique<InMemoryLedgerStore>(persister.value());
        }
        LockManager locks {};
        RandomAccountNumberGenerator numbers {*store};
        const EngineConfig engineConfig = config.engineConfig();
        LedgerEngine engine {*store, locks, numbers, engineConfig};
        const LedgerDiagnostics diagnostics {*store, locks, engineConfig};
        LedgerServiceImpl service {engine, diagnostics};
        LedgerServer server {config.listenAddress, service};

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
        while (!stopRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds{200L});
        }
        spdlog::info("ZLedger: shutting down");
        server.shutdown();
    } catch (const std::exception& e) {
        spdlog::critical("ZLedger: {}", e.what());
        status = 1;
    }
    spdlog::shutdown();
    return status;
}
