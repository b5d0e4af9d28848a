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

#ifndef ZLEDGER_SERVER_RPC_SERVER_HPP
#define ZLEDGER_SERVER_RPC_SERVER_HPP

#include <memory>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <stdexcept>
#include <chrono>
#include <string>

namespace zledger {

template<typename Service>
class RPCServer {
public:
    // An address ending in ":0" binds an ephemeral port; see port().
    RPCServer(const std::string& address, Service& s);
    ~RPCServer();
    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;
    RPCServer(RPCServer&&) = delete;
    RPCServer& operator=(RPCServer&&) = delete;
    [[nodiscard]] int port() const;
    void shutdown();
private:
    std::string addr;
    Service& service;
    int selectedPort {0};
    std::unique_ptr<grpc::Server> server;
    std::thread serverThread;
};

template<typename Service>
RPCServer<Service>::RPCServer(const std::string& address, Service& s)
    : addr{address}, service {s} {
    grpc::ServerBuilder sb{};
    sb.AddListeningPort(addr, grpc::InsecureServerCredentials(), &selectedPort);
    sb.RegisterService(&service);
    server = sb.BuildAndStart();
    if (!server || selectedPort == 0) {
        throw std::runtime_error("Failed to start gRPC server on address: " + address);
    }
    spdlog::info("RPCServer: listening on {} (port {})", addr, selectedPort);
    serverThread = std::thread([this]() { server->Wait(); });
}

template<typename Service>
int RPCServer<Service>::port() const {
    return selectedPort;
}

template<typename Service>
void RPCServer<Service>::shutdown() {
    if (server) {
        auto deadline = std::chrono::system_clock::now() + std::chrono::milliseconds{100L};
        server->Shutdown(deadline);
    }
    if (serverThread.joinable()) {
        serverThread.join();
    }
    if (server) {
        spdlog::info("RPCServer: stopped {}", addr);
    }
    server.reset();
}

template<typename Service>
RPCServer<Service>::~RPCServer() {
    shutdown();
}

} // namespace zledger

#endif // ZLEDGER_SERVER_RPC_SERVER_HPP
