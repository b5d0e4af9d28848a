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

#ifndef ZLEDGER_SERVER_LEDGER_SERVICE_IMPL_HPP
#define ZLEDGER_SERVER_LEDGER_SERVICE_IMPL_HPP

#include <grpcpp/grpcpp.h>
#include "proto/ledger.grpc.pb.h"
#include "server/RPCServer.hpp"
#include "engine/LedgerEngine.hpp"
#include "diagnostics/LedgerDiagnostics.hpp"

namespace zledger {

class LedgerServiceImpl final : public proto::Ledger::Service {
public:
    LedgerServiceImpl(LedgerEngine& e, const LedgerDiagnostics& d);
    grpc::Status openAccount(
        grpc::ServerContext* context,
        const proto::OpenAccountRequest* request,
        proto::OpenAccountReply* reply) override;
    grpc::Status deposit(
        grpc::ServerContext* context,
        const proto::DepositRequest* request,
        proto::DepositReply* reply) override;
    grpc::Status transfer(
        grpc::ServerContext* context,
        const proto::TransferRequest* request,
        proto::TransferReply* reply) override;
    grpc::Status getAccount(
        grpc::ServerContext* context,
        const proto::AccountRequest* request,
        proto::AccountReply* reply) override;
    grpc::Status getBalance(
        grpc::ServerContext* context,
        const proto::BalanceRequest* request,
        proto::BalanceReply* reply) override;
    grpc::Status getHistory(
        grpc::ServerContext* context,
        const proto::HistoryRequest* request,
        proto::HistoryReply* reply) override;
    grpc::Status validateTransfer(
        grpc::ServerContext* context,
        const proto::ValidateTransferRequest* request,
        proto::ValidateTransferReply* reply) override;
    grpc::Status concurrencyStatus(
        grpc::ServerContext* context,
        const proto::ConcurrencyStatusRequest* request,
        proto::ConcurrencyStatusReply* reply) override;
    grpc::Status health(
        grpc::ServerContext* context,
        const proto::HealthRequest* request,
        proto::HealthReply* reply) override;
private:
    LedgerEngine& engine;
    const LedgerDiagnostics& diagnostics;
};

using LedgerServer = RPCServer<LedgerServiceImpl>;

} // namespace zledger

#endif // ZLEDGER_SERVER_LEDGER_SERVICE_IMPL_HPP
