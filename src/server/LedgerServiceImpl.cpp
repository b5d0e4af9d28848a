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

#include "server/LedgerServiceImpl.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "common/Amount.hpp"
#include "common/Types.hpp"
#include "proto/ledger.pb.h"
#include <grpcpp/support/status.h>
#include <algorithm>
#include <cstddef>
#include <tuple>

namespace zledger {

namespace {

void fill(proto::Account* p, const Account& a) {
    p->set_account_number(a.number);
    p->set_balance_cents(a.balance.cents());
    p->set_created_at_micros(toMicros(a.createdAt));
    p->set_updated_at_micros(toMicros(a.updatedAt));
}

void fill(proto::Transaction* p, const TransactionRecord& t) {
    p->set_id(t.id);
    p->set_from_account(t.from.value_or(""));
    p->set_to_account(t.to);
    p->set_amount_cents(t.amount.cents());
    switch (t.kind) {
        case TransactionKind::Deposit:
            p->set_kind(proto::DEPOSIT);
            break;
        case TransactionKind::Withdrawal:
            p->set_kind(proto::WITHDRAWAL);
            break;
        case TransactionKind::Transfer:
            p->set_kind(proto::TRANSFER);
            break;
    }
    p->set_created_at_micros(toMicros(t.createdAt));
}

void fill(proto::AccountCheck* p, const AccountCheck& c) {
    p->set_account_number(c.number);
    p->set_exists(c.exists);
    p->set_balance_cents(c.balance.cents());
    p->set_locked(c.locked);
}

} // namespace

LedgerServiceImpl::LedgerServiceImpl(LedgerEngine& e, const LedgerDiagnostics& d)
    : engine {e}, diagnostics {d} {}

grpc::Status LedgerServiceImpl::openAccount(
    grpc::ServerContext* context,
    const proto::OpenAccountRequest* request,
    proto::OpenAccountReply* reply) {
    std::ignore = context;
    auto account = request->account_number().empty()
        ? engine.openAccount()
        : engine.openAccount(request->account_number());
    if (!account.has_value()) {
        return toGrpcStatus(account.error());
    }
    fill(reply->mutable_account(), account.value());
    return grpc::Status::OK;
}

grpc::Status LedgerServiceImpl::deposit(
    grpc::ServerContext* context,
    const proto::DepositRequest* request,
    proto::DepositReply* reply) {
    std::ignore = context;
    auto result = engine.deposit(request->account_number(), Amount::fromCents(request->amount_cents()));
    if (!result.has_value()) {
        return toGrpcStatus(result.error());
    }
    reply->set_account_number(result->account);
    reply->set_new_balance_cents(result->newBalance.cents());
    reply->set_deposited_cents(result->depositedAmount.cents());
    reply->set_transaction_id(result->transactionId);
    return grpc::Status::OK;
}

grpc::Status LedgerServiceImpl::transfer(
    grpc::ServerContext* context,
    const proto::TransferRequest* request,
    proto::TransferReply* reply) {
    std::ignore = context;
    auto result = engine.transfer(request->from_account(), request->to_account(), Amount::fromCents(request->amount_cents()));
    if (!result.has_value()) {
        return toGrpcStatus(result.error());
    }
    reply->set_transfer_id(result->transferId);
    reply->set_from_account(result->fromAccount);
    reply->set_to_account(result->toAccount);
    reply->set_amount_cents(result->amount.cents());
    reply->set_from_balance_cents(result->fromBalance.cents());
    reply->set_to_balance_cents(result->toBalance.cents());
    reply->set_transaction_id(result->transactionId);
    return grpc::Status::OK;
}

grpc::Status LedgerServiceImpl::getAccount(
    grpc::ServerContext* context,
    const proto::AccountRequest* request,
    proto::AccountReply* reply) {
    std::ignore = context;
    auto account = engine.getAccount(request->account_number());
    if (!account.has_value()) {
        return toGrpcStatus(account.error());
    }
    fill(reply->mutable_account(), account.value());
    return grpc::Status::OK;
}

grpc::Status LedgerServiceImpl::getBalance(
    grpc::ServerContext* context,
    const proto::BalanceRequest* request,
    proto::BalanceReply* reply) {
    std::ignore = context;
    auto balance = engine.getBalance(request->account_number());
    if (!balance.has_value()) {
        return toGrpcStatus(balance.error());
    }
    reply->set_account_number(request->account_number());
    reply->set_balance_cents(balance->cents());
    return grpc::Status::OK;
}

grpc::Status LedgerServiceImpl::getHistory(
    grpc::ServerContext* context,
    const proto::HistoryRequest* request,
    proto::HistoryReply* reply) {
    std::ignore = context;
    const auto& cfg = engine.config();
    size_t limit = request->limit() == 0 ? cfg.defaultHistoryLimit : static_cast<size_t>(request->limit());
    limit = std::min(limit, cfg.maxHistoryLimit);
    auto records = engine.getHistory(request->account_number(), limit);
    if (!records.has_value()) {
        return toGrpcStatus(records.error());
    }
    for (const auto& t : records.value()) {
        fill(reply->add_transactions(), t);
    }
    return grpc::Status::OK;
}

grpc::Status LedgerServiceImpl::validateTransfer(
    grpc::ServerContext* context,
    const proto::ValidateTransferRequest* request,
    proto::ValidateTransferReply* reply) {
    std::ignore = context;
    auto report = diagnostics.validateTransferPreconditions(
        request->from_account(),
        request->to_account(),
        Amount::fromCents(request->amount_cents()));
    if (!report.has_value()) {
        return toGrpcStatus(report.error());
    }
    fill(reply->mutable_from(), report->from);
    fill(reply->mutable_to(), report->to);
    reply->set_same_account(report->sameAccount);
    reply->set_amount_valid(report->amountValid);
    reply->set_sufficient_funds(report->sufficientFunds);
    reply->set_valid(report->valid);
    for (const auto& problem : report->problems) {
        reply->add_problems(problem);
    }
    return grpc::Status::OK;
}

grpc::Status LedgerServiceImpl::concurrencyStatus(
    grpc::ServerContext* context,
    const proto::ConcurrencyStatusRequest* request,
    proto::ConcurrencyStatusReply* reply) {
    std::ignore = context;
    auto status = diagnostics.concurrencyStatus(request->account_number());
    if (!status.has_value()) {
        return toGrpcStatus(status.error());
    }
    reply->set_account_number(status->account);
    reply->set_recent_transaction_count(status->recentTransactionCount);
    reply->set_window_seconds(status->window.count());
    reply->set_lock_held(status->lockHeld);
    return grpc::Status::OK;
}

grpc::Status LedgerServiceImpl::health(
    grpc::ServerContext* context,
    const proto::HealthRequest* request,
    proto::HealthReply* reply) {
    std::ignore = context;
    std::ignore = request;
    auto h = diagnostics.storeHealth();
    reply->set_healthy(h.healthy);
    reply->set_latency_micros(h.latency.count());
    reply->set_detail(h.detail);
    for (const auto& account : diagnostics.heldLocks()) {
        reply->add_held_locks(account);
    }
    return grpc::Status::OK;
}

} // namespace zledger
