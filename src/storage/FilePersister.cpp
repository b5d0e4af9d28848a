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

#include "storage/FilePersister.hpp"
#include "storage/Persister.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "proto/store.pb.h"
#include <spdlog/spdlog.h>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <cstdint>
#include <variant>

namespace zledger {

namespace {

proto::LedgerSnapshot toProto(const LedgerState& state) {
    proto::LedgerSnapshot p;
    for (const auto& a : state.accounts) {
        auto* account = p.add_accounts();
        account->set_account_number(a.number);
        account->set_balance_cents(a.balance.cents());
        account->set_created_at_micros(toMicros(a.createdAt));
        account->set_updated_at_micros(toMicros(a.updatedAt));
        account->set_version(a.version);
    }
    for (const auto& t : state.transactions) {
        auto* transaction = p.add_transactions();
        transaction->set_id(t.id);
        transaction->set_has_from(t.from.has_value());
        if (t.from.has_value()) {
            transaction->set_from_account(t.from.value());
        }
        transaction->set_to_account(t.to);
        transaction->set_amount_cents(t.amount.cents());
        transaction->set_kind(static_cast<int32_t>(t.kind));
        transaction->set_created_at_micros(toMicros(t.createdAt));
    }
    p.set_next_transaction_id(state.nextTransactionId);
    return p;
}

std::optional<LedgerState> fromProto(const proto::LedgerSnapshot& p) {
    LedgerState state;
    state.accounts.reserve(p.accounts_size());
    for (const auto& a : p.accounts()) {
        state.accounts.push_back(Account {
            a.account_number(),
            Amount::fromCents(a.balance_cents()),
            fromMicros(a.created_at_micros()),
            fromMicros(a.updated_at_micros()),
            a.version()
        });
    }
    state.transactions.reserve(p.transactions_size());
    for (const auto& t : p.transactions()) {
        if (t.kind() < static_cast<int32_t>(TransactionKind::Deposit) || t.kind() > static_cast<int32_t>(TransactionKind::Transfer)) {
            return std::nullopt;
        }
        TransactionRecord record;
        record.id = t.id();
        if (t.has_from()) {
            record.from = t.from_account();
        }
        record.to = t.to_account();
        record.amount = Amount::fromCents(t.amount_cents());
        record.kind = static_cast<TransactionKind>(t.kind());
        record.createdAt = fromMicros(t.created_at_micros());
        state.transactions.push_back(std::move(record));
    }
    state.nextTransactionId = p.next_transaction_id();
    return state;
}

} // namespace

FilePersister::FilePersister(const std::string& filename) : path {filename} {
    spdlog::info("FilePersister: using {}", path.string());
}

std::expected<std::optional<LedgerState>, Error> FilePersister::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return std::unexpected {Error {ErrorCode::TransientStoreFailure, "Cannot stat " + path.string() + ": " + ec.message()}};
        }
        return std::nullopt;
    }
    std::ifstream in {path, std::ios::binary};
    if (!in) {
        return std::unexpected {Error {ErrorCode::TransientStoreFailure, "Cannot open " + path.string()}};
    }
    proto::LedgerSnapshot p;
    if (!p.ParseFromIstream(&in)) {
        spdlog::error("FilePersister: failed to parse snapshot {}", path.string());
        return std::unexpected {Error {ErrorCode::Internal, "Corrupt ledger snapshot " + path.string()}};
    }
    auto state = fromProto(p);
    if (!state.has_value()) {
        spdlog::error("FilePersister: snapshot {} has an unknown transaction kind", path.string());
        return std::unexpected {Error {ErrorCode::Internal, "Corrupt ledger snapshot " + path.string()}};
    }
    spdlog::info("FilePersister: loaded {} accounts and {} transactions", state->accounts.size(), state->transactions.size());
    return state;
}

std::expected<std::monostate, Error> FilePersister::save(const LedgerState& state) {
    auto temporary = path;
    temporary += ".tmp";
    {
        std::ofstream out {temporary, std::ios::binary | std::ios::trunc};
        if (!out) {
            return std::unexpected {Error {ErrorCode::TransientStoreFailure, "Cannot open " + temporary.string() + " for writing"}};
        }
        if (!toProto(state).SerializeToOstream(&out)) {
            return std::unexpected {Error {ErrorCode::TransientStoreFailure, "Failed to write " + temporary.string()}};
        }
        out.flush();
        if (!out) {
            return std::unexpected {Error {ErrorCode::TransientStoreFailure, "Failed to flush " + temporary.string()}};
        }
    }
    std::error_code ec;
    std::filesystem::rename(temporary, path, ec);
    if (ec) {
        spdlog::warn("FilePersister: rename {} -> {} failed: {}", temporary.string(), path.string(), ec.message());
        return std::unexpected {Error {ErrorCode::TransientStoreFailure, "Failed to replace " + path.string() + ": " + ec.message()}};
    }
    return {};
}

FilePersister::~FilePersister() = default;

} // namespace zledger
