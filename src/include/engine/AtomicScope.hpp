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

#ifndef ZLEDGER_ENGINE_ATOMIC_SCOPE_HPP
#define ZLEDGER_ENGINE_ATOMIC_SCOPE_HPP

#include "storage/LedgerStore.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <expected>
#include <string>
#include <type_traits>
#include <utility>

namespace zledger {

template<typename T>
struct Committed {
    T value;
    CommitReceipt receipt;
};

// Rolls the session back on destruction unless dismissed.
class RollbackGuard {
public:
    RollbackGuard(StoreSession& s, const std::string& o)
        : session {s}, op {o}, exceptions {std::uncaught_exceptions()} {}
    RollbackGuard(const RollbackGuard&) = delete;
    RollbackGuard& operator=(const RollbackGuard&) = delete;

    ~RollbackGuard() {
        if (!active) {
            return;
        }
        session.rollback();
        if (std::uncaught_exceptions() > exceptions) {
            spdlog::error("AtomicScope: {} rolled back by an exception", op);
        } else {
            spdlog::debug("AtomicScope: {} rolled back", op);
        }
    }

    void dismiss() noexcept {
        active = false;
    }
private:
    StoreSession& session;
    const std::string& op;
    int exceptions;
    bool active {true};
};

// Runs work(StoreSession&) inside a fresh session. A value is committed; an
// error or an exception rolls everything back and reaches the caller
// unchanged. Commit failures other than TransientStoreFailure and
// IntegrityViolation are reported as Internal.
template<typename F, typename R = std::invoke_result_t<F&, StoreSession&>>
std::expected<Committed<typename R::value_type>, Error> atomically(LedgerStore& store, const std::string& op, F&& work) {
    auto session = store.begin();
    if (!session.has_value()) {
        return std::unexpected {session.error()};
    }
    auto& s = *session.value();
    RollbackGuard guard {s, op};
    R result = work(s);
    if (!result.has_value()) {
        return std::unexpected {result.error()};
    }
    auto receipt = s.commit();
    if (!receipt.has_value()) {
        const auto& error = receipt.error();
        if (error.code == ErrorCode::TransientStoreFailure || error.code == ErrorCode::IntegrityViolation) {
            return std::unexpected {error};
        }
        spdlog::error("AtomicScope: commit of {} failed: {}", op, error.what);
        return std::unexpected {Error {ErrorCode::Internal, "Commit of " + op + " failed: " + error.what}};
    }
    guard.dismiss();
    return Committed<typename R::value_type> {std::move(result.value()), std::move(receipt.value())};
}

} // namespace zledger

#endif // ZLEDGER_ENGINE_ATOMIC_SCOPE_HPP
