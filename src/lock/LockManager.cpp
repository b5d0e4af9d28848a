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

#include "lock/LockManager.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <expected>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

namespace zledger {

LockManager::Entry& LockManager::checkout(const AccountNumber& account) {
    return entries.upsert(account, [](Entry& entry) { ++entry.users; });
}

void LockManager::checkin(const AccountNumber& account) {
    entries.eraseIf(account, [](Entry& entry) { return --entry.users == 0; });
}

std::expected<std::monostate, Error> LockManager::acquire(const AccountNumber& account, std::chrono::milliseconds timeout) {
    auto& entry = checkout(account);
    std::expected<std::monostate, Error> result {};
    {
        std::unique_lock lock {entry.m};
        if (entry.held && entry.owner == std::this_thread::get_id()) {
            spdlog::error("LockManager: re-entrant acquire of {}", account);
            result = std::unexpected {Error {ErrorCode::Internal, "Lock for account " + account + " is already held by this thread", account}};
        } else if (!entry.cv.wait_for(lock, timeout, [&entry] { return !entry.held; })) {
            spdlog::warn("LockManager: timed out after {}ms waiting for {}", timeout.count(), account);
            result = std::unexpected {Error {ErrorCode::LockTimeout, "Timed out acquiring lock for account " + account, account}};
        } else {
            entry.held = true;
            entry.owner = std::this_thread::get_id();
        }
    }
    if (!result.has_value()) {
        checkin(account);
        return result;
    }
    spdlog::debug("LockManager: acquired {}", account);
    return result;
}

std::expected<std::monostate, Error> LockManager::release(const AccountNumber& account) {
    std::expected<std::monostate, Error> result = std::unexpected {Error {ErrorCode::Internal, "Lock for account " + account + " is not held", account}};
    entries.visit(account, [&](Entry& entry) {
        {
            const std::lock_guard lock {entry.m};
            if (!entry.held) {
                return;
            }
            if (entry.owner != std::this_thread::get_id()) {
                result = std::unexpected {Error {ErrorCode::Internal, "Lock for account " + account + " is held by another thread", account}};
                return;
            }
            entry.held = false;
            entry.owner = std::thread::id {};
        }
        entry.cv.notify_one();
        result = std::monostate {};
    });
    if (!result.has_value()) {
        return result;
    }
    checkin(account);
    spdlog::debug("LockManager: released {}", account);
    return result;
}

bool LockManager::isLocked(const AccountNumber& account) const {
    bool held = false;
    entries.visit(account, [&held](const Entry& entry) {
        const std::lock_guard lock {entry.m};
        held = entry.held;
    });
    return held;
}

std::vector<AccountNumber> LockManager::heldLocks() const {
    std::vector<AccountNumber> held;
    entries.forEach([&held](const AccountNumber& account, const Entry& entry) {
        const std::lock_guard lock {entry.m};
        if (entry.held) {
            held.push_back(account);
        }
    });
    std::ranges::sort(held);
    return held;
}

size_t LockManager::size() const {
    return entries.size();
}

} // namespace zledger
