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

#ifndef ZLEDGER_LOCK_LOCK_MANAGER_HPP
#define ZLEDGER_LOCK_LOCK_MANAGER_HPP

#include "common/Error.hpp"
#include "common/LockedUnorderedMap.hpp"
#include "common/Types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

namespace zledger {

// Per-account exclusive locks. An entry is created lazily when a thread asks
// for an account and erased once no thread holds or waits on it. Locks are owned by the acquiring thread and are not
// re-entrant. Construct one at service start and pass it to whoever needs it.
class LockManager {
public:
    LockManager() = default;
    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    // Blocks until the account is free or the timeout elapses (LockTimeout).
    // A thread asking for a lock it already holds fails with Internal.
    std::expected<std::monostate, Error> acquire(const AccountNumber& account, std::chrono::milliseconds timeout);
    std::expected<std::monostate, Error> release(const AccountNumber& account);

    // Advisory only; the answer may be stale by the time it is read.
    [[nodiscard]] bool isLocked(const AccountNumber& account) const;
    [[nodiscard]] std::vector<AccountNumber> heldLocks() const;
    // Number of accounts currently held or waited on.
    [[nodiscard]] size_t size() const;
private:
    struct Entry {
        mutable std::mutex m;
        std::condition_variable cv;
        bool held {false};
        std::thread::id owner;
        // Holder plus waiters; guarded by the map's write lock.
        size_t users {0};
    };

    Entry& checkout(const AccountNumber& account);
    void checkin(const AccountNumber& account);

    LockedUnorderedMap<AccountNumber, Entry> entries;
};

} // namespace zledger

#endif // ZLEDGER_LOCK_LOCK_MANAGER_HPP
