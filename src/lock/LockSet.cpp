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

#include "lock/LockSet.hpp"
#include "lock/LockManager.hpp"
#include "common/Error.hpp"
#include "common/Types.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <expected>
#include <ranges>
#include <utility>
#include <vector>

namespace zledger {

namespace {

void releaseAll(LockManager& manager, const std::vector<AccountNumber>& held) {
    for (const auto& account : std::views::reverse(held)) {
        auto r = manager.release(account);
        if (!r.has_value()) {
            spdlog::warn("LockSet: failed to release {}: {}", account, r.error().what);
        }
    }
}

} // namespace

std::vector<AccountNumber> lockOrder(std::vector<AccountNumber> accounts) {
    std::ranges::sort(accounts);
    auto [first, last] = std::ranges::unique(accounts);
    accounts.erase(first, last);
    return accounts;
}

std::expected<LockSet, Error> LockSet::acquire(
    LockManager& manager,
    std::vector<AccountNumber> accounts,
    std::chrono::milliseconds timeout) {
    auto order = lockOrder(std::move(accounts));
    std::vector<AccountNumber> held;
    held.reserve(order.size());
    for (auto& account : order) {
        auto r = manager.acquire(account, timeout);
        if (!r.has_value()) {
            releaseAll(manager, held);
            return std::unexpected {r.error()};
        }
        held.push_back(std::move(account));
    }
    return LockSet {manager, std::move(held)};
}

LockSet::LockSet(LockManager& m, std::vector<AccountNumber> h)
    : manager {&m}, held {std::move(h)} {}

LockSet::LockSet(LockSet&& other) noexcept
    : manager {other.manager}, held {std::move(other.held)} {
    other.held.clear();
}

LockSet::~LockSet() {
    if (manager != nullptr) {
        releaseAll(*manager, held);
    }
}

const std::vector<AccountNumber>& LockSet::accounts() const {
    return held;
}

} // namespace zledger
