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

#include "common/Repeater.hpp"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>
#include <string>

namespace zledger {

Repeater::Repeater(const RetryPolicy p)
    : backoff {p} {}

int Repeater::attempts() const {
    return made;
}

void Repeater::retrying(const std::string& op, const Error& error, std::chrono::microseconds delay) {
    spdlog::warn("Repeater: {} failed (attempt {}): {} - {}. Retrying in {}us",
        op, made, toString(error.code), error.what, delay.count());
    std::this_thread::sleep_for(delay);
}

void Repeater::exhausted(const std::string& op, const Error& error) const {
    spdlog::error("Repeater: {} failed after {} attempts: {} - {}", op, made, toString(error.code), error.what);
}

} // namespace zledger
