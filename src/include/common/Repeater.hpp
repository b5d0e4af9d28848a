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

#ifndef ZLEDGER_COMMON_REPEATER_HPP
#define ZLEDGER_COMMON_REPEATER_HPP

#include "common/RetryPolicy.hpp"
#include "common/ExponentialBackoff.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <expected>
#include <string>
#include <type_traits>
#include <utility>

namespace zledger {

// Runs an operation returning std::expected<T, Error>, retrying failures that
// isRetriable() classifies as transient for the given op. Anything else is
// returned on the spot. Not thread-safe; build one per call.
class Repeater {
public:
    explicit Repeater(const RetryPolicy p);

    template<typename F, typename R = std::invoke_result_t<F&>>
    R attempt(const std::string& op, F&& f) {
        backoff.reset();
        made = 0;
        while (true) {
            ++made;
            R result = f();
            if (result.has_value()) {
                return result;
            }
            const auto& error = result.error();
            if (!isRetriable(op, error.code)) {
                return result;
            }
            auto delay = backoff.nextDelay();
            if (!delay.has_value()) {
                exhausted(op, error);
                return result;
            }
            retrying(op, error, delay.value());
        }
    }

    [[nodiscard]] int attempts() const;
private:
    void retrying(const std::string& op, const Error& error, std::chrono::microseconds delay);
    void exhausted(const std::string& op, const Error& error) const;
    ExponentialBackoff backoff;
    int made{0};
};

template<typename F>
auto withRetry(const RetryPolicy& policy, const std::string& op, F&& f) {
    Repeater repeater {policy};
    return repeater.attempt(op, std::forward<F>(f));
}

} // namespace zledger

#endif // ZLEDGER_COMMON_REPEATER_HPP
