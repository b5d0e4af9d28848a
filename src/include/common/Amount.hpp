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

#ifndef ZLEDGER_COMMON_AMOUNT_HPP
#define ZLEDGER_COMMON_AMOUNT_HPP

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace zledger {

// Fixed-point money with two decimal places, stored as a count of cents.
class Amount {
public:
    constexpr Amount() = default;

    static constexpr Amount fromCents(const int64_t cents) {
        return Amount{cents};
    }

    static constexpr Amount zero() {
        return Amount{};
    }

    // Accepts "12", "12.3" and "12.34" with an optional leading '-'.
    // More than two decimals, empty input and stray characters are rejected.
    static std::optional<Amount> parse(std::string_view text);

    [[nodiscard]] constexpr int64_t cents() const {
        return value;
    }

    [[nodiscard]] constexpr bool positive() const {
        return value > 0;
    }

    [[nodiscard]] constexpr bool negative() const {
        return value < 0;
    }

    [[nodiscard]] std::optional<Amount> checkedAdd(const Amount& other) const;

    [[nodiscard]] std::string toString() const;

    constexpr Amount operator+(const Amount& other) const {
        return Amount{value + other.value};
    }

    constexpr Amount operator-(const Amount& other) const {
        return Amount{value - other.value};
    }

    constexpr Amount& operator+=(const Amount& other) {
        value += other.value;
        return *this;
    }

    constexpr Amount& operator-=(const Amount& other) {
        value -= other.value;
        return *this;
    }

    constexpr auto operator<=>(const Amount&) const = default;

private:
    explicit constexpr Amount(const int64_t c) : value{c} {}
    int64_t value{0};
};

std::ostream& operator<<(std::ostream& os, const Amount& amount);

} // namespace zledger

#endif // ZLEDGER_COMMON_AMOUNT_HPP
