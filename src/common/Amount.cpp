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

#include "common/Amount.hpp"
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace zledger {

std::optional<Amount> Amount::parse(std::string_view text) {
    bool neg = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        neg = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    const auto dot = text.find('.');
    const auto whole = text.substr(0, dot);
    const auto fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);
    if (whole.empty() || fraction.size() > 2 || (dot != std::string_view::npos && fraction.empty())) {
        return std::nullopt;
    }
    // Leaves room for the two cent digits added below.
    constexpr auto limit = (std::numeric_limits<int64_t>::max() - 99) / 100;
    int64_t units = 0;
    for (const char c : whole) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        if (units > (limit - (c - '0')) / 10) {
            return std::nullopt;
        }
        units = units * 10 + (c - '0');
    }
    int64_t cents = 0;
    for (size_t i = 0; i < 2; ++i) {
        cents *= 10;
        if (i < fraction.size()) {
            if (!std::isdigit(static_cast<unsigned char>(fraction[i]))) {
                return std::nullopt;
            }
            cents += fraction[i] - '0';
        }
    }
    const auto total = units * 100 + cents;
    return Amount{neg ? -total : total};
}

std::optional<Amount> Amount::checkedAdd(const Amount& other) const {
    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();
    if ((other.value > 0 && value > max - other.value) || (other.value < 0 && value < min - other.value)) {
        return std::nullopt;
    }
    return Amount{value + other.value};
}

std::string Amount::toString() const {
    // Negating INT64_MIN would overflow, so work on the unsigned magnitude.
    const auto magnitude = value < 0 ? static_cast<uint64_t>(-(value + 1)) + 1 : static_cast<uint64_t>(value);
    auto fraction = std::to_string(magnitude % 100);
    if (fraction.size() < 2) {
        fraction.insert(0, "0");
    }
    return (value < 0 ? "-" : "") + std::to_string(magnitude / 100) + "." + fraction;
}

std::ostream& operator<<(std::ostream& os, const Amount& amount) {
    os << amount.toString();
    return os;
}

} // namespace zledger
