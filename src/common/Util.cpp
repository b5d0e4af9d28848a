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

#include "common/Util.hpp"
#include <algorithm>
#include <random>
#include <chrono>
#include <cstdint>
#include <string>

std::string zledger_generate_random_digits(std::size_t len) {
    thread_local auto rng = random_generator<>();
    auto first = std::uniform_int_distribution<int>{1, 9};
    auto rest = std::uniform_int_distribution<int>{0, 9};
    auto result = std::string(len, '0');
    for (std::size_t i = 0; i < len; ++i) {
        result[i] = static_cast<char>('0' + (i == 0 ? first(rng) : rest(rng)));
    }
    return result;
}

std::array<uint8_t, 16> generate_uuid_v7() {
    thread_local auto rng = random_generator<>();
    auto dist = std::uniform_int_distribution<int>{0, 255};

    std::array<uint8_t, 16> uuid{};

    // Get current time in milliseconds since Unix epoch
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    auto timestamp = static_cast<uint64_t>(ms);

    // Fill the first 48 bits (6 bytes) with timestamp
    for (size_t i = 0; i < 6; ++i) {
        uuid[i] = static_cast<uint8_t>((timestamp >> (40 - 8 * i)) & 0xFF);
    }

    for (size_t i = 6; i < 16; ++i) {
        uuid[i] = static_cast<uint8_t>(dist(rng));
    }

    // Set version 7 (bits 12-15 of time_hi_and_version)
    uuid[6] = (uuid[6] & 0x0F) | 0x70;

    // Set variant bits (bits 6-7 of clock_seq_hi_and_reserved)
    uuid[8] = (uuid[8] & 0x3F) | 0x80;

    return uuid;
}

std::string uuid_v7_to_hex(const std::array<uint8_t, 16>& uuid) {
    static constexpr auto hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hex[uuid[i] >> 4]);
        out.push_back(hex[uuid[i] & 0x0F]);
    }
    return out;
}
