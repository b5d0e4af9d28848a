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

#ifndef ZLEDGER_COMMON_LOCKED_UNORDERED_MAP_HPP
#define ZLEDGER_COMMON_LOCKED_UNORDERED_MAP_HPP

#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <utility>
#include <cstddef>

namespace zledger {

// A map guarded by a shared mutex. Node-based storage keeps references to an
// element valid across rehashes until that element is erased.
template <typename Key, typename Value>
class LockedUnorderedMap {
public:
    // Constructs the element for key if needed and calls f(value) under the
    // write lock.
    template<typename F>
    Value& upsert(const Key& key, F&& f) {
        std::unique_lock lock{mutex};
        auto& value = map.try_emplace(key).first->second;
        f(value);
        return value;
    }

    // Erases the element for key when pred(value) returns true, under the
    // write lock.
    template<typename P>
    bool eraseIf(const Key& key, P&& pred) {
        std::unique_lock lock{mutex};
        auto i = map.find(key);
        if (i == map.end() || !pred(i->second)) {
            return false;
        }
        map.erase(i);
        return true;
    }

    // Calls f(value) under the read lock when key is present.
    template<typename F>
    bool visit(const Key& key, F&& f) {
        std::shared_lock lock{mutex};
        auto i = map.find(key);
        if (i == map.end()) {
            return false;
        }
        f(i->second);
        return true;
    }

    template<typename F>
    bool visit(const Key& key, F&& f) const {
        std::shared_lock lock{mutex};
        auto i = map.find(key);
        if (i == map.end()) {
            return false;
        }
        f(i->second);
        return true;
    }

    // Calls f(key, value) for every element under the read lock.
    template<typename F>
    void forEach(F&& f) const {
        std::shared_lock lock{mutex};
        for (const auto& [k, v] : map) {
            f(k, v);
        }
    }

    size_t size() const {
        std::shared_lock lock{mutex};
        return map.size();
    }

private:
    std::unordered_map<Key, Value> map;
    mutable std::shared_mutex mutex;
};

} // namespace zledger

#endif // ZLEDGER_COMMON_LOCKED_UNORDERED_MAP_HPP
