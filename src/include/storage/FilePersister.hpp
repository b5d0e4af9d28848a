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

#ifndef ZLEDGER_STORAGE_FILE_PERSISTER_HPP
#define ZLEDGER_STORAGE_FILE_PERSISTER_HPP

#include "storage/Persister.hpp"
#include "common/Error.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace zledger {

// Keeps the whole ledger as one protobuf snapshot. save() writes a sibling
// temporary file and renames it over the target so a crash leaves either the
// old or the new snapshot.
class FilePersister : public Persister {
public:
    explicit FilePersister(const std::string& filename);
    std::expected<std::optional<LedgerState>, Error> load() override;
    std::expected<std::monostate, Error> save(const LedgerState& state) override;
    ~FilePersister() override;
private:
    std::filesystem::path path;
};

} // namespace zledger

#endif // ZLEDGER_STORAGE_FILE_PERSISTER_HPP
