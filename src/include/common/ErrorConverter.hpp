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

#ifndef ZLEDGER_COMMON_ERROR_CONVERTER_HPP
#define ZLEDGER_COMMON_ERROR_CONVERTER_HPP

#include "common/Error.hpp"
#include <grpcpp/support/status.h>

namespace zledger {

// Follows category(code).
grpc::StatusCode toGrpcStatusCode(const ErrorCode& code);

// Internal errors are scrubbed: the status carries only a generic message.
grpc::Status toGrpcStatus(const Error& error);

Error toError(const grpc::Status& status);

} // namespace zledger

#endif // ZLEDGER_COMMON_ERROR_CONVERTER_HPP
