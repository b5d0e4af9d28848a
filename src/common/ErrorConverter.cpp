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

#include "common/ErrorConverter.hpp"
#include "common/Error.hpp"
#include "common/Amount.hpp"
#include "proto/error.pb.h"
#include <google/protobuf/any.pb.h>
#include <grpcpp/support/status.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace zledger {

namespace {
const std::string internalMessage {"internal error"};
} // namespace

grpc::StatusCode toGrpcStatusCode(const ErrorCode& code) {
    switch (category(code)) {
        case ErrorCategory::None:
            return grpc::StatusCode::OK;
        case ErrorCategory::Invalid:
            return grpc::StatusCode::INVALID_ARGUMENT;
        case ErrorCategory::Rejected:
            return grpc::StatusCode::FAILED_PRECONDITION;
        case ErrorCategory::NotFound:
            return grpc::StatusCode::NOT_FOUND;
        case ErrorCategory::Conflict:
            return grpc::StatusCode::ALREADY_EXISTS;
        case ErrorCategory::Contention:
            return grpc::StatusCode::ABORTED;
        case ErrorCategory::Unavailable:
            return grpc::StatusCode::UNAVAILABLE;
        case ErrorCategory::Internal:
            return grpc::StatusCode::INTERNAL;
    }
    std::unreachable();
}

grpc::Status toGrpcStatus(const Error& error) {
    const bool scrub = error.code == ErrorCode::Internal || error.code == ErrorCode::Unknown;
    proto::ErrorDetails details;
    details.set_code(static_cast<proto::ErrorCode>(error.code));
    details.set_what(scrub ? internalMessage : error.what);
    details.set_account(error.account);
    details.set_available_cents(error.available.cents());
    details.set_required_cents(error.required.cents());
    google::protobuf::Any anyDetail;
    anyDetail.PackFrom(details);
    return grpc::Status(toGrpcStatusCode(error.code), scrub ? internalMessage : error.what, anyDetail.SerializeAsString());
}

Error toError(const grpc::Status& status) {
    if (status.error_code() == grpc::StatusCode::OK) {
        throw std::logic_error("Cannot convert OK status to error");
    }
    proto::ErrorDetails details;
    google::protobuf::Any any;
    if (any.ParseFromString(status.error_details())) {
        if (any.UnpackTo(&details)) {
            return Error(
                static_cast<ErrorCode>(details.code()),
                details.what(),
                details.account(),
                Amount::fromCents(details.available_cents()),
                Amount::fromCents(details.required_cents()));
        }
    }
    ErrorCode code = ErrorCode::Unknown;
    switch (status.error_code()) {
        case grpc::StatusCode::NOT_FOUND:
            code = ErrorCode::AccountNotFound;
            break;
        case grpc::StatusCode::INVALID_ARGUMENT:
            code = ErrorCode::InvalidArg;
            break;
        case grpc::StatusCode::ABORTED:
            code = ErrorCode::LockTimeout;
            break;
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            code = ErrorCode::TransientStoreFailure;
            break;
        case grpc::StatusCode::ALREADY_EXISTS:
            code = ErrorCode::IntegrityViolation;
            break;
        case grpc::StatusCode::INTERNAL:
            code = ErrorCode::Internal;
            break;
        default:
            code = ErrorCode::Unknown;
    }
    return Error(code, status.error_message());
}

} // namespace zledger
