#pragma once

/// @file service_result.hpp
/// @brief ServiceResult<T> type alias for auth service error handling.

#include "cas/core/result.hpp"
#include "cas/foundation/service_error.hpp"

namespace cas::foundation {

/// Result type specialized with ServiceError.
///
/// Every store, cache and service method that can fail returns
/// ServiceResult<T> instead of throwing.
///
/// Example:
/// @code
///   ServiceResult<Session> load(const SessionId& id) {
///       auto found = store.findById(id);
///       if (found.hasError()) {
///           return ServiceResult<Session>::err(found.error());
///       }
///       if (!found.value()) {
///           return ServiceResult<Session>::err(
///               ServiceError(ErrorCode::SessionNotFound, "session not found"));
///       }
///       return ServiceResult<Session>::ok(*found.value());
///   }
/// @endcode
template <typename T>
using ServiceResult = cas::Result<T, ServiceError>;

}  // namespace cas::foundation
