#pragma once

/// @file bounded_call.hpp
/// @brief Call-site deadline for collaborator calls.

#include "cas/foundation/service_result.hpp"
#include "cas/foundation/task_executor.hpp"

#include <chrono>
#include <functional>

namespace cas::service::detail {

/// Run @p fn under @p timeout on @p executor, or inline when there is no
/// executor. The callable must own what it touches (capture shared_ptrs),
/// since a timed-out call keeps running after this returns. An exception
/// thrown by @p fn comes back as an error, never as a throw.
template <typename T>
cas::foundation::ServiceResult<T> boundedCall(
    cas::foundation::TaskExecutor* executor, std::chrono::milliseconds timeout,
    cas::foundation::ErrorCode timeoutCode,
    std::function<cas::foundation::ServiceResult<T>()> fn) {
    if (executor == nullptr) {
        return cas::foundation::invokeGuarded<T>(fn, timeoutCode);
    }
    return executor->runBounded<T>(std::move(fn), timeout, timeoutCode);
}

}  // namespace cas::service::detail
