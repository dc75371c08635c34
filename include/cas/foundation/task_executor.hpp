#pragma once

/// @file task_executor.hpp
/// @brief TaskExecutor wrapping kcenon thread_system for async service calls.

#include "cas/foundation/service_result.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace cas::foundation {

/// Priority levels for queued tasks.
///
/// Maps to kcenon::thread::job_priority internally:
///   High -> high, Normal -> normal, Low -> low
enum class TaskPriority { High, Normal, Low };

/// Invoke @p fn and turn an escaping exception into a @p failureCode error.
template <typename T>
ServiceResult<T> invokeGuarded(const std::function<ServiceResult<T>()>& fn,
                               ErrorCode failureCode) {
    try {
        return fn();
    } catch (const std::exception& e) {
        return ServiceResult<T>::err(
            ServiceError(failureCode, std::string("task failed: ") + e.what()));
    } catch (...) {
        return ServiceResult<T>::err(
            ServiceError(failureCode, "task failed: unknown exception"));
    }
}

/// Worker pool used to run service operations off the caller's thread and to
/// put a deadline on calls into external collaborators.
///
/// Uses PIMPL to hide thread_system details from the public API.
///
/// Example:
/// @code
///   TaskExecutor executor(4);
///   auto cached = executor.runBounded<std::optional<bool>>(
///       [&] { return cache->getPermissionCheck(id, key); },
///       std::chrono::milliseconds(50), ErrorCode::CacheTimeout);
/// @endcode
class TaskExecutor {
public:
    using Task = std::function<void()>;

    /// Construct an executor backed by @p numThreads workers.
    explicit TaskExecutor(std::size_t numThreads = std::thread::hardware_concurrency(),
                          std::string name = "cas_executor");

    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;
    TaskExecutor(TaskExecutor&&) noexcept;
    TaskExecutor& operator=(TaskExecutor&&) noexcept;

    /// Queue a fire-and-forget task.
    /// @return JobScheduleFailed if the pool rejected the task.
    ServiceResult<void> post(Task task, TaskPriority priority = TaskPriority::Normal);

    /// Queue @p fn and return a future for its result.
    ///
    /// A rejected enqueue or a std::exception thrown by @p fn resolves the
    /// future to an error result instead of an exception.
    template <typename T>
    std::future<ServiceResult<T>> submit(std::function<ServiceResult<T>()> fn,
                                         TaskPriority priority = TaskPriority::Normal);

    /// Run @p fn on the pool and wait at most @p timeout for it.
    ///
    /// On expiry returns @p timeoutCode; the task keeps running and its
    /// result is discarded. A non-positive timeout runs @p fn inline.
    template <typename T>
    ServiceResult<T> runBounded(std::function<ServiceResult<T>()> fn,
                                std::chrono::milliseconds timeout,
                                ErrorCode timeoutCode = ErrorCode::JobTimeout);

    /// Number of worker threads.
    [[nodiscard]] std::size_t workerCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// --- Template implementations ---

template <typename T>
std::future<ServiceResult<T>> TaskExecutor::submit(std::function<ServiceResult<T>()> fn,
                                                   TaskPriority priority) {
    auto promise = std::make_shared<std::promise<ServiceResult<T>>>();
    auto future = promise->get_future();

    auto posted = post(
        [fn = std::move(fn), promise]() {
            promise->set_value(invokeGuarded<T>(fn, ErrorCode::ThreadError));
        },
        priority);

    if (posted.hasError()) {
        promise->set_value(ServiceResult<T>::err(posted.error()));
    }
    return future;
}

template <typename T>
ServiceResult<T> TaskExecutor::runBounded(std::function<ServiceResult<T>()> fn,
                                          std::chrono::milliseconds timeout,
                                          ErrorCode timeoutCode) {
    if (timeout.count() <= 0) {
        return invokeGuarded<T>(fn, timeoutCode);
    }

    auto future = submit<T>(std::move(fn), TaskPriority::High);
    if (future.wait_for(timeout) != std::future_status::ready) {
        return ServiceResult<T>::err(
            ServiceError(timeoutCode,
                         "operation timed out after " +
                             std::to_string(timeout.count()) + "ms"));
    }
    return future.get();
}

} // namespace cas::foundation
