/// @file task_executor.cpp
/// @brief TaskExecutor implementation wrapping kcenon thread_system.

#include "cas/foundation/task_executor.hpp"

#include "cas/foundation/service_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <vector>

namespace cas::foundation {

// ---------------------------------------------------------------------------
// Priority mapping: CAS -> kcenon
// ---------------------------------------------------------------------------
static kcenon::thread::job_priority mapPriority(TaskPriority p) {
    switch (p) {
        case TaskPriority::High:   return kcenon::thread::job_priority::high;
        case TaskPriority::Normal: return kcenon::thread::job_priority::normal;
        case TaskPriority::Low:    return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct TaskExecutor::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string name;
    std::size_t workers{0};
    std::atomic<uint64_t> nextTaskId{1};
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
TaskExecutor::TaskExecutor(std::size_t numThreads, std::string name)
    : impl_(std::make_unique<Impl>())
{
    impl_->name = std::move(name);
    impl_->workers = std::max<std::size_t>(numThreads, 1);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(impl_->name);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

TaskExecutor::~TaskExecutor() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

TaskExecutor::TaskExecutor(TaskExecutor&&) noexcept = default;
TaskExecutor& TaskExecutor::operator=(TaskExecutor&&) noexcept = default;

// ---------------------------------------------------------------------------
// post()
// ---------------------------------------------------------------------------
ServiceResult<void> TaskExecutor::post(Task task, TaskPriority priority) {
    auto id = impl_->nextTaskId.fetch_add(1, std::memory_order_relaxed);

    auto threadJob = kcenon::thread::job_builder()
        .name(impl_->name + "_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(task), taskName = impl_->name]() -> kcenon::common::VoidResult {
            // Nothing may escape into the worker thread.
            try {
                fn();
            } catch (const std::exception& e) {
                CAS_LOG_ERROR(LogCategory::Core,
                              "Task on " + taskName + " threw: " + e.what());
            } catch (...) {
                CAS_LOG_ERROR(LogCategory::Core,
                              "Task on " + taskName + " threw an unknown exception");
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::JobScheduleFailed, "failed to enqueue task"));
    }
    return ServiceResult<void>::ok();
}

std::size_t TaskExecutor::workerCount() const noexcept {
    return impl_ ? impl_->workers : 0;
}

} // namespace cas::foundation
