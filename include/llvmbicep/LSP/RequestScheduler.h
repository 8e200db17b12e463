//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Cooperative request scheduler with cancellation support.
///
/// The scheduler runs long-lived requests on a worker thread, one at a time in
/// arrival order, and exposes per-request cancellation for `$/cancelRequest`.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_LSP_REQUEST_SCHEDULER_H
#define LLVMBICEP_LSP_REQUEST_SCHEDULER_H

#include "llvmbicep/Support/Cancellation.h"

#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace llvmbicep::lsp
{

/// @brief Status outcome of a scheduled request task.
enum class RequestTaskStatus
{
    /// @brief Task completed successfully.
    Completed,

    /// @brief Task was cancelled before it started or observed cancellation.
    Cancelled,

    /// @brief Task returned an error.
    Failed,
};

/// @brief Result envelope for scheduled request work.
struct RequestTaskResult final
{
    RequestTaskStatus status{RequestTaskStatus::Failed};

    /// @brief JSON result payload when completed.
    llvm::json::Value value{nullptr};

    /// @brief Full error text when failed.
    std::string errorMessage;
};

/// @brief Cooperative unit of scheduled request work.
///
/// Returning an @ref OperationCancelledError reports the request as cancelled.
using RequestTask = std::function<llvm::Expected<llvm::json::Value>(const CancellationToken& token)>;

/// @brief Completion callback invoked once on task finish, on the worker thread.
using RequestCompletion = std::function<void(RequestTaskResult result, std::uint64_t latencyMicros)>;

/// @brief Single-threaded worker scheduler for cancellable LSP requests.
class RequestScheduler final
{
public:
    RequestScheduler();
    ~RequestScheduler();

    RequestScheduler(const RequestScheduler&)            = delete;
    RequestScheduler& operator=(const RequestScheduler&) = delete;

    /// @brief Enqueues request work for execution.
    /// @param[in] requestKey Stable request key (serialized LSP id).
    /// @param[in] method Request method name for tracing.
    /// @param[in] task Request task body.
    /// @param[in] completion Completion callback invoked once.
    /// @return `true` when queued; `false` after shutdown or for a duplicate key.
    [[nodiscard]] bool enqueue(std::string       requestKey,
                               std::string       method,
                               RequestTask       task,
                               RequestCompletion completion);

    /// @brief Requests cancellation for the given request key.
    /// @return `true` when a matching in-flight or queued request exists.
    [[nodiscard]] bool cancel(const std::string& requestKey);

    /// @brief Cancels outstanding requests, drains the queue, and joins the worker.
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace llvmbicep::lsp

#endif  // LLVMBICEP_LSP_REQUEST_SCHEDULER_H
