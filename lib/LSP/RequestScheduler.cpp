//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements cooperative request scheduling and cancellation.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/LSP/RequestScheduler.h"

#include "llvmbicep/Support/Errors.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

namespace llvmbicep::lsp
{
namespace
{

RequestTaskResult runTask(const RequestTask& task, const CancellationSource& cancellation)
{
    if (cancellation.isCancellationRequested())
    {
        return RequestTaskResult{RequestTaskStatus::Cancelled, nullptr, {}};
    }

    llvm::Expected<llvm::json::Value> value = task(cancellation.token());
    if (value)
    {
        return RequestTaskResult{RequestTaskStatus::Completed, std::move(*value), {}};
    }

    RequestTaskResult result{RequestTaskStatus::Failed, nullptr, {}};
    llvm::handleAllErrors(
        value.takeError(),
        [&result](const OperationCancelledError&) { result.status = RequestTaskStatus::Cancelled; },
        [&result](const llvm::ErrorInfoBase& info) { result.errorMessage = info.message(); });
    return result;
}

}  // namespace

class RequestScheduler::Impl final
{
public:
    Impl()
        : worker_([this]() { run(); })
    {
    }

    ~Impl()
    {
        shutdown();
    }

    bool enqueue(std::string requestKey, std::string method, RequestTask task, RequestCompletion completion)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
        {
            return false;
        }
        if (requestStates_.contains(requestKey))
        {
            return false;
        }

        CancellationSource cancellation;
        requestStates_.emplace(requestKey, cancellation);
        queue_.push_back(WorkItem{std::move(requestKey),
                                  std::move(method),
                                  std::move(task),
                                  std::move(completion),
                                  std::move(cancellation)});
        cv_.notify_one();
        return true;
    }

    bool cancel(const std::string& requestKey)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = requestStates_.find(requestKey);
        if (it == requestStates_.end())
        {
            return false;
        }
        it->second.cancel();
        return true;
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
            for (auto& [_, state] : requestStates_)
            {
                state.cancel();
            }
        }
        cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

private:
    struct WorkItem final
    {
        std::string        requestKey;
        std::string        method;
        RequestTask        task;
        RequestCompletion  completion;
        CancellationSource cancellation;
    };

    void run()
    {
        while (true)
        {
            std::optional<WorkItem> item;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (queue_.empty())
                {
                    return;
                }
                item.emplace(std::move(queue_.front()));
                queue_.pop_front();
            }

            const auto        start  = std::chrono::steady_clock::now();
            RequestTaskResult result = runTask(item->task, item->cancellation);
            const auto        finish = std::chrono::steady_clock::now();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                requestStates_.erase(item->requestKey);
            }

            if (item->completion)
            {
                const auto latencyMicros =
                    std::chrono::duration_cast<std::chrono::microseconds>(finish - start).count();
                item->completion(std::move(result), static_cast<std::uint64_t>(latencyMicros));
            }
        }
    }

    std::mutex                                          mutex_;
    std::condition_variable                             cv_;
    std::deque<WorkItem>                                queue_;
    std::unordered_map<std::string, CancellationSource> requestStates_;
    bool                                                stopping_{false};
    std::thread                                         worker_;
};

RequestScheduler::RequestScheduler()
    : impl_(std::make_unique<Impl>())
{
}

RequestScheduler::~RequestScheduler() = default;

bool RequestScheduler::enqueue(std::string       requestKey,
                               std::string       method,
                               RequestTask       task,
                               RequestCompletion completion)
{
    return impl_->enqueue(std::move(requestKey), std::move(method), std::move(task), std::move(completion));
}

bool RequestScheduler::cancel(const std::string& requestKey)
{
    return impl_->cancel(requestKey);
}

void RequestScheduler::shutdown()
{
    impl_->shutdown();
}

}  // namespace llvmbicep::lsp
