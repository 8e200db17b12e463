//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Cooperative cancellation primitives shared by the pipeline and the request scheduler.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_SUPPORT_CANCELLATION_H
#define LLVMBICEP_SUPPORT_CANCELLATION_H

#include <atomic>
#include <memory>
#include <utility>

namespace llvmbicep
{

/// @brief Read side of a cancellation flag.
///
/// A default-constructed token is never cancelled.
class CancellationToken final
{
public:
    CancellationToken() = default;

    /// @brief Returns whether cancellation has been requested.
    [[nodiscard]] bool isCancellationRequested() const
    {
        return state_ && state_->load(std::memory_order_relaxed);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic_bool> state)
        : state_(std::move(state))
    {
    }

    std::shared_ptr<const std::atomic_bool> state_;
};

/// @brief Write side of a cancellation flag.
class CancellationSource final
{
public:
    CancellationSource()
        : state_(std::make_shared<std::atomic_bool>(false))
    {
    }

    /// @brief Returns a token observing this source.
    [[nodiscard]] CancellationToken token() const
    {
        return CancellationToken(state_);
    }

    /// @brief Requests cancellation; idempotent.
    void cancel()
    {
        state_->store(true, std::memory_order_relaxed);
    }

    [[nodiscard]] bool isCancellationRequested() const
    {
        return state_->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<std::atomic_bool> state_;
};

}  // namespace llvmbicep

#endif  // LLVMBICEP_SUPPORT_CANCELLATION_H
