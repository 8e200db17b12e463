//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request telemetry recording and sink forwarding.
///
//===----------------------------------------------------------------------===//

#include "llvmbicep/LSP/Telemetry.h"

namespace llvmbicep::lsp
{

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(std::string method, const std::uint64_t latencyMicros, std::string outcome)
{
    RequestMetricSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++requestCounts_[method];
        ++outcomeCounts_[{method, outcome}];
        sink = sink_;
    }
    if (sink)
    {
        sink(RequestMetric{std::move(method), latencyMicros, std::move(outcome)});
    }
}

std::uint64_t Telemetry::requestCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = requestCounts_.find(method);
    return it == requestCounts_.end() ? 0U : it->second;
}

std::uint64_t Telemetry::outcomeCount(const std::string_view method, const std::string_view outcome) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = outcomeCounts_.find({std::string(method), std::string(outcome)});
    return it == outcomeCounts_.end() ? 0U : it->second;
}

}  // namespace llvmbicep::lsp
