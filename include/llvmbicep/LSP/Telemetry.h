//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request telemetry aggregation and sink integration.
///
/// This module records request latency and outcome samples and forwards them
/// to an optional sink.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_LSP_TELEMETRY_H
#define LLVMBICEP_LSP_TELEMETRY_H

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace llvmbicep::lsp
{

/// @brief Immutable telemetry sample for a completed request.
struct RequestMetric final
{
    /// @brief LSP method name.
    std::string method;

    /// @brief Request latency in microseconds.
    std::uint64_t latencyMicros{0};

    /// @brief Outcome label, e.g. `ok`, `cancelled`, `failed`, `no_matching_type`.
    std::string outcome;
};

/// @brief Sink callback invoked for each telemetry sample.
using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Thread-safe request telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback; an empty sink disables forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Records one request metric sample.
    void record(std::string method, std::uint64_t latencyMicros, std::string outcome);

    /// @brief Returns total recorded request count for the method.
    [[nodiscard]] std::uint64_t requestCount(std::string_view method) const;

    /// @brief Returns recorded request count for one method and outcome.
    [[nodiscard]] std::uint64_t outcomeCount(std::string_view method, std::string_view outcome) const;

private:
    mutable std::mutex                                           mutex_;
    RequestMetricSink                                            sink_;
    std::map<std::string, std::uint64_t, std::less<>>            requestCounts_;
    std::map<std::pair<std::string, std::string>, std::uint64_t> outcomeCounts_;
};

}  // namespace llvmbicep::lsp

#endif  // LLVMBICEP_LSP_TELEMETRY_H
