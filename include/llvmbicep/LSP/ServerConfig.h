//===----------------------------------------------------------------------===//
//
// Part of the llvm-bicep project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Runtime configuration model for the Bicep language server.
///
/// Configuration values are read from `initializationOptions` and updated from
/// `workspace/didChangeConfiguration` notifications.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMBICEP_LSP_SERVER_CONFIG_H
#define LLVMBICEP_LSP_SERVER_CONFIG_H

#include "llvmbicep/Semantics/Compilation.h"

#include "llvm/Support/JSON.h"

#include <string>

namespace llvmbicep::lsp
{

/// @brief Trace verbosity level for server logs.
enum class TraceLevel
{
    /// @brief Disable trace output.
    Off,

    /// @brief Emit request failures and configuration problems.
    Basic,

    /// @brief Additionally emit one line per handled request.
    Verbose,
};

/// @brief Mutable runtime configuration for `bicepd`.
struct ServerConfig final
{
    /// @brief Extra JSON type catalog merged over the built-in one; empty for none.
    std::string typeCatalogPath;

    /// @brief Starts the catalog from the types compiled into the binary.
    bool includeBuiltinTypes{true};

    /// @brief Directory read by the offline resource fetcher; empty disables fetching.
    std::string resourceSnapshotDir;

    /// @brief Settings copied into every compilation snapshot.
    Configuration compilation;

    /// @brief Configured trace verbosity.
    TraceLevel traceLevel{TraceLevel::Basic};
};

/// @brief Applies a settings object; unknown or mistyped keys are ignored.
void applySettings(const llvm::json::Object& settings, ServerConfig& config);

/// @brief Applies settings from `workspace/didChangeConfiguration` params.
/// @param[in] params Notification params object.
/// @param[in,out] config Configuration instance to update.
/// @return `true` when params had a parseable `settings` object.
[[nodiscard]] bool applyDidChangeConfiguration(const llvm::json::Value& params, ServerConfig& config);

/// @brief Returns `off`, `basic` or `verbose`.
const char* traceLevelName(TraceLevel level);

}  // namespace llvmbicep::lsp

#endif  // LLVMBICEP_LSP_SERVER_CONFIG_H
